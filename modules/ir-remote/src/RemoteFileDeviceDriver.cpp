#include "RemoteFileDeviceDriver.h"

#include "RemoteDefinition.h"
#include "RemoteFileDeviceCommand.h"

#include "icons/IconResolver.h"

#include <glog/logging.h>

/**
 * Loads the remote definition.
 *
 * @throws DriverConstructionException if the definition can't be loaded
 */
RemoteFileDeviceDriver::RemoteFileDeviceDriver(const DeviceInfo &info,
	const std::string &definitionPath, const std::string &_transmitterPath,
	std::shared_ptr<IconResolver> _icons) : DeviceDriver(info), transmitterPath(_transmitterPath),
	icons(_icons) {
	CHECK(this->icons != nullptr) << "icon resolver may not be null";

	this->definition = RemoteDefinition::load(definitionPath);
}

RemoteFileDeviceDriver::~RemoteFileDeviceDriver() {
	delete this->definition;
}



/**
 * Creates a command for each key in the definition, sorted by key name.
 */
int RemoteFileDeviceDriver::getCommands(std::vector<std::unique_ptr<DeviceCommand>> &out) {
	std::vector<std::string> keys;
	this->definition->getKeyNames(keys);

	for(size_t i = 0; i < keys.size(); i++) {
		const std::string &key = keys[i];

		out.push_back(std::unique_ptr<DeviceCommand>(new RemoteFileDeviceCommand(
			static_cast<int>(i), key, this->icons->resolve(key), key, this->getDeviceId(),
			this->definition->getCode(key), this->transmitterPath,
			this->definition->getCarrier(), this->definition->getDutyCycle())));
	}

	return static_cast<int>(keys.size());
}

/**
 * Size of the remote as given in the definition; (0, 0) if it has none.
 */
std::tuple<unsigned int, unsigned int> RemoteFileDeviceDriver::remoteLayoutSize(void) {
	return std::make_tuple(this->definition->getLayoutWidth(),
		this->definition->getLayoutHeight());
}

/**
 * The layout matrix of the definition isn't decoded yet, so this is always
 * empty.
 *
 * TODO: decode "remote.layout" once its format (key names or command ids,
 * row or column major) has been settled.
 */
std::vector<std::vector<int>> RemoteFileDeviceDriver::remoteLayout(void) {
	return std::vector<std::vector<int>>();
}

/**
 * Executes the command.
 */
void RemoteFileDeviceDriver::execute(DeviceCommand *command) {
	CHECK(command != nullptr) << "command may not be null";

	command->execute();
}
