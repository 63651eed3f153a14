#include "LircDeviceDriver.h"

#include "LircClient.h"
#include "LircDeviceCommand.h"

#include "icons/IconResolver.h"

#include <glog/logging.h>

#include <algorithm>

/**
 * Connects to the daemon. If that fails, the driver is created anyway but
 * isn't ready.
 */
LircDeviceDriver::LircDeviceDriver(const DeviceInfo &info, const std::string &_socketPath,
	std::shared_ptr<IconResolver> _icons) : DeviceDriver(info), socketPath(_socketPath), icons(_icons) {
	CHECK(this->icons != nullptr) << "icon resolver may not be null";

	try {
		this->client = new LircClient(this->socketPath);
	} catch(LircConnectionException &e) {
		LOG(WARNING) << "Device " << this->getDeviceId() << " not ready: " << e.what();
		this->client = nullptr;
	}
}

/**
 * Closes the daemon connection.
 */
LircDeviceDriver::~LircDeviceDriver() {
	delete this->client;
}



/**
 * Creates a command for each key of the remote, sorted by key name; command
 * ids are the index in that order.
 */
int LircDeviceDriver::getCommands(std::vector<std::unique_ptr<DeviceCommand>> &out) {
	if(this->client == nullptr) {
		return 0;
	}

	// get the keys
	std::vector<std::string> keys;

	try {
		this->client->listRemoteKeys(this->getDeviceId(), keys);
	} catch(LircCommandException &e) {
		throw DriverException(e.what());
	}

	std::sort(keys.begin(), keys.end());

	// create commands
	for(size_t i = 0; i < keys.size(); i++) {
		const std::string &key = keys[i];

		out.push_back(std::unique_ptr<DeviceCommand>(new LircDeviceCommand(
			static_cast<int>(i), key, this->icons->resolve(key), key,
			this->getDeviceId(), this->socketPath)));
	}

	return static_cast<int>(keys.size());
}

/**
 * Executes the command.
 */
void LircDeviceDriver::execute(DeviceCommand *command) {
	CHECK(command != nullptr) << "command may not be null";

	command->execute();
}
