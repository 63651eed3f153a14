#include "LircDeviceCommand.h"

#include "LircClient.h"

#include <glog/logging.h>

LircDeviceCommand::LircDeviceCommand(int id, const std::string &title,
	const std::vector<uint8_t> &icon, const std::string &_key,
	const std::string &_deviceId, const std::string &_socketPath) :
	DeviceCommand(id, title, icon), key(_key), deviceId(_deviceId),
	socketPath(_socketPath) {

}

/**
 * Sends the key once. If the daemon can't be reached, the device is assumed to
 * be offline and nothing is sent; no error is reported in that case.
 *
 * @throws DeviceCommandException if the daemon failed to send the key
 */
void LircDeviceCommand::execute(void) {
	try {
		LircClient client(this->socketPath);
		client.sendOnce(this->deviceId, this->key);
	} catch(LircConnectionException &e) {
		LOG(WARNING) << "Not sending " << this->key << " to " << this->deviceId
			<< ": " << e.what();
	} catch(LircCommandException &e) {
		throw DeviceCommandException(e.what());
	}
}
