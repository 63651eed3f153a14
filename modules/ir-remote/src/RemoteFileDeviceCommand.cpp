#include "RemoteFileDeviceCommand.h"

#include "RemoteDefinition.h"
#include "LircDevTransmitter.h"

#include <glog/logging.h>

RemoteFileDeviceCommand::RemoteFileDeviceCommand(int id, const std::string &title,
	const std::vector<uint8_t> &icon, const std::string &_key, const std::string &_deviceId,
	const Json::Value &_code, const std::string &_transmitterPath, unsigned int _carrier,
	unsigned int _dutyCycle) : DeviceCommand(id, title, icon), key(_key),
	deviceId(_deviceId), code(_code), transmitterPath(_transmitterPath),
	carrier(_carrier), dutyCycle(_dutyCycle) {

}

/**
 * Sends the key once. If the LIRC device can't be opened nothing is sent, and
 * no error is reported.
 *
 * @throws DeviceCommandException if the code is invalid or couldn't be written
 */
void RemoteFileDeviceCommand::execute(void) {
	// decode first, so a broken code is reported even without a transmitter
	std::vector<unsigned int> timings;

	try {
		RemoteDefinition::decodeTimings(this->code, timings);
	} catch(DeviceCommandException &e) {
		throw DeviceCommandException(this->deviceId + "/" + this->key + ": " + e.what());
	}

	try {
		LircDevTransmitter transmitter(this->transmitterPath);

		if(this->carrier != 0) {
			transmitter.setCarrier(this->carrier);
		}
		if(this->dutyCycle != 0) {
			transmitter.setDutyCycle(this->dutyCycle);
		}

		VLOG(1) << "Sending " << this->key << " to " << this->deviceId;
		transmitter.send(timings);
	} catch(TransmitterUnavailableException &e) {
		LOG(WARNING) << "Not sending " << this->key << " to " << this->deviceId
			<< ": " << e.what();
	}
}
