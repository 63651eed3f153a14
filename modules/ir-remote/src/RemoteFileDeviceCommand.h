#ifndef REMOTEFILEDEVICECOMMAND_H
#define REMOTEFILEDEVICECOMMAND_H

#include <picontrol_driver.h>

#include <json/json.h>

#include <string>

/**
 * A key from a remote definition file. Executing it writes the key's timings
 * to the LIRC device, which is opened for each execution.
 */
class RemoteFileDeviceCommand : public DeviceCommand {
	public:
		RemoteFileDeviceCommand(int id, const std::string &title, const std::vector<uint8_t> &icon,
			const std::string &key, const std::string &deviceId, const Json::Value &code,
			const std::string &transmitterPath, unsigned int carrier, unsigned int dutyCycle);

	public:
		virtual void execute(void);

		const std::string &getKey(void) const {
			return this->key;
		}
		const std::string &getDeviceId(void) const {
			return this->deviceId;
		}

	private:
		std::string key;
		std::string deviceId;

		Json::Value code;

		std::string transmitterPath;
		unsigned int carrier = 0;
		unsigned int dutyCycle = 0;
};

#endif
