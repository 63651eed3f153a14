#ifndef LIRCDEVICECOMMAND_H
#define LIRCDEVICECOMMAND_H

#include <picontrol_driver.h>

#include <string>

/**
 * A key of a remote known to lircd. Each execution opens its own daemon
 * connection.
 */
class LircDeviceCommand : public DeviceCommand {
	public:
		LircDeviceCommand(int id, const std::string &title, const std::vector<uint8_t> &icon,
			const std::string &key, const std::string &deviceId,
			const std::string &socketPath);

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

		std::string socketPath;
};

#endif
