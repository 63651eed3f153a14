/**
 * Identity of a single device a driver can talk to.
 */
#ifndef DEVICEINFO_H
#define DEVICEINFO_H

#include <string>

class DeviceInfo {
	public:
		DeviceInfo(const std::string &_deviceId, const std::string &_name) :
			deviceId(_deviceId), name(_name) {

		}

	public:
		const std::string &getDeviceId(void) const {
			return this->deviceId;
		}
		const std::string &getName(void) const {
			return this->name;
		}

	private:
		std::string deviceId;
		std::string name;
};

#endif
