#ifndef LIRCDRIVERDESCRIPTOR_H
#define LIRCDRIVERDESCRIPTOR_H

#include "descriptor/IRDriverDescriptor.h"

#include <string>
#include <vector>

/**
 * Descriptor for devices controlled through lircd: every remote in the
 * daemon's database is a device.
 */
class LircDriverDescriptor : public IRDriverDescriptor {
	public:
		LircDriverDescriptor(DriverHost *host);
		~LircDriverDescriptor();

		static DeviceDriverDescriptor *create(DriverHost *host);

	public:
		virtual int getDevices(std::vector<DeviceInfo> &out);

		virtual DeviceDriver *createDeviceInstance(const std::string &deviceId);

		const std::string &getSocketPath(void) const {
			return this->socketPath;
		}

	public:
		static const unsigned char kDriverUuid[16];

	private:
		std::string socketPath;
};

#endif
