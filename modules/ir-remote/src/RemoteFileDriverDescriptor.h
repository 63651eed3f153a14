#ifndef REMOTEFILEDRIVERDESCRIPTOR_H
#define REMOTEFILEDRIVERDESCRIPTOR_H

#include "descriptor/IRDriverDescriptor.h"

#include <string>
#include <vector>

/**
 * Descriptor for devices described by remote definition files: every
 * `<device id>.remote` file in the remote directory is a device.
 */
class RemoteFileDriverDescriptor : public IRDriverDescriptor {
	public:
		RemoteFileDriverDescriptor(DriverHost *host);
		~RemoteFileDriverDescriptor();

		static DeviceDriverDescriptor *create(DriverHost *host);

	public:
		virtual int getDevices(std::vector<DeviceInfo> &out);

		virtual DeviceDriver *createDeviceInstance(const std::string &deviceId);

		const std::string &getRemoteDir(void) const {
			return this->remoteDir;
		}
		const std::string &getTransmitterPath(void) const {
			return this->transmitterPath;
		}

	public:
		static const unsigned char kDriverUuid[16];

	private:
		static const std::string kRemoteExtension;

		std::string remoteDir;
		std::string transmitterPath;
};

#endif
