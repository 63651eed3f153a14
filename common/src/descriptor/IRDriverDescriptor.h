/**
 * Behavior shared by the descriptors of all IR drivers: device lookup, and
 * pairing, which is a formality since IR is unidirectional and requires no
 * credentials.
 *
 * Subclasses provide the device enumeration and the driver instances.
 */
#ifndef IRDRIVERDESCRIPTOR_H
#define IRDRIVERDESCRIPTOR_H

#include <picontrol_driver.h>

#include <memory>
#include <string>
#include <vector>

class IconResolver;

class IRDriverDescriptor : public DeviceDriverDescriptor {
	public:
		IRDriverDescriptor(DriverHost *host, const uuid_t &driverId,
			const std::string &displayName, const std::string &description);
		virtual ~IRDriverDescriptor();

	public:
		virtual DeviceInfo getDevice(const std::string &deviceId);

		virtual picontrol_auth_method_t authenticationMethod(void) {
			return kAuthenticationNone;
		}
		virtual bool requiresPairing(void) {
			return false;
		}

		virtual std::string startPairing(const DeviceInfo &device,
			const std::string &remoteName, bool &deviceProvidesPin);
		virtual bool finalizePairing(const std::string &pairingRequest,
			const std::string &credentials, bool deviceProvidesPin);

	protected:
		DriverHost *host = nullptr;
		INIReader *config = nullptr;

		// shared by all drivers created by this descriptor; they may outlive it
		std::shared_ptr<IconResolver> icons;
};

#endif
