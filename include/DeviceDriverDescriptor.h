/**
 * Defines an abstract class that all driver descriptors should subclass. The
 * descriptor is the entry point of a driver: it enumerates devices, handles
 * pairing and creates device drivers.
 */
#ifndef DEVICEDRIVERDESCRIPTOR_H
#define DEVICEDRIVERDESCRIPTOR_H

#include "DeviceInfo.h"

#include <string>
#include <vector>

#include <uuid/uuid.h>

class DeviceDriver;

/**
 * Authentication required when pairing with a device.
 */
typedef enum {
	kAuthenticationNone				= 0,
	kAuthenticationPin				= 1,
	kAuthenticationPassword			= 2,
} picontrol_auth_method_t;

class DeviceDriverDescriptor {
	public:
		DeviceDriverDescriptor(const uuid_t &_driverId, const std::string &_displayName,
			const std::string &_description) : displayName(_displayName),
			description(_description) {
			uuid_copy(this->driverId, _driverId);
		}
		virtual ~DeviceDriverDescriptor() {

		}

	public:
		/**
		 * Returns the driver UUID as an upper-case string.
		 */
		const std::string getDriverId(void) const {
			char uuidStr[37];
			uuid_unparse_upper(this->driverId, uuidStr);

			return std::string(uuidStr);
		}
		const std::string &getDisplayName(void) const {
			return this->displayName;
		}
		const std::string &getDescription(void) const {
			return this->description;
		}

	// device discovery
	public:
		/**
		 * Appends all available devices to the output vector; returns the
		 * number of devices added.
		 */
		virtual int getDevices(std::vector<DeviceInfo> &out) = 0;

		/**
		 * Gets the device with the given id.
		 *
		 * @throws DeviceNotFoundException if there is no such device
		 */
		virtual DeviceInfo getDevice(const std::string &deviceId) = 0;

	// pairing
	public:
		virtual picontrol_auth_method_t authenticationMethod(void) = 0;
		virtual bool requiresPairing(void) = 0;

		/**
		 * Starts pairing with the given device. Returns the pairing request id,
		 * and writes whether the device provides a PIN to the flag.
		 */
		virtual std::string startPairing(const DeviceInfo &device,
			const std::string &remoteName, bool &deviceProvidesPin) = 0;
		virtual bool finalizePairing(const std::string &pairingRequest,
			const std::string &credentials, bool deviceProvidesPin) = 0;

	// driver instances
	public:
		/**
		 * Creates a driver for the device with the given id. The caller owns
		 * the returned driver; it may outlive the descriptor, but not the
		 * module that created it.
		 *
		 * @throws DeviceNotFoundException if there is no such device
		 */
		virtual DeviceDriver *createDeviceInstance(const std::string &deviceId) = 0;

	// shared variables
	protected:
		uuid_t driverId;

		std::string displayName;
		std::string description;
};

#endif
