#include "IRDriverDescriptor.h"

#include "../icons/IconResolver.h"

#include <glog/logging.h>
#include <INIReader.h>

#include <uuid/uuid.h>

/**
 * Sets up the descriptor, and the icon resolver shared with its drivers.
 */
IRDriverDescriptor::IRDriverDescriptor(DriverHost *_host, const uuid_t &driverId,
	const std::string &displayName, const std::string &description) :
	DeviceDriverDescriptor(driverId, displayName, description), host(_host) {
	CHECK(this->host != nullptr) << "driver host may not be null";

	this->config = this->host->getConfig();
	this->icons = IconResolver::fromConfig(this->config);

	VLOG(1) << "Created descriptor for " << this->displayName << " ("
		<< this->getDriverId() << "), icons from " << this->icons->getIconDir();
}

IRDriverDescriptor::~IRDriverDescriptor() {

}



/**
 * Gets the device with the given id by searching all available devices.
 */
DeviceInfo IRDriverDescriptor::getDevice(const std::string &deviceId) {
	std::vector<DeviceInfo> devices;
	this->getDevices(devices);

	for(auto it = devices.begin(); it != devices.end(); it++) {
		if(it->getDeviceId() == deviceId) {
			return *it;
		}
	}

	throw DeviceNotFoundException(deviceId);
}



/**
 * IR devices can't be paired with; we hand out a fresh request id, and tell
 * the caller the device doesn't provide a PIN.
 */
std::string IRDriverDescriptor::startPairing(const DeviceInfo &device,
	const std::string &remoteName, bool &deviceProvidesPin) {
	uuid_t request;
	char requestStr[37];

	uuid_generate_random(request);
	uuid_unparse_lower(request, requestStr);

	VLOG(1) << "Pairing request " << requestStr << " for " << device.getDeviceId()
		<< " from remote '" << remoteName << "'";

	deviceProvidesPin = false;
	return std::string(requestStr);
}

/**
 * Pairing always succeeds. The request id isn't validated.
 */
bool IRDriverDescriptor::finalizePairing(const std::string &pairingRequest,
	const std::string &credentials, bool deviceProvidesPin) {
	VLOG(1) << "Finalizing pairing request " << pairingRequest;
	return true;
}
