/**
 * Exceptions thrown across the driver interface.
 */
#ifndef DRIVEREXCEPTION_H
#define DRIVEREXCEPTION_H

#include <stdexcept>
#include <string>

class DriverException : public std::runtime_error {
	public:
		explicit DriverException(const std::string &what) : std::runtime_error(what) {

		}
};

/**
 * A device id didn't resolve to any device the driver knows about.
 */
class DeviceNotFoundException : public DriverException {
	public:
		explicit DeviceNotFoundException(const std::string &_deviceId) :
			DriverException("No such device: " + _deviceId), deviceId(_deviceId) {

		}

		const std::string &getDeviceId(void) const {
			return this->deviceId;
		}

	private:
		std::string deviceId;
};

/**
 * The data backing a device couldn't be loaded when creating its driver.
 */
class DriverConstructionException : public DriverException {
	public:
		explicit DriverConstructionException(const std::string &what) : DriverException(what) {

		}
};

/**
 * A command couldn't be sent over an established transmission channel.
 */
class DeviceCommandException : public DriverException {
	public:
		explicit DeviceCommandException(const std::string &what) : DriverException(what) {

		}
};

#endif
