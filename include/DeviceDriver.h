/**
 * Defines an abstract class that all device drivers should subclass. A device
 * driver is bound to a single device for its entire lifetime.
 */
#ifndef DEVICEDRIVER_H
#define DEVICEDRIVER_H

#include "DeviceInfo.h"
#include "DeviceCommand.h"

#include <memory>
#include <string>
#include <tuple>
#include <vector>

class DeviceDriver {
	public:
		DeviceDriver(const DeviceInfo &_info) : info(_info) {

		}
		virtual ~DeviceDriver() {

		}

	public:
		const std::string &getDeviceId(void) const {
			return this->info.getDeviceId();
		}
		const std::string &getDeviceName(void) const {
			return this->info.getName();
		}

	// generic driver API
	public:
		/**
		 * Appends the commands supported by this device to the output vector,
		 * and returns the number of commands added.
		 */
		virtual int getCommands(std::vector<std::unique_ptr<DeviceCommand>> &out) = 0;

		/**
		 * Width and height of the remote layout.
		 */
		virtual std::tuple<unsigned int, unsigned int> remoteLayoutSize(void) = 0;
		/**
		 * Layout of the remote, as a list of columns of command ids.
		 */
		virtual std::vector<std::vector<int>> remoteLayout(void) = 0;

		virtual void execute(DeviceCommand *command) = 0;

		virtual bool isDeviceReady(void) = 0;

	// shared variables
	protected:
		DeviceInfo info;
};

#endif
