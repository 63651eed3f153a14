#ifndef LIRCDEVICEDRIVER_H
#define LIRCDEVICEDRIVER_H

#include <picontrol_driver.h>

#include <memory>
#include <string>

class IconResolver;
class LircClient;

/**
 * Driver for a remote defined in lircd's database. The device isn't ready if
 * the daemon couldn't be reached when the driver was created.
 */
class LircDeviceDriver : public DeviceDriver {
	public:
		LircDeviceDriver(const DeviceInfo &info, const std::string &socketPath,
			std::shared_ptr<IconResolver> icons);
		~LircDeviceDriver();

		LircDeviceDriver(const LircDeviceDriver &) = delete;
		LircDeviceDriver &operator=(const LircDeviceDriver &) = delete;

	public:
		virtual int getCommands(std::vector<std::unique_ptr<DeviceCommand>> &out);

		virtual std::tuple<unsigned int, unsigned int> remoteLayoutSize(void) {
			return std::make_tuple(0U, 0U);
		}
		virtual std::vector<std::vector<int>> remoteLayout(void) {
			return std::vector<std::vector<int>>();
		}

		virtual void execute(DeviceCommand *command);

		virtual bool isDeviceReady(void) {
			return (this->client != nullptr);
		}

	private:
		std::string socketPath;

		std::shared_ptr<IconResolver> icons;
		LircClient *client = nullptr;
};

#endif
