#ifndef REMOTEFILEDEVICEDRIVER_H
#define REMOTEFILEDEVICEDRIVER_H

#include <picontrol_driver.h>

#include <memory>
#include <string>

class IconResolver;
class RemoteDefinition;

/**
 * Driver for a device described by a remote definition file. The definition
 * is loaded when the driver is created; a driver that was created is ready.
 */
class RemoteFileDeviceDriver : public DeviceDriver {
	public:
		RemoteFileDeviceDriver(const DeviceInfo &info, const std::string &definitionPath,
			const std::string &transmitterPath, std::shared_ptr<IconResolver> icons);
		~RemoteFileDeviceDriver();

		RemoteFileDeviceDriver(const RemoteFileDeviceDriver &) = delete;
		RemoteFileDeviceDriver &operator=(const RemoteFileDeviceDriver &) = delete;

	public:
		virtual int getCommands(std::vector<std::unique_ptr<DeviceCommand>> &out);

		virtual std::tuple<unsigned int, unsigned int> remoteLayoutSize(void);
		virtual std::vector<std::vector<int>> remoteLayout(void);

		virtual void execute(DeviceCommand *command);

		virtual bool isDeviceReady(void) {
			return (this->definition != nullptr);
		}

	private:
		std::string transmitterPath;

		std::shared_ptr<IconResolver> icons;
		RemoteDefinition *definition = nullptr;
};

#endif
