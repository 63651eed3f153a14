/**
 * Defines an abstract class that all device commands should subclass.
 */
#ifndef DEVICECOMMAND_H
#define DEVICECOMMAND_H

#include <cstdint>

#include <string>
#include <vector>

class DeviceCommand {
	public:
		DeviceCommand(int _id, const std::string &_title, const std::vector<uint8_t> &_icon) :
			id(_id), title(_title), icon(_icon) {

		}
		virtual ~DeviceCommand() {

		}

	public:
		int getId(void) const {
			return this->id;
		}
		const std::string &getTitle(void) const {
			return this->title;
		}
		/// PNG data of the icon shown for this command
		const std::vector<uint8_t> &getIcon(void) const {
			return this->icon;
		}

		/**
		 * Sends the command to the device.
		 *
		 * @throws DeviceCommandException if the command couldn't be sent
		 */
		virtual void execute(void) = 0;

	// shared variables
	protected:
		int id = 0;
		std::string title;
		std::vector<uint8_t> icon;
};

#endif
