/**
 * A parsed remote definition file: a JSON document mapping key names to the
 * IR codes of a device, plus the physical layout of its remote.
 *
 * {
 *   "carrier": 38000,
 *   "duty_cycle": 33,
 *   "keys": { "POWER": [9000, 4500, 560, ...], "MUTE": "9000 4500 560 ..." },
 *   "remote": { "width": 4, "height": 6, "layout": [...] }
 * }
 *
 * Codes are pulse/space durations in microseconds, starting and ending with a
 * pulse. They're only decoded when a key is sent.
 */
#ifndef REMOTEDEFINITION_H
#define REMOTEDEFINITION_H

#include <json/json.h>

#include <string>
#include <vector>

class RemoteDefinition {
	public:
		static RemoteDefinition *load(const std::string &path);

		RemoteDefinition(const Json::Value &document, const std::string &source);
		~RemoteDefinition();

	public:
		int getKeyNames(std::vector<std::string> &out) const;
		bool hasKey(const std::string &key) const;
		const Json::Value &getCode(const std::string &key) const;

		unsigned int getLayoutWidth(void) const {
			return this->layoutWidth;
		}
		unsigned int getLayoutHeight(void) const {
			return this->layoutHeight;
		}

		/// carrier frequency in Hz; 0 leaves the device default
		unsigned int getCarrier(void) const {
			return this->carrier;
		}
		/// duty cycle in percent; 0 leaves the device default
		unsigned int getDutyCycle(void) const {
			return this->dutyCycle;
		}

		static int decodeTimings(const Json::Value &code, std::vector<unsigned int> &out);

	private:
		unsigned int readUnsigned(const Json::Value &parent, const char *name);

	private:
		std::string source;

		Json::Value keys;

		unsigned int layoutWidth = 0;
		unsigned int layoutHeight = 0;

		unsigned int carrier = 0;
		unsigned int dutyCycle = 0;
};

#endif
