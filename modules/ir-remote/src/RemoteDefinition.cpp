#include "RemoteDefinition.h"

#include "util/StringUtils.h"

#include <picontrol_driver.h>

#include <glog/logging.h>

#include <fstream>
#include <sstream>

/**
 * Reads and parses the remote definition at the given path. The caller owns
 * the returned definition.
 *
 * @throws DriverConstructionException if the file can't be read or parsed
 */
RemoteDefinition *RemoteDefinition::load(const std::string &path) {
	std::ifstream stream(path.c_str(), std::ios::in | std::ios::binary);

	if(!stream.is_open()) {
		LOG(WARNING) << "Couldn't open " << path;
		throw DriverConstructionException("Couldn't open remote definition " + path);
	}

	// parse the document
	Json::CharReaderBuilder builder;
	Json::Value document;
	std::string errors;

	if(!Json::parseFromStream(builder, stream, &document, &errors)) {
		LOG(WARNING) << "Couldn't parse " << path << ": " << errors;
		throw DriverConstructionException("Couldn't parse remote definition " + path + ": " + errors);
	}

	return new RemoteDefinition(document, path);
}

/**
 * Validates the document structure, and reads the layout and carrier settings.
 *
 * @throws DriverConstructionException if the document is malformed
 */
RemoteDefinition::RemoteDefinition(const Json::Value &document, const std::string &_source) :
	source(_source) {
	if(!document.isObject()) {
		throw DriverConstructionException(this->source + ": document is not an object");
	}

	// keys are required
	const Json::Value &keys = document["keys"];

	if(!keys.isObject()) {
		throw DriverConstructionException(this->source + ": \"keys\" missing or not an object");
	}

	this->keys = keys;

	// layout is optional
	const Json::Value &remote = document["remote"];

	if(remote.isObject()) {
		this->layoutWidth = this->readUnsigned(remote, "width");
		this->layoutHeight = this->readUnsigned(remote, "height");
	} else if(!remote.isNull()) {
		throw DriverConstructionException(this->source + ": \"remote\" is not an object");
	}

	this->carrier = this->readUnsigned(document, "carrier");
	this->dutyCycle = this->readUnsigned(document, "duty_cycle");

	if(this->dutyCycle > 100) {
		throw DriverConstructionException(this->source + ": duty cycle must be at most 100");
	}

	VLOG(1) << "Loaded " << this->keys.size() << " keys from " << this->source
		<< ", layout " << this->layoutWidth << "x" << this->layoutHeight;
}

RemoteDefinition::~RemoteDefinition() {

}

/**
 * Reads an optional non-negative integer member; absent members read as 0.
 */
unsigned int RemoteDefinition::readUnsigned(const Json::Value &parent, const char *name) {
	const Json::Value &value = parent[name];

	if(value.isNull()) {
		return 0;
	}

	if(!value.isIntegral() || !value.isUInt()) {
		std::stringstream msg;
		msg << this->source << ": \"" << name << "\" must be a non-negative integer";

		throw DriverConstructionException(msg.str());
	}

	return value.asUInt();
}



/**
 * Appends the names of all keys, in lexicographic order, to the output vector.
 */
int RemoteDefinition::getKeyNames(std::vector<std::string> &out) const {
	// member names come out of a std::map, so they're already sorted
	Json::Value::Members names = this->keys.getMemberNames();

	out.insert(out.end(), names.begin(), names.end());
	return static_cast<int>(names.size());
}

bool RemoteDefinition::hasKey(const std::string &key) const {
	return this->keys.isMember(key);
}

/**
 * Returns the raw code of the given key.
 */
const Json::Value &RemoteDefinition::getCode(const std::string &key) const {
	CHECK(this->hasKey(key)) << "No key " << key << " in " << this->source;

	return this->keys[key];
}



/**
 * Decodes a code into pulse/space durations. Codes are either an array of
 * integers, or a string with whitespace-separated integers.
 *
 * @throws DeviceCommandException if the code isn't a valid timing sequence
 */
int RemoteDefinition::decodeTimings(const Json::Value &code, std::vector<unsigned int> &out) {
	std::vector<int> values;

	if(code.isArray()) {
		for(Json::ArrayIndex i = 0; i < code.size(); i++) {
			if(!code[i].isIntegral() || !code[i].isInt()) {
				throw DeviceCommandException("IR code contains a non-integer duration");
			}

			values.push_back(code[i].asInt());
		}
	} else if(code.isString()) {
		if(StringUtils::parseIntList(code.asString(), values) < 0) {
			throw DeviceCommandException("IR code contains a non-integer duration");
		}
	} else {
		throw DeviceCommandException("IR code must be an array or a string of durations");
	}

	// a valid sequence starts and ends with a pulse
	if(values.empty()) {
		throw DeviceCommandException("IR code is empty");
	}
	if((values.size() % 2) == 0) {
		throw DeviceCommandException("IR code must have an odd number of durations");
	}

	for(int value : values) {
		if(value <= 0) {
			throw DeviceCommandException("IR code durations must be positive");
		}
	}

	for(int value : values) {
		out.push_back(static_cast<unsigned int>(value));
	}

	return static_cast<int>(values.size());
}
