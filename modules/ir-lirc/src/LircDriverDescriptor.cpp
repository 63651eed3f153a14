#include "LircDriverDescriptor.h"

#include "LircClient.h"
#include "LircDeviceDriver.h"

#include <glog/logging.h>

// ba7c5fce-f23f-11ee-a951-0242ac120002
const unsigned char LircDriverDescriptor::kDriverUuid[16] = {
	0xBA, 0x7C, 0x5F, 0xCE, 0xF2, 0x3F, 0x11, 0xEE,
	0xA9, 0x51, 0x02, 0x42, 0xAC, 0x12, 0x00, 0x02
};



/**
 * Reads the daemon socket path from the config.
 */
LircDriverDescriptor::LircDriverDescriptor(DriverHost *host) :
	IRDriverDescriptor(host, kDriverUuid, "IR Controlled Devices",
	"PiControl Hub driver for controling IR devices") {
	this->socketPath = LircClient::socketPathFromConfig(this->config);

	LOG(INFO) << "Using lircd at " << this->socketPath;
}

LircDriverDescriptor::~LircDriverDescriptor() {

}

/**
 * Invokes the constructor for the descriptor and returns it.
 */
DeviceDriverDescriptor *LircDriverDescriptor::create(DriverHost *host) {
	return new LircDriverDescriptor(host);
}



/**
 * Lists all remotes known to the daemon. If the daemon can't be reached, there
 * are no devices.
 */
int LircDriverDescriptor::getDevices(std::vector<DeviceInfo> &out) {
	std::vector<std::string> remotes;

	try {
		LircClient client(this->socketPath);
		client.listRemotes(remotes);
	} catch(LircConnectionException &e) {
		LOG(WARNING) << "No devices available: " << e.what();
		return 0;
	} catch(LircCommandException &e) {
		LOG(WARNING) << "Couldn't list remotes: " << e.what();
		return 0;
	}

	for(auto it = remotes.begin(); it != remotes.end(); it++) {
		out.push_back(DeviceInfo(*it, *it));
	}

	VLOG(1) << "lircd knows " << remotes.size() << " remotes";
	return static_cast<int>(remotes.size());
}

/**
 * Creates a driver for the remote with the given name.
 */
DeviceDriver *LircDriverDescriptor::createDeviceInstance(const std::string &deviceId) {
	DeviceInfo info = this->getDevice(deviceId);

	return new LircDeviceDriver(info, this->socketPath, this->icons);
}
