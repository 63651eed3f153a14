#include "RemoteFileDriverDescriptor.h"

#include "RemoteFileDeviceDriver.h"

#include "util/StringUtils.h"

#include <glog/logging.h>
#include <INIReader.h>

#include <algorithm>

#include <cerrno>
#include <dirent.h>
#include <sys/stat.h>

// 5e0f3a52-8c1d-4b7e-9f61-2d4a7c3e9b18
const unsigned char RemoteFileDriverDescriptor::kDriverUuid[16] = {
	0x5E, 0x0F, 0x3A, 0x52, 0x8C, 0x1D, 0x4B, 0x7E,
	0x9F, 0x61, 0x2D, 0x4A, 0x7C, 0x3E, 0x9B, 0x18
};

const std::string RemoteFileDriverDescriptor::kRemoteExtension = ".remote";



/**
 * Reads the remote directory and LIRC device from the config.
 */
RemoteFileDriverDescriptor::RemoteFileDriverDescriptor(DriverHost *host) :
	IRDriverDescriptor(host, kDriverUuid, "IR Remote Definitions",
	"PiControl Hub driver for IR devices described by remote definition files") {
	this->remoteDir = this->config->Get("ir_remote", "remote_dir", "/etc/picontrol/remotes");
	this->transmitterPath = this->config->Get("ir_remote", "device", "/dev/lirc0");

	LOG(INFO) << "Reading remotes from " << this->remoteDir << ", sending through "
		<< this->transmitterPath;
}

RemoteFileDriverDescriptor::~RemoteFileDriverDescriptor() {

}

/**
 * Invokes the constructor for the descriptor and returns it.
 */
DeviceDriverDescriptor *RemoteFileDriverDescriptor::create(DriverHost *host) {
	return new RemoteFileDriverDescriptor(host);
}



/**
 * Lists all remote definition files in the remote directory, sorted by device
 * id. A missing directory means there are no devices.
 */
int RemoteFileDriverDescriptor::getDevices(std::vector<DeviceInfo> &out) {
	std::vector<std::string> deviceIds;

	// set up for listing the directory
	DIR *dir = nullptr;
	struct dirent *it = nullptr;
	struct stat statbuf;
	int err = 0;

	// attempt to open the directory
	dir = opendir(this->remoteDir.c_str());

	if(dir == nullptr) {
		PLOG(WARNING) << "Couldn't list remote definitions in " << this->remoteDir;
		return 0;
	}

	// iterate over all entries
	while((it = readdir(dir)) != nullptr) {
		std::string name(it->d_name);

		// skip hidden files and anything that isn't a definition
		if(name[0] == '.' || !StringUtils::hasSuffix(name, kRemoteExtension)) {
			continue;
		}
		if(name.length() == kRemoteExtension.length()) {
			continue;
		}

		std::string fullPath = this->remoteDir + '/' + name;

		// follow symlinks; only regular files are definitions
		err = stat(fullPath.c_str(), &statbuf);

		if(err != 0) {
			PLOG(WARNING) << "Couldn't stat " << fullPath;
		} else if(S_ISREG(statbuf.st_mode)) {
			deviceIds.push_back(name.substr(0, name.length() - kRemoteExtension.length()));
		}
	}

	// close the directory
	closedir(dir);

	// readdir order is arbitrary
	std::sort(deviceIds.begin(), deviceIds.end());

	for(auto id = deviceIds.begin(); id != deviceIds.end(); id++) {
		out.push_back(DeviceInfo(*id, *id));
	}

	VLOG(1) << "Found " << deviceIds.size() << " remote definitions in " << this->remoteDir;
	return static_cast<int>(deviceIds.size());
}

/**
 * Creates a driver for the device with the given id, loading its definition.
 *
 * @throws DriverConstructionException if the definition can't be loaded
 */
DeviceDriver *RemoteFileDriverDescriptor::createDeviceInstance(const std::string &deviceId) {
	DeviceInfo info = this->getDevice(deviceId);
	std::string path = this->remoteDir + '/' + info.getDeviceId() + kRemoteExtension;

	return new RemoteFileDeviceDriver(info, path, this->transmitterPath, this->icons);
}
