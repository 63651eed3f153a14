/**
 * Main entrypoint for ir-control: loads the driver modules the way the hub
 * does, and drives a single device from the command line.
 */
#include "plugin/DriverLoader.h"

#include <picontrol_driver.h>

#include <glog/logging.h>
#include <cxxopts.hpp>
#include "INIReader.h"

#include <algorithm>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <tuple>

#include <cstdlib>

using namespace std;

// parsing of the config file
INIReader *configReader = nullptr;
void parseConfigFile(string path);

int listDevices(DeviceDriverDescriptor *descriptor);
int listCommands(DeviceDriver *driver);
int sendCommand(DeviceDriver *driver, const string &key);

/**
 * Main function
 */
int main(int argc, const char *argv[]) {
	int err = 0;

	// set up logging
	FLAGS_logtostderr = 1;
	FLAGS_colorlogtostderr = 1;

	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	LOG(INFO) << "ir-control " << GIT_HASH << "/" << GIT_BRANCH
			  << " compiled on " << COMPILE_TIME;

	// parse command-line options
	cxxopts::Options options("ir-control", "Drives PiControl Hub IR drivers from the command line");

	options.add_options()
		("c,config", "Config file", cxxopts::value<std::string>()->default_value("picontrol-ir.conf"))
		("d,driver", "Driver UUID", cxxopts::value<std::string>()->default_value("ba7c5fce-f23f-11ee-a951-0242ac120002"))
		("drivers", "List registered drivers")
		("devices", "List the devices of the driver")
		("device", "Device id", cxxopts::value<std::string>())
		("commands", "List the commands of the device")
		("send", "Send the command with the given key to the device", cxxopts::value<std::string>())
		("h,help", "Print usage")
	;

	auto cmdlineOptions = options.parse(argc, argv);

	if(cmdlineOptions.count("help")) {
		cout << options.help() << endl;
		return 0;
	}

	// first, parse the config file
	parseConfigFile(cmdlineOptions["config"].as<std::string>());

	DriverLoader *loader = new DriverLoader(configReader);

	if(cmdlineOptions.count("drivers")) {
		vector<string> ids;
		loader->getDriverIds(ids);

		for(auto &id : ids) {
			cout << id << endl;
		}
	}

	// create the descriptor
	string uuid = cmdlineOptions["driver"].as<std::string>();
	DeviceDriverDescriptor *descriptor = nullptr;

	try {
		descriptor = loader->createDescriptor(uuid);
	} catch(std::out_of_range &e) {
		LOG(ERROR) << "No driver with UUID '" << uuid << "'";

		delete loader;
		delete configReader;
		return 1;
	}

	LOG(INFO) << "Using driver \"" << descriptor->getDisplayName() << "\": "
		<< descriptor->getDescription();

	if(cmdlineOptions.count("devices")) {
		listDevices(descriptor);
	}

	// handle the device, if any
	if(!cmdlineOptions.count("device") &&
		(cmdlineOptions.count("commands") || cmdlineOptions.count("send"))) {
		LOG(ERROR) << "--commands and --send need a device; pass one with --device";
		err = 1;
	} else if(cmdlineOptions.count("device")) {
		string deviceId = cmdlineOptions["device"].as<std::string>();

		try {
			unique_ptr<DeviceDriver> driver(descriptor->createDeviceInstance(deviceId));

			LOG_IF(WARNING, !driver->isDeviceReady()) << "Device " << deviceId << " is not ready";

			if(cmdlineOptions.count("commands")) {
				listCommands(driver.get());
			}
			if(cmdlineOptions.count("send")) {
				err = sendCommand(driver.get(), cmdlineOptions["send"].as<std::string>());
			}
		} catch(DriverException &e) {
			LOG(ERROR) << "Couldn't use device " << deviceId << ": " << e.what();
			err = 1;
		}
	}

	// tear down; descriptors must go before their modules are unloaded
	delete descriptor;
	delete loader;
	delete configReader;

	return err;
}

/**
 * Prints all devices of the driver.
 */
int listDevices(DeviceDriverDescriptor *descriptor) {
	vector<DeviceInfo> devices;
	int numDevices = descriptor->getDevices(devices);

	for(auto &device : devices) {
		cout << device.getDeviceId() << "\t" << device.getName() << endl;
	}

	return numDevices;
}

/**
 * Prints all commands of the device, along with the remote layout size.
 */
int listCommands(DeviceDriver *driver) {
	vector<unique_ptr<DeviceCommand>> commands;
	int numCommands = driver->getCommands(commands);

	unsigned int width, height;
	std::tie(width, height) = driver->remoteLayoutSize();

	cout << numCommands << " commands, layout " << width << "x" << height << endl;

	for(auto &command : commands) {
		cout << command->getId() << "\t" << command->getTitle() << "\t("
			<< command->getIcon().size() << " byte icon)" << endl;
	}

	return numCommands;
}

/**
 * Sends the command whose title matches the given key.
 */
int sendCommand(DeviceDriver *driver, const string &key) {
	vector<unique_ptr<DeviceCommand>> commands;
	driver->getCommands(commands);

	for(auto &command : commands) {
		if(command->getTitle() == key) {
			driver->execute(command.get());

			LOG(INFO) << "Sent " << key << " to " << driver->getDeviceId();
			return 0;
		}
	}

	LOG(ERROR) << "Device " << driver->getDeviceId() << " has no key " << key;
	return 1;
}

/**
 * Opens the config file for reading and parses it.
 */
void parseConfigFile(string path) {
	int err;

	LOG(INFO) << "Reading configuration from " << path;

	// attempt to open the config file
	configReader = new INIReader(path);

	err = configReader->ParseError();

	if(err == -1) {
		LOG(FATAL) << "Couldn't open config file at " << path;
	} else if(err > 0) {
		LOG(FATAL) << "Parse error on line " << err << " of config file " << path;
	}

	// set up the logging parameters
	int verbosity = configReader->GetInteger("logging", "verbosity", 0);

	if(verbosity < 0) {
		FLAGS_v = abs(verbosity);
		FLAGS_minloglevel = 0;

		LOG(INFO) << "Enabled verbose logging up to level " << abs(verbosity);
	} else {
		// disable verbose logging
		FLAGS_v = 0;

		// ALWAYS log FATAL errors
		FLAGS_minloglevel = min(verbosity, 2);
	}

	FLAGS_logtostderr = configReader->GetBoolean("logging", "stderr", true);
}
