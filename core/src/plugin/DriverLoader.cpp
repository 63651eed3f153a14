#include "DriverLoader.h"

#include "util/StringUtils.h"

#include <glog/logging.h>

#include <stdexcept>

#include <dirent.h>
#include <sys/stat.h>
#include <dlfcn.h>

#include <uuid/uuid.h>

/**
 * Loads all driver modules from driver.module_dir, and initializes them.
 */
DriverLoader::DriverLoader(INIReader *_cfg) : config(_cfg) {
	CHECK(this->config != nullptr) << "config may not be null";

	// read from the INI
	std::string path = this->config->Get("driver", "module_dir", "unknown");
	CHECK(path != "unknown") << "driver module_dir was not set in config, aborting";

	this->loadModulesInDirectory(path);

	// init modules
	this->callModuleInitializers();
}

/**
 * Unloads all modules cleanly. Descriptors created by this loader must have
 * been deleted already.
 */
DriverLoader::~DriverLoader() {
	this->callModuleDeinitializers();
}



/**
 * Add a descriptor factory with the given UUID to the registry.
 */
int DriverLoader::registerDriver(const uuid_t &uuid, driver_descriptor_factory_t factory) {
	// get UUID as string
	char uuidStr[37];
	uuid_unparse_upper(uuid, uuidStr);

	LOG(INFO) << "Registering driver descriptor factory for UUID " << uuidStr;

	this->factories[std::string(uuidStr)] = factory;
	return 0;
}

/**
 * Appends the UUIDs of all registered drivers to the output vector.
 */
int DriverLoader::getDriverIds(std::vector<std::string> &out) const {
	for(auto it = this->factories.begin(); it != this->factories.end(); it++) {
		out.push_back(it->first);
	}

	return static_cast<int>(this->factories.size());
}

/**
 * Converts a UUID string to the upper-case form used as registry key. Strings
 * that aren't UUIDs are returned unchanged, and won't match any driver.
 */
std::string DriverLoader::normalizeUuid(const std::string &uuid) {
	uuid_t parsed;

	if(uuid_parse(uuid.c_str(), parsed) != 0) {
		return uuid;
	}

	char uuidStr[37];
	uuid_unparse_upper(parsed, uuidStr);

	return std::string(uuidStr);
}



/**
 * Loads all modules (shared objects) from the given directory.
 */
void DriverLoader::loadModulesInDirectory(const std::string &directory) {
	LOG(INFO) << "Loading driver modules from " << directory;

	// set up for listing the directory
	DIR *dir = nullptr;
	struct dirent *it = nullptr;
	struct stat statbuf;
	int err = 0;

	// attempt to open the directory
	dir = opendir(directory.c_str());

	if(dir != nullptr) {
		// iterate over all entries
		while((it = readdir(dir)) != nullptr) {
			std::string name(it->d_name);

			// make sure it's not a hidden file, and is a shared object
			if(name[0] != '.' && StringUtils::hasSuffix(name, ".so")) {
				std::string fullPath = directory + '/' + name;

				// get info about it
				err = stat(fullPath.c_str(), &statbuf);

				if(err != 0) {
					PLOG(ERROR) << "Couldn't stat " << fullPath;
				} else {
					if(!S_ISDIR(statbuf.st_mode)) {
						// load the module
						err = this->loadModule(fullPath);

						LOG_IF(WARNING, err != 0) << "Couldn't load driver module "
							<< fullPath << ": " << err;
					}
				}
			}
		}

		// close the directory
		closedir(dir);
	} else {
		PLOG(ERROR) << "Couldn't list driver modules in directory " << directory;
	}
}

/**
 * Loads the module from the specified path.
 */
int DriverLoader::loadModule(const std::string &path) {
	void *lib = nullptr;
	int err = 0;

	// attempt to dlopen it
	lib = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);

	if(lib == nullptr) {
		LOG(ERROR) << "Couldn't open module " << path << ": " << dlerror();
		return MODULE_OPEN_FAILED;
	}

	// validate compatibility
	err = this->isModuleCompatible(lib);

	if(err != 0) {
		// close the library file again
		dlclose(lib);
		return err;
	}

	// module is good; keep the handle for later
	this->moduleHandles.push_back(std::make_tuple(path, lib));
	return 0;
}

/**
 * Verifies that the module is compatible with this host version. Returns 0 if
 * it is valid, an error code otherwise.
 */
int DriverLoader::isModuleCompatible(void *handle) {
	// try to locate the info struct
	void *infoAddr = dlsym(handle, "plugin_info");

	if(infoAddr == nullptr) {
		return MODULE_MISSING_INFO;
	}

	// cast it and validate the magic and ABI version
	picontrol_driver_plugin_t *info = static_cast<picontrol_driver_plugin_t *>(infoAddr);

	if(info->magic != static_cast<uint32_t>(PICONTROL_DRIVER_MAGIC)) {
		return MODULE_INVALID_MAGIC;
	} else if(info->abiVersion != PICONTROL_DRIVER_ABI_VERSION) {
		return MODULE_ABI_MISMATCH;
	}

	// otherwise, the module is probably good.
	return 0;
}



/**
 * Calls the initializer functions for all loaded modules.
 */
void DriverLoader::callModuleInitializers(void) {
	void *handle;
	std::string path;

	// iterate over all modules we loaded before
	for(auto tuple : this->moduleHandles) {
		std::tie(path, handle) = tuple;

		// locate the info symbol
		void *infoAddr = dlsym(handle, "plugin_info");
		CHECK(infoAddr != nullptr) << "Module " << path << " suddenly lost its info struct";

		// get the info and call the function
		picontrol_driver_plugin_t *info = static_cast<picontrol_driver_plugin_t *>(infoAddr);

		LOG(INFO) << "Initializing driver \"" << info->name << "\" (" << info->build
			<< ", compiled " << info->compiledOn << ") from " << path;
		info->init(this);
	}
}

/**
 * Calls the de-initializer functions for all loaded modules, then unloads
 * them.
 */
void DriverLoader::callModuleDeinitializers(void) {
	void *handle;
	std::string path;
	int err = 0;

	// iterate over all modules we loaded before
	for(auto tuple : this->moduleHandles) {
		std::tie(path, handle) = tuple;

		// locate the info symbol
		void *infoAddr = dlsym(handle, "plugin_info");
		CHECK(infoAddr != nullptr) << "Module " << path << " suddenly lost its info struct";

		// get the info and call the function
		picontrol_driver_plugin_t *info = static_cast<picontrol_driver_plugin_t *>(infoAddr);

		LOG(INFO) << "De-initializing driver \"" << info->name << "\" from " << path;
		info->deinit(this);

		// unload the object
		err = dlclose(handle);

		if(err != 0) {
			LOG(WARNING) << "Couldn't unload " << path << ": " << dlerror();
		}
	}

	this->moduleHandles.clear();
	this->factories.clear();
}
