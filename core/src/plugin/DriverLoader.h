/**
 * Implements the driver module loader and registry.
 */
#ifndef DRIVERLOADER_H
#define DRIVERLOADER_H

#include <picontrol_driver.h>

#include <string>
#include <vector>
#include <tuple>
#include <map>

#include <uuid/uuid.h>

#include <INIReader.h>

class DriverLoader : public DriverHost {
	public:
		DriverLoader(INIReader *config);
		~DriverLoader();

	// driver API
	public:
		virtual INIReader *getConfig(void) {
			return this->config;
		}

		virtual int registerDriver(const uuid_t &uuid, driver_descriptor_factory_t factory);

	// API used by the rest of the host
	public:
		int getDriverIds(std::vector<std::string> &out) const;

		size_t getNumModules(void) const {
			return this->moduleHandles.size();
		}

		/**
		 * Creates the descriptor of the driver with the given UUID. The caller
		 * owns the descriptor, and must delete it before the loader.
		 *
		 * @throws std::out_of_range if no such driver was registered
		 */
		DeviceDriverDescriptor *createDescriptor(const std::string &uuid) {
			driver_descriptor_factory_t factory = this->factories.at(normalizeUuid(uuid));

			return factory(this);
		}

		static std::string normalizeUuid(const std::string &uuid);

	private:
		enum {
			MODULE_LOADED			= 0,
			MODULE_MISSING_INFO		= 1,
			MODULE_INVALID_MAGIC,
			MODULE_ABI_MISMATCH,
			MODULE_OPEN_FAILED
		};

	private:
		void loadModulesInDirectory(const std::string &directory);

		int loadModule(const std::string &path);
		int isModuleCompatible(void *handle);

		void callModuleInitializers(void);
		void callModuleDeinitializers(void);

	private:
		// handles returned by dlopen for these modules
		std::vector<std::tuple<std::string, void *>> moduleHandles;

		// descriptor factories, keyed by upper-case UUID string
		std::map<std::string, driver_descriptor_factory_t> factories;

		INIReader *config = nullptr;
};

#endif
