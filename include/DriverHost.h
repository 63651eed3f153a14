#ifndef DRIVERHOST_H
#define DRIVERHOST_H

#include <uuid/uuid.h>

#include <INIReader.h>

class DeviceDriverDescriptor;

class DriverHost;

// descriptor factory method: DeviceDriverDescriptor *factory(DriverHost *host);
typedef DeviceDriverDescriptor* (*driver_descriptor_factory_t)(DriverHost *);

/**
 * Host interface exported to each driver module.
 */
class DriverHost {
	public:
		virtual ~DriverHost() {

		}

	// functions drivers can call
	public:
		/**
		 * Returns the hub configuration. Drivers read their own sections from
		 * it; the reader is owned by the host.
		 */
		virtual INIReader *getConfig(void) = 0;

		/**
		 * Registers the factory for the driver descriptor with the given UUID.
		 * The host owns descriptors created through the factory.
		 */
		virtual int registerDriver(const uuid_t &uuid, driver_descriptor_factory_t factory) = 0;
};

#endif
