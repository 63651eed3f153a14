#ifndef PICONTROL_DRIVER_H
#define PICONTROL_DRIVER_H

#include "DriverHost.h"

#include "DeviceInfo.h"
#include "DeviceCommand.h"
#include "DeviceDriver.h"
#include "DeviceDriverDescriptor.h"
#include "DriverException.h"

#include <cstdint>

/**
 * Magic value for driver plugins.
 */
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmultichar"

#define PICONTROL_DRIVER_MAGIC			'PCHD'

#pragma GCC diagnostic pop

/**
 * Current driver ABI version. Driver modules whose ABI number doesn't match
 * this value will not be loaded. This should _only_ be changed in case the
 * binary interface between the hub and its drivers is broken.
 */
#define PICONTROL_DRIVER_ABI_VERSION	0x00001000

/**
 * Structure defining information about a driver module. Each module must
 * export this structure under the name `plugin_info` so that it can be loaded
 * properly.
 */
typedef struct {
	// Magic value
	uint32_t magic;
	// Driver ABI version
	uint32_t abiVersion;

	// Driver version
	uint32_t version;

	// (Required) Driver name
	const char *name;
	// (Required) Author name
	const char *author;
	// (Required) License
	const char *license;
	// (Required) Website for further information about the driver
	const char *url;
	// Build number of the driver
	const char *build;
	// date/time string when this driver was compiled
	const char *compiledOn;

	// Function used to initialize the driver; registers its descriptor factory
	void (*init)(DriverHost *);
	// Function used to shut down the driver
	void (*deinit)(DriverHost *);
} picontrol_driver_plugin_t;

/**
 * Prefix symbols that you would like to be exported outside of the module with
 * this macro.
*/
#if defined _WIN32 || defined __CYGWIN__
	#ifdef BUILDING_DLL
		#ifdef __GNUC__
			#define PICONTROL_EXPORT __attribute__ ((dllexport))
		#else
			#define PICONTROL_EXPORT __declspec(dllexport)
		#endif
	#else
		#ifdef __GNUC__
			#define PICONTROL_EXPORT __attribute__ ((dllimport))
		#else
			#define PICONTROL_EXPORT __declspec(dllimport)
		#endif
	#endif
	#define PICONTROL_PRIVATE
#else
	#define PICONTROL_EXPORT __attribute__ ((visibility ("default")))
	#define PICONTROL_PRIVATE  __attribute__ ((visibility ("hidden")))
#endif

#endif
