/**
 * Entry file for the lircd driver module. This defines the structures and
 * functions the hub looks for when loading the module.
 */
#include "LircDriverDescriptor.h"

#include <picontrol_driver.h>

#include <uuid/uuid.h>

/**
 * Initialization function: register the descriptor factory with the host.
 */
PICONTROL_PRIVATE void ir_lirc_init(DriverHost *host) {
	host->registerDriver(LircDriverDescriptor::kDriverUuid, LircDriverDescriptor::create);
}

/**
 * Destructor function: clean up a previously initialized driver.
 */
PICONTROL_PRIVATE void ir_lirc_deinit(DriverHost *host) {

}

// export the struct
PICONTROL_EXPORT picontrol_driver_plugin_t plugin_info = {
	.magic = PICONTROL_DRIVER_MAGIC,
	.abiVersion = PICONTROL_DRIVER_ABI_VERSION,
	.version = 0x00010000,

	.name = "IR Controlled Devices (lircd)",
	.author = "Thomas Bonk",
	.license = "Apache 2.0",
	.url = "https://github.com/PiControl/pi_control_hub_driver_ir",
	.build = GIT_HASH "/" GIT_BRANCH,
	.compiledOn = COMPILE_TIME,

	.init = ir_lirc_init,
	.deinit = ir_lirc_deinit
};
