/**
 * Entry file for the remote definition driver module. This defines the
 * structures and functions the hub looks for when loading the module.
 */
#include "RemoteFileDriverDescriptor.h"

#include <picontrol_driver.h>

#include <uuid/uuid.h>

/**
 * Initialization function: register the descriptor factory with the host.
 */
PICONTROL_PRIVATE void ir_remote_init(DriverHost *host) {
	host->registerDriver(RemoteFileDriverDescriptor::kDriverUuid, RemoteFileDriverDescriptor::create);
}

/**
 * Destructor function: clean up a previously initialized driver.
 */
PICONTROL_PRIVATE void ir_remote_deinit(DriverHost *host) {

}

// export the struct
PICONTROL_EXPORT picontrol_driver_plugin_t plugin_info = {
	.magic = PICONTROL_DRIVER_MAGIC,
	.abiVersion = PICONTROL_DRIVER_ABI_VERSION,
	.version = 0x00010000,

	.name = "IR Remote Definitions",
	.author = "Thomas Bonk",
	.license = "Apache 2.0",
	.url = "https://github.com/PiControl/pi_control_hub_driver_ir",
	.build = GIT_HASH "/" GIT_BRANCH,
	.compiledOn = COMPILE_TIME,

	.init = ir_remote_init,
	.deinit = ir_remote_deinit
};
