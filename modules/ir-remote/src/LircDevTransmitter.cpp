#include "LircDevTransmitter.h"

#include <picontrol_driver.h>

#include <glog/logging.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <sstream>

#include <unistd.h>
#include <fcntl.h>
#include <sys/ioctl.h>

#ifdef __linux__
	#include <linux/lirc.h>
#endif

/**
 * Opens the LIRC device for writing.
 *
 * @throws TransmitterUnavailableException if the device can't be opened
 */
LircDevTransmitter::LircDevTransmitter(const std::string &_devicePath) : devicePath(_devicePath) {
	this->fd = open(this->devicePath.c_str(), O_WRONLY | O_CLOEXEC);

	if(this->fd < 0) {
		std::stringstream msg;
		msg << "Couldn't open " << this->devicePath << ": " << strerror(errno);

		throw TransmitterUnavailableException(msg.str());
	}
}

/**
 * Closes the device.
 */
LircDevTransmitter::~LircDevTransmitter() {
	if(this->fd >= 0) {
		int err = close(this->fd);
		PLOG_IF(WARNING, err != 0) << "Couldn't close " << this->devicePath;
	}
}



/**
 * Sets the carrier frequency. Not all devices support this; failures are
 * logged and returned but otherwise ignored.
 *
 * @return 0 if successful, error code otherwise.
 */
int LircDevTransmitter::setCarrier(unsigned int hz) {
#ifdef __linux__
	uint32_t value = hz;
	int err = ioctl(this->fd, LIRC_SET_SEND_CARRIER, &value);

	if(err < 0) {
		PLOG(WARNING) << "Couldn't set carrier of " << this->devicePath << " to " << hz;
		return errno;
	}
#endif

	return 0;
}

/**
 * Sets the duty cycle, in percent. As with the carrier, failures are only
 * logged.
 *
 * @return 0 if successful, error code otherwise.
 */
int LircDevTransmitter::setDutyCycle(unsigned int percent) {
#ifdef __linux__
	uint32_t value = percent;
	int err = ioctl(this->fd, LIRC_SET_SEND_DUTY_CYCLE, &value);

	if(err < 0) {
		PLOG(WARNING) << "Couldn't set duty cycle of " << this->devicePath << " to " << percent;
		return errno;
	}
#endif

	return 0;
}

/**
 * Writes the pulse/space durations to the device; the driver transmits the
 * whole sequence in a single write.
 *
 * @throws DeviceCommandException if the write failed or was short
 */
void LircDevTransmitter::send(const std::vector<unsigned int> &timings) {
	std::vector<uint32_t> buffer(timings.begin(), timings.end());
	size_t length = buffer.size() * sizeof(uint32_t);

	VLOG(2) << "Writing " << buffer.size() << " durations to " << this->devicePath;

	ssize_t written;

	do {
		written = write(this->fd, buffer.data(), length);
	} while(written < 0 && errno == EINTR);

	if(written < 0) {
		PLOG(WARNING) << "Couldn't write to " << this->devicePath;
		throw DeviceCommandException("Couldn't write to " + this->devicePath + ": " + strerror(errno));
	} else if(static_cast<size_t>(written) != length) {
		std::stringstream msg;
		msg << "Short write to " << this->devicePath << " (wrote " << written
			<< " of " << length << " bytes)";

		throw DeviceCommandException(msg.str());
	}
}
