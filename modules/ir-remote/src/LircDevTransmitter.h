/**
 * Sends raw IR timings through a kernel LIRC device (/dev/lircN) in pulse
 * mode. The device is opened for the lifetime of the transmitter.
 */
#ifndef LIRCDEVTRANSMITTER_H
#define LIRCDEVTRANSMITTER_H

#include <stdexcept>
#include <string>
#include <vector>

/**
 * The LIRC device couldn't be opened.
 */
class TransmitterUnavailableException : public std::runtime_error {
	public:
		explicit TransmitterUnavailableException(const std::string &what) : std::runtime_error(what) {

		}
};

class LircDevTransmitter {
	public:
		LircDevTransmitter(const std::string &devicePath);
		~LircDevTransmitter();

		LircDevTransmitter(const LircDevTransmitter &) = delete;
		LircDevTransmitter &operator=(const LircDevTransmitter &) = delete;

	public:
		int setCarrier(unsigned int hz);
		int setDutyCycle(unsigned int percent);

		void send(const std::vector<unsigned int> &timings);

	private:
		std::string devicePath;
		int fd = -1;
};

#endif
