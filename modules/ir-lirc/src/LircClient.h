/**
 * Connection to the LIRC daemon over its local socket. Remotes and their keys
 * are listed with the daemon's LIST command; signals are sent with SEND_ONCE.
 *
 * A client owns its socket; it's closed when the client is destroyed.
 */
#ifndef LIRCCLIENT_H
#define LIRCCLIENT_H

#include <stdexcept>
#include <string>
#include <vector>

class INIReader;

/**
 * The daemon socket couldn't be connected to.
 */
class LircConnectionException : public std::runtime_error {
	public:
		explicit LircConnectionException(const std::string &what) : std::runtime_error(what) {

		}
};

/**
 * The daemon failed a command, or the reply couldn't be read.
 */
class LircCommandException : public std::runtime_error {
	public:
		explicit LircCommandException(const std::string &what) : std::runtime_error(what) {

		}
};

class LircClient {
	public:
		LircClient(const std::string &socketPath);
		~LircClient();

		LircClient(const LircClient &) = delete;
		LircClient &operator=(const LircClient &) = delete;

		static std::string socketPathFromConfig(INIReader *config);

	public:
		int listRemotes(std::vector<std::string> &out);
		int listRemoteKeys(const std::string &remote, std::vector<std::string> &out);

		void sendOnce(const std::string &remote, const std::string &key);

	private:
		int runCommand(const std::string &command, std::vector<std::string> &data);

		void readPacket(std::string &command, bool &success, std::vector<std::string> &data);
		void readLine(std::string &line);

		void writeAll(const std::string &str);

	private:
		std::string socketPath;
		int socket = -1;

		// data read from the socket that isn't part of a complete line yet
		std::string readBuffer;
};

#endif
