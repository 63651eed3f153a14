#include "LircClient.h"

#include "util/StringUtils.h"

#include <glog/logging.h>
#include <INIReader.h>

#include <lirc/lirc_client.h>

#include <cerrno>
#include <cstring>
#include <sstream>

#include <unistd.h>
#include <sys/types.h>
#include <sys/socket.h>

/// size of the buffer for reading replies
static const size_t kReadBufferSz = 1024;



/**
 * Connects to the daemon socket at the given path.
 *
 * @throws LircConnectionException if the daemon isn't reachable
 */
LircClient::LircClient(const std::string &_socketPath) : socketPath(_socketPath) {
	int fd = lirc_get_local_socket(this->socketPath.c_str(), 1);

	if(fd < 0) {
		std::stringstream msg;
		msg << "Couldn't connect to lircd at " << this->socketPath << ": "
			<< strerror(-fd);

		throw LircConnectionException(msg.str());
	}

	this->socket = fd;
	VLOG(2) << "Connected to lircd at " << this->socketPath << " (fd " << fd << ")";
}

/**
 * Closes the daemon connection.
 */
LircClient::~LircClient() {
	if(this->socket >= 0) {
		int err = close(this->socket);
		PLOG_IF(WARNING, err != 0) << "Couldn't close lircd socket";
	}
}

/**
 * Gets the daemon socket path from ir_lirc.socket.
 */
std::string LircClient::socketPathFromConfig(INIReader *config) {
	CHECK(config != nullptr) << "config may not be null";

	return config->Get("ir_lirc", "socket", "/var/run/lirc/lircd");
}



/**
 * Lists the names of all remotes the daemon knows about.
 */
int LircClient::listRemotes(std::vector<std::string> &out) {
	std::vector<std::string> data;
	this->runCommand("LIST", data);

	int numRemotes = 0;

	for(auto it = data.begin(); it != data.end(); it++) {
		std::string name = StringUtils::trim(*it);

		if(!name.empty()) {
			out.push_back(name);
			numRemotes++;
		}
	}

	return numRemotes;
}

/**
 * Lists the names of all keys of the given remote. The daemon replies with a
 * "<code> <name>" line per key; only the name is kept.
 */
int LircClient::listRemoteKeys(const std::string &remote, std::vector<std::string> &out) {
	std::vector<std::string> data;
	this->runCommand("LIST " + remote, data);

	int numKeys = 0;

	for(auto it = data.begin(); it != data.end(); it++) {
		std::vector<std::string> tokens;
		StringUtils::splitWhitespace(*it, tokens);

		if(tokens.empty()) {
			continue;
		}

		out.push_back(tokens.back());
		numKeys++;
	}

	VLOG(2) << "Remote " << remote << " has " << numKeys << " keys";
	return numKeys;
}

/**
 * Asks the daemon to send the given key of the given remote once.
 *
 * @throws LircCommandException if the daemon couldn't send the signal
 */
void LircClient::sendOnce(const std::string &remote, const std::string &key) {
	VLOG(1) << "SEND_ONCE " << remote << " " << key;

	int err = lirc_send_one(this->socket, remote.c_str(), key.c_str());

	if(err != 0) {
		throw LircCommandException("lircd couldn't send " + key + " on " + remote);
	}
}



/**
 * Sends a command to the daemon, and collects the data lines of its reply.
 * Broadcast packets and replies to other commands are skipped.
 *
 * @return number of data lines.
 */
int LircClient::runCommand(const std::string &command, std::vector<std::string> &data) {
	this->writeAll(command + "\n");

	while(true) {
		std::string echo;
		bool success = false;
		std::vector<std::string> packetData;

		this->readPacket(echo, success, packetData);

		// lircd broadcasts this when it reloads its config
		if(echo == "SIGHUP") {
			VLOG(1) << "lircd reloaded its configuration";
			continue;
		}
		if(echo != command) {
			LOG(WARNING) << "Ignoring reply to '" << echo << "' while waiting for '"
				<< command << "'";
			continue;
		}

		if(!success) {
			std::stringstream msg;
			msg << "lircd failed '" << command << "'";

			for(auto it = packetData.begin(); it != packetData.end(); it++) {
				msg << ": " << *it;
			}

			throw LircCommandException(msg.str());
		}

		data.insert(data.end(), packetData.begin(), packetData.end());
		return static_cast<int>(packetData.size());
	}
}

/**
 * Reads a single reply packet:
 *
 * BEGIN
 * <command>
 * [SUCCESS|ERROR]
 * [DATA
 * n
 * n lines of data]
 * END
 */
void LircClient::readPacket(std::string &command, bool &success, std::vector<std::string> &data) {
	std::string line;

	// skip anything outside of a packet
	this->readLine(line);

	while(line != "BEGIN") {
		LOG(WARNING) << "Unexpected line from lircd: '" << line << "'";
		this->readLine(line);
	}

	this->readLine(command);

	// broadcast packets have no status
	this->readLine(line);
	success = true;

	if(line == "END") {
		return;
	} else if(line == "SUCCESS") {
		success = true;
	} else if(line == "ERROR") {
		success = false;
	} else {
		throw LircCommandException("Malformed lircd reply status: " + line);
	}

	this->readLine(line);

	if(line == "DATA") {
		this->readLine(line);

		int numLines = 0;

		try {
			numLines = std::stoi(line);
		} catch(std::exception &e) {
			throw LircCommandException("Malformed lircd data length: " + line);
		}

		for(int i = 0; i < numLines; i++) {
			this->readLine(line);
			data.push_back(line);
		}

		this->readLine(line);
	}

	if(line != "END") {
		throw LircCommandException("Malformed lircd reply, expected END: " + line);
	}
}

/**
 * Reads a single line from the socket, without its line terminator.
 *
 * @throws LircCommandException if the connection was closed or the read failed
 */
void LircClient::readLine(std::string &line) {
	char buffer[kReadBufferSz];

	while(true) {
		size_t end = this->readBuffer.find('\n');

		if(end != std::string::npos) {
			line = this->readBuffer.substr(0, end);
			this->readBuffer.erase(0, end + 1);
			return;
		}

		ssize_t read = recv(this->socket, buffer, sizeof(buffer), 0);

		if(read == 0) {
			throw LircCommandException("lircd closed the connection");
		} else if(read < 0) {
			if(errno == EINTR) {
				continue;
			}

			PLOG(WARNING) << "Couldn't read from lircd";
			throw LircCommandException(std::string("Couldn't read from lircd: ") + strerror(errno));
		}

		this->readBuffer.append(buffer, static_cast<size_t>(read));
	}
}

/**
 * Writes the entire string to the socket.
 */
void LircClient::writeAll(const std::string &str) {
	const char *data = str.c_str();
	size_t remaining = str.length();

	while(remaining > 0) {
		ssize_t written = send(this->socket, data, remaining, MSG_NOSIGNAL);

		if(written < 0) {
			if(errno == EINTR) {
				continue;
			}

			PLOG(WARNING) << "Couldn't write to lircd";
			throw LircCommandException(std::string("Couldn't write to lircd: ") + strerror(errno));
		}

		data += written;
		remaining -= static_cast<size_t>(written);
	}
}
