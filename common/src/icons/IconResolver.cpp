#include "IconResolver.h"

#include <glog/logging.h>
#include <INIReader.h>

#include <cerrno>
#include <cstdio>

#include <sys/stat.h>

const std::string IconResolver::kFallbackIcon = "unknown.png";



/**
 * Creates a resolver for the icons in the given directory.
 */
IconResolver::IconResolver(const std::string &_iconDir) : iconDir(_iconDir) {

}

/**
 * Releases all cached icons.
 */
IconResolver::~IconResolver() {

}

/**
 * Creates a resolver for the icon directory specified by icons.dir.
 */
std::shared_ptr<IconResolver> IconResolver::fromConfig(INIReader *config) {
	CHECK(config != nullptr) << "config may not be null";

	std::string dir = config->Get("icons", "dir", "/usr/share/picontrol-ir/icons");
	return std::make_shared<IconResolver>(dir);
}



/**
 * Returns the icon for the given key, or the fallback icon if there is no
 * icon with that name.
 */
std::vector<uint8_t> IconResolver::resolve(const std::string &key) {
	// keys never address anything outside the icon directory
	if(key.empty() || key.find('/') != std::string::npos) {
		return this->unknown();
	}

	std::string filename = key + ".png";
	std::string path = this->iconDir + '/' + filename;

	// is there a regular file with that name?
	struct stat statbuf;

	if(stat(path.c_str(), &statbuf) != 0 || !S_ISREG(statbuf.st_mode)) {
		VLOG(2) << "No icon for key " << key << ", using fallback";
		return this->unknown();
	}

	std::vector<uint8_t> data;

	if(this->readIcon(filename, data) != 0) {
		return this->unknown();
	}

	return data;
}

/**
 * Returns the fallback icon.
 */
std::vector<uint8_t> IconResolver::unknown(void) {
	std::vector<uint8_t> data;
	this->readIcon(kFallbackIcon, data);

	return data;
}



/**
 * Reads the icon with the given filename, going through the cache. Icons that
 * couldn't be read aren't cached, and leave the output empty.
 *
 * @returns 0 if successful, error code otherwise.
 */
int IconResolver::readIcon(const std::string &filename, std::vector<uint8_t> &out) {
	std::string path = this->iconDir + '/' + filename;

	// check the cache first
	{
		std::lock_guard<std::mutex> lock(this->cacheLock);

		auto it = this->cache.find(path);

		if(it != this->cache.end()) {
			out = it->second;
			return 0;
		}
	}

	// read without holding the lock; a concurrent reader produces the same bytes
	std::vector<uint8_t> data;
	int err = this->readFile(path, data);

	if(err != 0) {
		LOG(WARNING) << "Couldn't read icon " << path << ": " << err;
		return err;
	}

	std::lock_guard<std::mutex> lock(this->cacheLock);
	this->cache.insert(std::make_pair(path, data));

	out = data;
	return 0;
}

/**
 * Reads the entire file at the given path into the output vector.
 *
 * @returns 0 if successful, error code otherwise.
 */
int IconResolver::readFile(const std::string &path, std::vector<uint8_t> &out) {
	int err;

	// open the file for reading
	FILE *f = fopen(path.c_str(), "rb");

	if(f == nullptr) {
		PLOG(WARNING) << "Couldn't open " << path;
		return errno;
	}

	// read it in chunks until EOF
	uint8_t buffer[4096];
	size_t read = 0;

	while((read = fread(buffer, 1, sizeof(buffer), f)) > 0) {
		out.insert(out.end(), buffer, buffer + read);
	}

	err = ferror(f);
	PLOG_IF(WARNING, err != 0) << "Couldn't read from " << path;

	// close the file again
	int closeErr = fclose(f);
	PLOG_IF(WARNING, closeErr != 0) << "Couldn't close " << path;

	if(err != 0) {
		out.clear();
		return EIO;
	}

	return 0;
}
