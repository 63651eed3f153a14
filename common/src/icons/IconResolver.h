/**
 * Resolves command keys to icon images. Icons are PNG files named after the
 * key in the configured icon directory; keys without an icon get the
 * `unknown.png` fallback.
 *
 * Loaded images are cached by path for the lifetime of the resolver. The cache
 * only ever grows: the icon set is a small, fixed directory of images.
 */
#ifndef ICONRESOLVER_H
#define ICONRESOLVER_H

#include <cstdint>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class INIReader;

class IconResolver {
	public:
		IconResolver(const std::string &iconDir);
		~IconResolver();

		static std::shared_ptr<IconResolver> fromConfig(INIReader *config);

	public:
		std::vector<uint8_t> resolve(const std::string &key);
		std::vector<uint8_t> unknown(void);

		const std::string &getIconDir(void) const {
			return this->iconDir;
		}

		size_t cachedIcons(void) {
			std::lock_guard<std::mutex> lock(this->cacheLock);
			return this->cache.size();
		}

	private:
		int readIcon(const std::string &filename, std::vector<uint8_t> &out);

		int readFile(const std::string &path, std::vector<uint8_t> &out);

	private:
		static const std::string kFallbackIcon;

		std::string iconDir;

		// icon data, keyed by full path
		std::map<std::string, std::vector<uint8_t>> cache;
		std::mutex cacheLock;
};

#endif
