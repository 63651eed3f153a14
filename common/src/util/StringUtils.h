/**
 * A few functions useful for dealing with strings.
 */
#ifndef STRINGUTILS_H
#define STRINGUTILS_H

#include <string>
#include <vector>

class StringUtils {
	private:
		StringUtils() {}
		~StringUtils() {}

	public:
		/**
		 * Splits the input at runs of whitespace, inserting each non-empty
		 * token into the output vector.
		 */
		static int splitWhitespace(const std::string &in, std::vector<std::string> &out);
		static int parseIntList(const std::string &in, std::vector<int> &out);

		static bool hasSuffix(const std::string &str, const std::string &suffix);
		static std::string trim(const std::string &str);
};

#endif
