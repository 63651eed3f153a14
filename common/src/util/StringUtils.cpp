#include "StringUtils.h"

#include <string>
#include <vector>
#include <sstream>

#include <stdexcept>

#include <glog/logging.h>

/**
 * Splits a whitespace-separated list of tokens, inserting each of them into
 * the output vector.
 */
int StringUtils::splitWhitespace(const std::string &in, std::vector<std::string> &out) {
	int numItems = 0;

	// create a stream of input data
	std::stringstream ss(in);
	std::string token;

	// operator>> skips any amount of whitespace between tokens
	while(ss >> token) {
		out.push_back(token);
		numItems++;
	}

	return numItems;
}

/**
 * Parses a whitespace-separated list of decimal integers. Unlike the string
 * variant, a single malformed item fails the whole list.
 *
 * @return number of items parsed, or -1 if any item isn't an integer.
 */
int StringUtils::parseIntList(const std::string &in, std::vector<int> &out) {
	std::vector<std::string> results;
	std::vector<int> values;

	// parse the list to strings
	StringUtils::splitWhitespace(in, results);

	// convert each to an integer
	for(auto it = results.begin(); it != results.end(); it++) {
		try {
			size_t consumed = 0;
			int value = std::stoi(*it, &consumed, 10);

			if(consumed != it->length()) {
				LOG(WARNING) << "Trailing garbage in integer '" << *it << "'";
				return -1;
			}

			values.push_back(value);
		} catch(std::exception &e) {
			LOG(WARNING) << "Couldn't parse string '" << *it << "' to int: " << e.what();
			return -1;
		}
	}

	out.insert(out.end(), values.begin(), values.end());
	return static_cast<int>(values.size());
}

/**
 * Checks whether the string ends with the given suffix.
 */
bool StringUtils::hasSuffix(const std::string &str, const std::string &suffix) {
	if(str.length() < suffix.length()) {
		return false;
	}

	return (str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0);
}

/**
 * Removes leading and trailing whitespace.
 */
std::string StringUtils::trim(const std::string &str) {
	static const char *kWhitespace = " \t\r\n";

	size_t start = str.find_first_not_of(kWhitespace);

	if(start == std::string::npos) {
		return "";
	}

	size_t end = str.find_last_not_of(kWhitespace);
	return str.substr(start, (end - start + 1));
}
