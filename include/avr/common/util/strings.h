#pragma once

#include <string>
#include <vector>

namespace avr {

class Strings {
public:
	static const std::string ToLower(std::string s);
	// Case-insensitive Contains
	static bool ContainsLower(const std::string& subject, const std::string& search);
	static bool ContainsAnyLower(const std::string& subject, const std::vector<std::string>& searches);
	static bool EndsWith(const std::string& subject, const std::string& suffix);
};

} // namespace avr
