#include "avr/common/util/strings.h"

#include <algorithm>
#include <cctype>

namespace avr {

const std::string Strings::ToLower(std::string s)
{
	std::transform(
		s.begin(), s.end(), s.begin(),
		[](unsigned char c) { return static_cast<char>(::tolower(c)); }
	);
	return s;
}

bool Strings::ContainsLower(const std::string& subject, const std::string& search)
{
	return ToLower(subject).find(ToLower(search)) != std::string::npos;
}

bool Strings::ContainsAnyLower(const std::string& subject, const std::vector<std::string>& searches)
{
	const std::string lowered = ToLower(subject);
	for (const auto& search : searches) {
		if (!search.empty() && lowered.find(ToLower(search)) != std::string::npos) {
			return true;
		}
	}
	return false;
}

bool Strings::EndsWith(const std::string& subject, const std::string& suffix)
{
	if (suffix.size() > subject.size()) {
		return false;
	}
	return std::equal(suffix.rbegin(), suffix.rend(), subject.rbegin());
}

} // namespace avr
