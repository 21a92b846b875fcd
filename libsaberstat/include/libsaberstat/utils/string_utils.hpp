#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace libsaberstat {
namespace utils {

inline std::string Trim(const std::string &s) {
	size_t begin = 0;
	size_t end = s.size();
	while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
		begin++;
	}
	while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
		end--;
	}
	return s.substr(begin, end - begin);
}

inline std::string ToUpper(std::string s) {
	for (auto &c : s) {
		c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
	}
	return s;
}

inline std::string ToLower(std::string s) {
	for (auto &c : s) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	return s;
}

/// ASCII case-insensitive equality (accented bytes compare exactly)
inline bool EqualsIgnoreCase(const std::string &a, const std::string &b) {
	if (a.size() != b.size()) {
		return false;
	}
	return std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
		return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
	});
}

} // namespace utils
} // namespace libsaberstat
