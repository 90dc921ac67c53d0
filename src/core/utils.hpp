#pragma once

#include <string>
#include <vector>

// Format the current local time with a strftime pattern.
std::string now_formatted(const std::string& pattern);

// Replace every occurrence of `from` in `s` with `to`. Empty `from` is a no-op.
std::string replace_all(const std::string& s, const std::string& from, const std::string& to);

// Join strings with a separator.
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Trim trailing whitespace in-place.
inline void trim_right(std::string& s) {
    auto end = s.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) { s.clear(); return; }
    s.erase(end + 1);
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}
