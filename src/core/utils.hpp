#pragma once

#include <string>
#include <vector>

// Expand a leading "~/" (or a bare "~") to the user's home directory.
std::string expand_home(const std::string& path);

// Join non-empty parts with a single space.
std::string join_words(const std::vector<std::string>& parts);

// Split a comma separated list, trimming whitespace around each item.
std::vector<std::string> split_list(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
