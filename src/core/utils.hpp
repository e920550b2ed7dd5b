#pragma once

#include <string>
#include <vector>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Split on runs of whitespace.
std::vector<std::string> split_ws(const std::string& s);

// Replace every occurrence of `token` in `s` with `value`.
std::string replace_all(std::string s, const std::string& token, const std::string& value);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
