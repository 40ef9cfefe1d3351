#pragma once

#include <string>
#include <cstdint>
#include <ctime>

// Format unix seconds as a local ISO 8601 timestamp.
std::string format_unix_time(std::int64_t seconds);

// Current wall-clock time in unix seconds.
std::int64_t unix_now();

// Strict parse: the whole string must be a base-10 integer.
bool parse_int64(const std::string& s, std::int64_t& out);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Lowercase ASCII copy.
std::string to_lower(std::string s);
