#pragma once

#include <string>
#include <vector>
#include <ctime>
#include <cstdint>
#include <utility>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Parse an ISO 8601 timestamp to time_t. Returns 0 on failure.
std::time_t parse_iso_time(const std::string& iso);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Copying variant of trim().
inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

// ASCII lowercase (multi-byte UTF-8 sequences pass through untouched).
std::string to_lower(const std::string& s);

// Split on '\n'. A trailing newline does not produce an extra empty line.
std::vector<std::string> split_lines(const std::string& text);

// Number of UTF-8 code points in s.
size_t utf8_length(const std::string& s);

// Lowercase base-36 rendering of an unsigned value ("kx3v9a1").
std::string to_base36(uint64_t value);

// "say general t1 hello" → {"say", "general t1 hello"}. Both parts trimmed.
std::pair<std::string, std::string> split_first_word(const std::string& text);
