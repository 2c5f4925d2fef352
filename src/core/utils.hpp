#pragma once

#include <string>
#include <ctime>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Count non-overlapping occurrences of needle in haystack.
size_t count_occurrences(const std::string& haystack, const std::string& needle);

// Wrap a string in single quotes for a POSIX shell (' → '\'').
std::string shell_quote(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}
