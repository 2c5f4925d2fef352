#pragma once

#include <string>

// Human-readable rendering of a span in seconds: "2h35m", "14m22s", "8s".
std::string format_seconds(int seconds);

// Format the duration between two ISO timestamps (YYYY-MM-DDTHH:MM:SS).
// If end_time is empty, uses current time (for "still running" durations).
// Returns "-" if start is empty, "?" on parse failure.
std::string format_duration(const std::string& start_time, const std::string& end_time = "");
