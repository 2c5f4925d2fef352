#include "time_utils.hpp"
#include <fmt/format.h>
#include <ctime>
#include <sstream>
#include <iomanip>

static bool parse_iso(const std::string& s, struct tm* out) {
    *out = {};
    std::istringstream ss(s);
    ss >> std::get_time(out, "%Y-%m-%dT%H:%M:%S");
    return !ss.fail();
}

std::string format_seconds(int seconds) {
    if (seconds < 0) seconds = 0;
    int hours = seconds / 3600;
    int mins = (seconds % 3600) / 60;
    int secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    }
    return fmt::format("{}s", secs);
}

std::string format_duration(const std::string& start_time, const std::string& end_time) {
    if (start_time.empty()) return "-";

    struct tm start_tm = {};
    if (!parse_iso(start_time, &start_tm)) {
        return "?";
    }
    start_tm.tm_isdst = -1;
    std::time_t start_t = mktime(&start_tm);

    std::time_t end_t;
    if (!end_time.empty()) {
        struct tm end_tm = {};
        if (!parse_iso(end_time, &end_tm)) {
            return "?";
        }
        end_tm.tm_isdst = -1;
        end_t = mktime(&end_tm);
    } else {
        end_t = std::time(nullptr);
    }

    return format_seconds(static_cast<int>(std::difftime(end_t, start_t)));
}
