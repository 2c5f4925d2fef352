#pragma once

#include <string>
#include <fstream>
#include <iostream>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <core/types.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string cj_log_path() {
    static std::string path = (platform::temp_dir() / "condorjob_debug.log").string();
    return path;
}

// Per-cluster log path: ~/.condorjob/logs/cluster-{id}.log
inline std::string cluster_log_path(int cluster) {
    return (platform::state_dir() / "logs" /
            fmt::format("cluster-{}.log", cluster)).string();
}

// Append a timestamped line to a cluster's persistent log file.
inline void append_cluster_log(int cluster, const std::string& msg) {
    std::string path = cluster_log_path(cluster);
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    if (ec) return;
    std::ofstream f(path, std::ios::app);
    if (f) {
        f << "[" << now_iso() << "] " << msg << "\n";
    }
}

inline void cj_log(const std::string& msg) {
    std::ofstream out(cj_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

inline void cj_log_exec(const std::string& label, const std::string& cmd,
                        const ExecResult& r) {
    cj_log(fmt::format("{} CMD: {}", label, cmd));
    cj_log(fmt::format("{} exit={} output({})={}", label, r.exit_code,
                       r.output.size(), r.output.substr(0, 500)));
}

// Caller-visible warning: stderr plus the debug log.
inline void cj_warn(const std::string& msg) {
    std::cerr << "Warning: " << msg << std::endl;
    cj_log("WARN " + msg);
}
