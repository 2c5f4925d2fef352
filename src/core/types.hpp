#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <variant>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Command execution result (stdout and stderr combined)
struct ExecResult {
    int exit_code;
    std::string output;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// A submit-description attribute value
using SettingValue = std::variant<std::string, int, bool>;

// Configuration structures
struct SchedulerConfig {
    std::string server;
    std::string submit_command;
    std::string queue_command;
    double max_poll_seconds = 30.0;
};

enum class RemoteTransport {
    LOGIN,        // prefix commands with the login command ("ssh user@host")
    SSH_CHANNEL,  // native libssh2 exec channel
};

struct RemoteConfig {
    RemoteTransport transport = RemoteTransport::LOGIN;
    std::string login_command;
    int port = 22;
    int timeout = 30;
    std::optional<std::string> key_path;
};

struct NotifyConfig {
    std::string mail_map;
    std::string fallback_address;
};
