#pragma once

#include <string>
#include <utility>
#include <vector>
#include <core/types.hpp>

// Attribute keys as written into the submit description
namespace setting_keys {
constexpr const char* UNIVERSE             = "Universe";
constexpr const char* EXECUTABLE           = "Executable";
constexpr const char* ARGUMENTS            = "Arguments";
constexpr const char* TRANSFER_EXECUTABLE  = "transfer_executable";
constexpr const char* INITIAL_DIR          = "initialdir";
constexpr const char* INPUT_FILE           = "Input";
constexpr const char* OUTPUT_FILE          = "Output";
constexpr const char* ERROR_FILE           = "Error";
constexpr const char* LOG_FILE             = "Log";
constexpr const char* REQUIREMENTS         = "Requirements";
constexpr const char* CONCURRENCY_LIMITS   = "concurrency_limits";
constexpr const char* REQUEST_CPUS         = "request_cpus";
constexpr const char* REQUEST_MEMORY       = "request_memory";
constexpr const char* REQUEST_DISK         = "request_disk";
constexpr const char* TRANSFER_FILES       = "should_transfer_files";
constexpr const char* WHEN_TRANSFER_OUTPUT = "when_to_transfer_output";
constexpr const char* NOTIFICATION         = "notification";
constexpr const char* NOTIFY_USER          = "notify_user";
} // namespace setting_keys

// The attributes of the stanza being built, plus the text of every stanza
// flushed so far.
//
// flush() consumes the pending attributes: after it, the next stanza starts
// empty and nothing set earlier carries over unless it is set again. This is
// what allows one submission to mix executables and resource requests, and
// it also means per-stanza requests must be repeated for every stanza.
class SubmissionSettings {
public:
    static const std::vector<std::string>& valid_universes();
    static bool is_valid_universe(const std::string& universe);

    // Generic access. Known keys match case-insensitively ("universe" sets
    // Universe). Typed keys (transfer_executable, request_*) and the
    // universe are validated exactly as by their dedicated setters.
    void set_value(const std::string& key, const SettingValue& value);
    const SettingValue* find(const std::string& key) const;
    bool has(const std::string& key) const { return find(key) != nullptr; }
    void erase(const std::string& key);
    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }

    // Required attributes: getters throw RequiredSetting when unset.
    std::string universe() const;
    void set_universe(const std::string& universe);
    std::string executable() const;
    void set_executable(const std::string& path);
    std::string arguments() const;
    void set_arguments(const std::string& args);

    // Optional attributes: getters throw EmptySetting when unset.
    bool transfer_executable() const;
    void set_transfer_executable(bool transfer);
    template <typename T>
    void set_transfer_executable(T) = delete;  // bool only; no int or string conversions
    std::string initial_directory() const;
    void set_initial_directory(const std::string& dir);
    std::string input() const;
    void set_input(const std::string& path);
    std::string output() const;
    void set_output(const std::string& path);
    std::string error() const;
    void set_error(const std::string& path);
    std::string log() const;
    void set_log(const std::string& path);
    std::string requirements() const;
    void set_requirements(const std::string& expr);
    bool matlab_lock() const;
    void set_matlab_lock(bool lock);
    int cpus() const;
    void set_cpus(int count);
    int memory_mb() const;
    void set_memory_mb(int megabytes);
    int disk_mb() const;
    void set_disk_mb(int megabytes);
    std::string transfer_files() const;
    void set_transfer_files(const std::string& mode);
    std::string when_transfer_output() const;
    void set_when_transfer_output(const std::string& when);
    std::string notification() const;
    void set_notification(const std::string& when);
    std::string email() const;
    void set_email(const std::string& address);

    // Serialize the pending attributes as "key = value" lines after the
    // accumulated text and return the result. With clear_after the lines
    // become part of the accumulated text and the pending set is emptied;
    // without it nothing changes.
    std::string flush(bool clear_after = true);

    // flush(false)
    std::string preview() const;

    // Append a raw line (e.g. "Queue 3") to the accumulated text.
    void append_directive(const std::string& line);

    const std::string& accumulated() const { return accumulated_; }

    // True/False for bools, decimal for ints.
    static std::string format_value(const SettingValue& value);

    // Wrap an argument string in the scheduler's double quotes, doubling any
    // double quote that is not already doubled.
    static std::string quote_arguments(const std::string& args);

    // The spelling used in the description for a known key, else `key`.
    static std::string canonical_key(const std::string& key);

private:
    std::vector<std::pair<std::string, SettingValue>> entries_;
    std::string accumulated_;

    void put(const std::string& key, SettingValue value);
    std::string get_required(const char* key) const;
    std::string get_optional(const char* key) const;
    int get_optional_int(const char* key) const;
};
