#include "settings.hpp"
#include <core/errors.hpp>
#include <algorithm>
#include <cctype>

namespace keys = setting_keys;

const std::vector<std::string>& SubmissionSettings::valid_universes() {
    static const std::vector<std::string> universes = {
        "vanilla", "standard", "java", "scheduler", "local", "grid", "vm",
    };
    return universes;
}

bool SubmissionSettings::is_valid_universe(const std::string& universe) {
    const auto& u = valid_universes();
    return std::find(u.begin(), u.end(), universe) != u.end();
}

std::string SubmissionSettings::format_value(const SettingValue& value) {
    if (auto* s = std::get_if<std::string>(&value)) return *s;
    if (auto* i = std::get_if<int>(&value)) return std::to_string(*i);
    return std::get<bool>(value) ? "True" : "False";
}

std::string SubmissionSettings::quote_arguments(const std::string& args) {
    std::string quoted = "\"";
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] != '"') {
            quoted += args[i];
        } else if (i + 1 < args.size() && args[i + 1] == '"') {
            quoted += "\"\"";
            i++;
        } else {
            quoted += "\"\"";
        }
    }
    quoted += '"';
    return quoted;
}

// ── Generic access ───────────────────────────────────────────

std::string SubmissionSettings::canonical_key(const std::string& key) {
    static const char* known[] = {
        keys::UNIVERSE, keys::EXECUTABLE, keys::ARGUMENTS, keys::TRANSFER_EXECUTABLE,
        keys::INITIAL_DIR, keys::INPUT_FILE, keys::OUTPUT_FILE, keys::ERROR_FILE,
        keys::LOG_FILE, keys::REQUIREMENTS, keys::CONCURRENCY_LIMITS, keys::REQUEST_CPUS,
        keys::REQUEST_MEMORY, keys::REQUEST_DISK, keys::TRANSFER_FILES,
        keys::WHEN_TRANSFER_OUTPUT, keys::NOTIFICATION, keys::NOTIFY_USER,
    };
    auto lower = [](std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return s;
    };
    std::string wanted = lower(key);
    for (const char* k : known) {
        if (lower(k) == wanted) return k;
    }
    return key;
}

void SubmissionSettings::put(const std::string& key, SettingValue value) {
    for (auto& entry : entries_) {
        if (entry.first == key) {
            entry.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(key, std::move(value));
}

void SubmissionSettings::set_value(const std::string& name, const SettingValue& value) {
    std::string key = canonical_key(name);
    if (key == keys::UNIVERSE) {
        auto* s = std::get_if<std::string>(&value);
        if (!s) throw SettingTypeError(key, "string");
        set_universe(*s);
        return;
    }
    if (key == keys::TRANSFER_EXECUTABLE) {
        if (!std::holds_alternative<bool>(value)) throw SettingTypeError(key, "boolean");
    } else if (key == keys::REQUEST_CPUS || key == keys::REQUEST_MEMORY ||
               key == keys::REQUEST_DISK) {
        if (!std::holds_alternative<int>(value)) throw SettingTypeError(key, "integer");
    }
    put(key, value);
}

const SettingValue* SubmissionSettings::find(const std::string& key) const {
    for (const auto& entry : entries_) {
        if (entry.first == key) return &entry.second;
    }
    return nullptr;
}

void SubmissionSettings::erase(const std::string& key) {
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&](const auto& e) { return e.first == key; }),
                   entries_.end());
}

std::string SubmissionSettings::get_required(const char* key) const {
    const auto* v = find(key);
    if (!v) throw RequiredSetting(key);
    return format_value(*v);
}

std::string SubmissionSettings::get_optional(const char* key) const {
    const auto* v = find(key);
    if (!v) throw EmptySetting(key);
    return format_value(*v);
}

int SubmissionSettings::get_optional_int(const char* key) const {
    const auto* v = find(key);
    if (!v) throw EmptySetting(key);
    return std::get<int>(*v);
}

// ── Required attributes ──────────────────────────────────────

std::string SubmissionSettings::universe() const { return get_required(keys::UNIVERSE); }

void SubmissionSettings::set_universe(const std::string& universe) {
    if (!is_valid_universe(universe)) throw InvalidUniverseError(universe);
    put(keys::UNIVERSE, universe);
}

std::string SubmissionSettings::executable() const { return get_required(keys::EXECUTABLE); }
void SubmissionSettings::set_executable(const std::string& path) { put(keys::EXECUTABLE, path); }

std::string SubmissionSettings::arguments() const { return get_required(keys::ARGUMENTS); }

void SubmissionSettings::set_arguments(const std::string& args) {
    put(keys::ARGUMENTS, quote_arguments(args));
}

// ── Optional attributes ──────────────────────────────────────

bool SubmissionSettings::transfer_executable() const {
    const auto* v = find(keys::TRANSFER_EXECUTABLE);
    if (!v) throw EmptySetting(keys::TRANSFER_EXECUTABLE);
    return std::get<bool>(*v);
}

void SubmissionSettings::set_transfer_executable(bool transfer) {
    put(keys::TRANSFER_EXECUTABLE, transfer);
}

std::string SubmissionSettings::initial_directory() const { return get_optional(keys::INITIAL_DIR); }
void SubmissionSettings::set_initial_directory(const std::string& dir) { put(keys::INITIAL_DIR, dir); }

std::string SubmissionSettings::input() const { return get_optional(keys::INPUT_FILE); }
void SubmissionSettings::set_input(const std::string& path) { put(keys::INPUT_FILE, path); }

std::string SubmissionSettings::output() const { return get_optional(keys::OUTPUT_FILE); }
void SubmissionSettings::set_output(const std::string& path) { put(keys::OUTPUT_FILE, path); }

std::string SubmissionSettings::error() const { return get_optional(keys::ERROR_FILE); }
void SubmissionSettings::set_error(const std::string& path) { put(keys::ERROR_FILE, path); }

std::string SubmissionSettings::log() const { return get_optional(keys::LOG_FILE); }
void SubmissionSettings::set_log(const std::string& path) { put(keys::LOG_FILE, path); }

std::string SubmissionSettings::requirements() const { return get_optional(keys::REQUIREMENTS); }
void SubmissionSettings::set_requirements(const std::string& expr) { put(keys::REQUIREMENTS, expr); }

// The MATLAB license pool is modelled as a concurrency limit.
bool SubmissionSettings::matlab_lock() const {
    std::string limits = get_optional(keys::CONCURRENCY_LIMITS);
    std::transform(limits.begin(), limits.end(), limits.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return limits.find("matlab") != std::string::npos;
}

void SubmissionSettings::set_matlab_lock(bool lock) {
    if (lock) {
        put(keys::CONCURRENCY_LIMITS, std::string("MATLAB"));
    } else {
        erase(keys::CONCURRENCY_LIMITS);
    }
}

int SubmissionSettings::cpus() const { return get_optional_int(keys::REQUEST_CPUS); }
void SubmissionSettings::set_cpus(int count) { put(keys::REQUEST_CPUS, count); }

int SubmissionSettings::memory_mb() const { return get_optional_int(keys::REQUEST_MEMORY); }
void SubmissionSettings::set_memory_mb(int megabytes) { put(keys::REQUEST_MEMORY, megabytes); }

int SubmissionSettings::disk_mb() const { return get_optional_int(keys::REQUEST_DISK); }
void SubmissionSettings::set_disk_mb(int megabytes) { put(keys::REQUEST_DISK, megabytes); }

std::string SubmissionSettings::transfer_files() const { return get_optional(keys::TRANSFER_FILES); }
void SubmissionSettings::set_transfer_files(const std::string& mode) { put(keys::TRANSFER_FILES, mode); }

std::string SubmissionSettings::when_transfer_output() const {
    return get_optional(keys::WHEN_TRANSFER_OUTPUT);
}
void SubmissionSettings::set_when_transfer_output(const std::string& when) {
    put(keys::WHEN_TRANSFER_OUTPUT, when);
}

std::string SubmissionSettings::notification() const { return get_optional(keys::NOTIFICATION); }
void SubmissionSettings::set_notification(const std::string& when) { put(keys::NOTIFICATION, when); }

std::string SubmissionSettings::email() const { return get_optional(keys::NOTIFY_USER); }
void SubmissionSettings::set_email(const std::string& address) { put(keys::NOTIFY_USER, address); }

// ── Serialization ────────────────────────────────────────────

std::string SubmissionSettings::preview() const {
    std::string all = accumulated_;
    for (const auto& [key, value] : entries_) {
        all += key + " = " + format_value(value) + "\n";
    }
    return all;
}

std::string SubmissionSettings::flush(bool clear_after) {
    std::string all = preview();
    if (clear_after) {
        accumulated_ = all;
        entries_.clear();
    }
    return all;
}

void SubmissionSettings::append_directive(const std::string& line) {
    accumulated_ += line + "\n";
}
