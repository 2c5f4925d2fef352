#pragma once

#include <string>
#include <optional>
#include <utility>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

namespace YAML { class Node; }

using SettingDefaults = std::vector<std::pair<std::string, SettingValue>>;

class Config {
public:
    // Built-in values, used when no config file exists
    static Config defaults();

    // Load global config from ~/.condorjob/config.yaml
    static Result<Config> load_global();

    // Load a config file; keys it omits keep their built-in values
    static Result<Config> load(const fs::path& path);

    // Parse config text (same schema as the file)
    static Result<Config> parse(const std::string& yaml_text);

    const SchedulerConfig& scheduler() const { return scheduler_; }
    const RemoteConfig& remote() const { return remote_; }
    const NotifyConfig& notify() const { return notify_; }

    // Submission identity; empty means "use the local identity"
    const std::string& user() const { return user_; }

    // Attributes applied to every new job: the built-in Universe and
    // request_* values, overridden or extended by the defaults section
    const SettingDefaults& setting_defaults() const { return defaults_; }

    Config& set_server(const std::string& server) { scheduler_.server = server; return *this; }
    Config& set_user(const std::string& user) { user_ = user; return *this; }

public:
    Config() = default;

private:
    static Config from_node(const YAML::Node& root);

    SchedulerConfig scheduler_;
    RemoteConfig remote_;
    NotifyConfig notify_;
    std::string user_;
    SettingDefaults defaults_;
};

fs::path get_global_config_dir();
fs::path get_global_config_path();
