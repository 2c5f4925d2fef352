#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <submit/settings.hpp>
#include <algorithm>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

fs::path get_global_config_dir() {
    return platform::state_dir();
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

static SchedulerConfig parse_scheduler_config(const YAML::Node& node) {
    SchedulerConfig s;
    s.server = node["server"].as<std::string>(DEFAULT_SERVER);
    s.submit_command = node["submit_command"].as<std::string>(DEFAULT_SUBMIT_COMMAND);
    s.queue_command = node["queue_command"].as<std::string>(DEFAULT_QUEUE_COMMAND);
    s.max_poll_seconds = std::max(node["max_poll_seconds"].as<double>(DEFAULT_MAX_POLL_SECS),
                                  MIN_POLL_SECS);
    return s;
}

static RemoteConfig parse_remote_config(const YAML::Node& node) {
    RemoteConfig r;
    std::string transport = node["transport"].as<std::string>("login");
    if (transport == "login") {
        r.transport = RemoteTransport::LOGIN;
    } else if (transport == "ssh-channel") {
        r.transport = RemoteTransport::SSH_CHANNEL;
    } else {
        throw std::runtime_error("Unknown remote transport: " + transport);
    }
    r.login_command = node["login_command"].as<std::string>(DEFAULT_LOGIN_COMMAND);
    r.port = node["port"].as<int>(DEFAULT_SSH_PORT);
    r.timeout = node["timeout"].as<int>(DEFAULT_SSH_TIMEOUT_SECS);

    std::string key = node["key_path"].as<std::string>("");
    if (!key.empty()) {
        r.key_path = key;
    }
    return r;
}

static NotifyConfig parse_notify_config(const YAML::Node& node) {
    NotifyConfig n;
    n.mail_map = node["mail_map"].as<std::string>(DEFAULT_MAIL_MAP);
    n.fallback_address = node["fallback_address"].as<std::string>("");
    return n;
}

// Only the typed attributes are decoded; every other value keeps its text,
// so "should_transfer_files: YES" stays YES. A typed attribute whose text
// does not decode is kept as a string and rejected when a Job applies it.
static SettingValue scalar_to_setting(const std::string& key, const YAML::Node& node) {
    namespace keys = setting_keys;
    if (key == keys::TRANSFER_EXECUTABLE) {
        bool b;
        if (YAML::convert<bool>::decode(node, b)) return b;
    } else if (key == keys::REQUEST_CPUS || key == keys::REQUEST_MEMORY ||
               key == keys::REQUEST_DISK) {
        int i;
        if (YAML::convert<int>::decode(node, i)) return i;
    }
    return node.Scalar();
}

static SettingDefaults builtin_setting_defaults() {
    return {
        {setting_keys::UNIVERSE, std::string(DEFAULT_UNIVERSE)},
        {setting_keys::REQUEST_CPUS, DEFAULT_REQUEST_CPUS},
        {setting_keys::REQUEST_MEMORY, DEFAULT_REQUEST_MEMORY_MB},
        {setting_keys::REQUEST_DISK, DEFAULT_REQUEST_DISK_MB},
    };
}

// Configured entries override the built-in ones key by key; new keys are
// appended in file order.
static SettingDefaults parse_setting_defaults(const YAML::Node& node) {
    SettingDefaults defaults = builtin_setting_defaults();
    if (!node || node.IsNull()) return defaults;
    if (!node.IsMap()) throw std::runtime_error("defaults must be a mapping");

    for (const auto& kv : node) {
        std::string key = SubmissionSettings::canonical_key(kv.first.as<std::string>());
        if (!kv.second.IsScalar()) {
            throw std::runtime_error(fmt::format("defaults.{} must be a scalar", key));
        }
        SettingValue value = scalar_to_setting(key, kv.second);

        auto it = std::find_if(defaults.begin(), defaults.end(),
                               [&](const auto& d) { return d.first == key; });
        if (it != defaults.end()) {
            it->second = std::move(value);
        } else {
            defaults.emplace_back(key, std::move(value));
        }
    }
    return defaults;
}

Config Config::defaults() {
    Config config;
    config.scheduler_ = parse_scheduler_config(YAML::Node());
    config.remote_ = parse_remote_config(YAML::Node());
    config.notify_ = parse_notify_config(YAML::Node());
    config.defaults_ = builtin_setting_defaults();
    return config;
}

Config Config::from_node(const YAML::Node& root) {
    Config config;
    config.scheduler_ = parse_scheduler_config(root["scheduler"] ? root["scheduler"] : YAML::Node());
    config.remote_ = parse_remote_config(root["remote"] ? root["remote"] : YAML::Node());
    config.notify_ = parse_notify_config(root["notify"] ? root["notify"] : YAML::Node());
    if (root["identity"] && root["identity"].IsMap()) {
        config.user_ = root["identity"]["user"].as<std::string>("");
    }
    config.defaults_ = parse_setting_defaults(root["defaults"]);
    return config;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root.IsNull()) return Result<Config>::Ok(defaults());
        if (!root.IsMap()) return Result<Config>::Err("Config root must be a mapping");
        return Result<Config>::Ok(from_node(root));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root.IsNull()) return Result<Config>::Ok(defaults());
        if (!root.IsMap()) return Result<Config>::Err("Config root must be a mapping");
        return Result<Config>::Ok(from_node(root));
    } catch (const std::exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse config {}: {}",
                                               path.string(), e.what()));
    }
}

Result<Config> Config::load_global() {
    return load(get_global_config_path());
}
