#include "mail_map.hpp"
#include <core/constants.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

Result<MailLookup> lookup_mail_address(const std::string& yaml_text,
                                       const std::string& identity) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        return Result<MailLookup>::Err(fmt::format("Unreadable mail map: {}", e.what()));
    }
    if (!root.IsMap()) {
        return Result<MailLookup>::Err("Mail map is not a mapping");
    }

    try {
        if (!identity.empty() && root[identity] && root[identity].IsScalar()) {
            return Result<MailLookup>::Ok({root[identity].as<std::string>(), false});
        }
        YAML::Node fallback = root[MAIL_MAP_DEFAULT_KEY];
        if (fallback && fallback.IsScalar()) {
            return Result<MailLookup>::Ok({fallback.as<std::string>(), true});
        }
    } catch (const YAML::Exception& e) {
        return Result<MailLookup>::Err(fmt::format("Bad mail map entry: {}", e.what()));
    }
    return Result<MailLookup>::Err(fmt::format(
        "No entry for '{}' and no '{}' entry", identity, MAIL_MAP_DEFAULT_KEY));
}
