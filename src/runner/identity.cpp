#include "identity.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>

const std::string& IdentityResolver::local_user() {
    if (!cached_) {
        auto r = runner_.execute("whoami");
        if (r.success()) {
            cached_ = trimmed(r.output);
        } else {
            cj_log(fmt::format("whoami failed (exit {}): {}", r.exit_code, r.output));
            cached_ = std::string();
        }
    }
    return *cached_;
}

std::string submission_identity(const Config& config, IdentityResolver& identity) {
    if (!config.user().empty()) return config.user();
    return identity.local_user();
}
