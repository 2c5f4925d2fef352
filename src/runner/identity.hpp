#pragma once

#include <string>
#include <optional>
#include "command_runner.hpp"
#include <core/config.hpp>

// Lazily asks `whoami` (through the given runner) for the local identity
// and remembers the answer.
class IdentityResolver {
public:
    explicit IdentityResolver(CommandRunner& runner) : runner_(runner) {}

    // Pre-seeded identity; never shells out.
    IdentityResolver(CommandRunner& runner, std::string known)
        : runner_(runner), cached_(std::move(known)) {}

    // Empty if the lookup failed.
    const std::string& local_user();

private:
    CommandRunner& runner_;
    std::optional<std::string> cached_;
};

// The user jobs are submitted as: identity.user from the config when set,
// otherwise whoever runs the process.
std::string submission_identity(const Config& config, IdentityResolver& identity);
