#pragma once

#include <runner/command_runner.hpp>
#include "session.hpp"

// CommandRunner that executes each command over its own libssh2 session:
// connect, authenticate, run on one exec channel, disconnect. stderr is
// merged into stdout.
class SshChannelRunner : public CommandRunner {
public:
    explicit SshChannelRunner(const SessionTarget& target) : target_(target) {}

    ExecResult execute(const std::string& command,
                       const std::optional<std::string>& input = std::nullopt,
                       bool binary = false) override;

    bool is_local() const override { return false; }
    std::string describe() const override;

private:
    SessionTarget target_;
};
