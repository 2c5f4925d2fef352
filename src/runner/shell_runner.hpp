#pragma once

#include "command_runner.hpp"
#include <optional>
#include <string>

class SessionOperator;

// CommandRunner backed by a local /bin/sh child process. In remote mode the
// command is handed, as one quoted argument, to a login command
// ("ssh [user@]host '<command>'"), which must run non-interactively.
class ShellRunner : public CommandRunner {
public:
    // Local execution.
    ShellRunner();

    // Remote execution on `host`. An empty `user` lets the login command
    // pick its default identity (the local one). A host of "localhost"
    // (any case) means local execution.
    ShellRunner(const std::string& host, const std::string& user,
                const std::string& login_command = "ssh");

    ExecResult execute(const std::string& command,
                       const std::optional<std::string>& input = std::nullopt,
                       bool binary = false) override;

    // Launch the command and hand control to `op` until the process exits.
    // Returns the exit status.
    std::optional<int> execute_interactive(const std::string& command, SessionOperator& op);

    bool is_local() const override { return local_; }
    std::string describe() const override;

    // The command line actually given to /bin/sh.
    std::string build_command(const std::string& command) const;

    const std::string& host() const { return host_; }
    const std::string& user() const { return user_; }

private:
    bool local_ = true;
    std::string host_;
    std::string user_;
    std::string login_command_;
};
