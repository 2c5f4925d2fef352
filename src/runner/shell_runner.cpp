#include "shell_runner.hpp"
#include "interactive_session.hpp"
#include <platform/process.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

static bool is_localhost(const std::string& host) {
    std::string lower = host;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower.empty() || lower == "localhost";
}

ShellRunner::ShellRunner() = default;

ShellRunner::ShellRunner(const std::string& host, const std::string& user,
                         const std::string& login_command)
    : local_(is_localhost(host)) {
    if (!local_) {
        host_ = host;
        user_ = user;
        login_command_ = login_command;
    }
}

std::string ShellRunner::build_command(const std::string& command) const {
    if (local_) return command;

    std::string target = user_.empty() ? host_ : user_ + "@" + host_;
    return fmt::format("{} {} {}", login_command_, target, shell_quote(command));
}

std::string ShellRunner::describe() const {
    if (local_) return "<Shell: local machine>";
    if (user_.empty()) return fmt::format("<Shell: {}>", host_);
    return fmt::format("<Shell: {}@{}>", user_, host_);
}

ExecResult ShellRunner::execute(const std::string& command,
                                const std::optional<std::string>& input,
                                bool binary) {
    std::string full = build_command(command);
    auto proc = platform::ChildProcess::launch(full);
    if (input) {
        try {
            proc.write(*input);
        } catch (const ProcessDeadError& e) {
            // Exited without reading all of its input; the exit code says why.
            cj_log(fmt::format("shell: {}", e.what()));
        }
    }
    std::string output = binary ? proc.drain_bytes() : proc.drain();

    ExecResult result{proc.exit_code().value_or(-1), std::move(output)};
    cj_log_exec("shell", full, result);
    return result;
}

std::optional<int> ShellRunner::execute_interactive(const std::string& command,
                                                    SessionOperator& op) {
    auto proc = platform::ChildProcess::launch(build_command(command));
    InteractiveSession session(proc, op);
    session.run();
    return proc.exit_code();
}
