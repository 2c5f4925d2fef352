#include "runner_factory.hpp"
#include "shell_runner.hpp"
#include <ssh/channel_runner.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

std::unique_ptr<CommandRunner> make_submit_runner(const Config& config,
                                                  const std::string& username,
                                                  CommandRunner& local,
                                                  IdentityResolver& identity) {
    const auto& sched = config.scheduler();
    bool have_submit = local.execute("which " + sched.submit_command).success();

    if (have_submit && username == identity.local_user()) {
        cj_log(fmt::format("submit runner: local ({} found)", sched.submit_command));
        return std::make_unique<ShellRunner>();
    }

    const auto& remote = config.remote();
    if (remote.transport == RemoteTransport::SSH_CHANNEL) {
        SessionTarget target;
        target.host = sched.server;
        target.user = username;
        target.port = remote.port;
        target.timeout = remote.timeout;
        target.ssh_key_path = remote.key_path;
        cj_log(fmt::format("submit runner: ssh channel to {}@{}", username, sched.server));
        return std::make_unique<SshChannelRunner>(target);
    }

    cj_log(fmt::format("submit runner: {} {}@{}", remote.login_command, username, sched.server));
    return std::make_unique<ShellRunner>(sched.server, username, remote.login_command);
}
