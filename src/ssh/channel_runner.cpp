#include "channel_runner.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <libssh2.h>

static ExecResult run_on_channel(LIBSSH2_SESSION* ssh, const std::string& command,
                                 const std::optional<std::string>& input) {
    LIBSSH2_CHANNEL* ch = libssh2_channel_open_session(ssh);
    if (!ch) return ExecResult{-1, "Failed to open SSH exec channel"};

    libssh2_channel_handle_extended_data2(ch, LIBSSH2_CHANNEL_EXTENDED_DATA_MERGE);

    if (libssh2_channel_exec(ch, command.c_str()) != 0) {
        libssh2_channel_free(ch);
        return ExecResult{-1, "Failed to exec: " + command};
    }

    if (input) {
        size_t sent = 0;
        while (sent < input->size()) {
            ssize_t w = libssh2_channel_write(ch, input->data() + sent, input->size() - sent);
            if (w < 0) {
                libssh2_channel_close(ch);
                libssh2_channel_free(ch);
                return ExecResult{-1, "Channel write error sending input"};
            }
            sent += static_cast<size_t>(w);
        }
    }

    // Close stdin (send EOF) so the remote command knows input is done
    libssh2_channel_send_eof(ch);

    std::string output;
    char buf[SSH_READ_BUF_SIZE];
    while (true) {
        ssize_t n = libssh2_channel_read(ch, buf, sizeof(buf));
        if (n > 0) {
            output.append(buf, static_cast<size_t>(n));
        } else {
            break;  // 0 = EOF, negative = error
        }
    }

    int exit_status = -1;
    if (libssh2_channel_close(ch) == 0 && libssh2_channel_wait_closed(ch) == 0) {
        exit_status = libssh2_channel_get_exit_status(ch);
    }
    libssh2_channel_free(ch);

    return ExecResult{exit_status, output};
}

std::string SshChannelRunner::describe() const {
    return fmt::format("<Shell: {}@{}>", target_.user, target_.host);
}

ExecResult SshChannelRunner::execute(const std::string& command,
                                     const std::optional<std::string>& input,
                                     bool binary) {
    SessionManager session(target_);
    auto established = session.establish();
    if (established.is_err()) {
        ExecResult failed{-1, established.error};
        cj_log_exec("ssh-channel", command, failed);
        return failed;
    }

    ExecResult result = run_on_channel(session.get_raw_session(), command, input);
    session.close();

    if (!binary) trim(result.output);
    cj_log_exec("ssh-channel", command, result);
    return result;
}
