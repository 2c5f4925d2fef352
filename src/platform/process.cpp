#include "process.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <system_error>

namespace platform {

// A child that closes its stdin early must surface as EPIPE, not kill us.
static void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

// ── Lifecycle ────────────────────────────────────────────────

ChildProcess ChildProcess::launch(const std::string& command) {
    ignore_sigpipe();

    int in_pipe[2];
    int out_pipe[2];
    if (pipe2(in_pipe, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe");
    }
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close(in_pipe[0]);
        close(in_pipe[1]);
        throw std::system_error(err, std::generic_category(), "pipe");
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(in_pipe[0]);
        close(in_pipe[1]);
        close(out_pipe[0]);
        close(out_pipe[1]);
        throw std::system_error(err, std::generic_category(), "fork");
    }

    if (pid == 0) {
        // Child process: stdin from in_pipe, stdout and stderr into out_pipe
        dup2(in_pipe[0], STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);

        execl(SHELL_PATH, "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);  // exec failed
    }

    // Parent
    close(in_pipe[0]);
    close(out_pipe[1]);

    ChildProcess proc;
    proc.command_ = command;
    proc.pid_ = pid;
    proc.stdin_fd_ = in_pipe[1];
    proc.stdout_fd_ = out_pipe[0];
    cj_log(fmt::format("process {} launched: {}", pid, command));
    return proc;
}

ChildProcess::~ChildProcess() {
    release();
}

// Closes both pipes and makes sure the child is reaped, killing it first
// if it is still running.
void ChildProcess::release() {
    close_stdin();
    close_stdout();
    if (pid_ <= 0 || exit_status_) return;

    int status;
    if (waitpid(pid_, &status, WNOHANG) == pid_) {
        record_status(status);
        return;
    }
    cj_log(fmt::format("killing abandoned pid={}: {}", pid_, command_));
    ::kill(pid_, SIGKILL);
    wait_for_exit();
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : command_(std::move(other.command_)),
      pid_(other.pid_),
      stdin_fd_(other.stdin_fd_),
      stdout_fd_(other.stdout_fd_),
      exit_status_(other.exit_status_),
      saved_output_(std::move(other.saved_output_)) {
    other.pid_ = -1;
    other.stdin_fd_ = -1;
    other.stdout_fd_ = -1;
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        release();
        command_ = std::move(other.command_);
        pid_ = other.pid_;
        stdin_fd_ = other.stdin_fd_;
        stdout_fd_ = other.stdout_fd_;
        exit_status_ = other.exit_status_;
        saved_output_ = std::move(other.saved_output_);
        other.pid_ = -1;
        other.stdin_fd_ = -1;
        other.stdout_fd_ = -1;
    }
    return *this;
}

// ── Status ───────────────────────────────────────────────────

void ChildProcess::record_status(int status) {
    if (WIFEXITED(status)) {
        exit_status_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_status_ = -WTERMSIG(status);
    } else {
        exit_status_ = -1;
    }
}

bool ChildProcess::running() {
    if (exit_status_) return false;
    if (pid_ <= 0) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        record_status(status);
        return false;
    }
    if (ret < 0 && errno == ECHILD) {
        exit_status_ = -1;
        return false;
    }
    return ret == 0;  // 0 means still running
}

std::optional<int> ChildProcess::exit_code() {
    running();
    return exit_status_;
}

void ChildProcess::wait_for_exit() {
    if (exit_status_ || pid_ <= 0) return;
    int status;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    if (ret == pid_) {
        record_status(status);
    } else {
        exit_status_ = -1;
    }
}

std::string ChildProcess::describe() {
    auto code = exit_code();
    if (!code) return fmt::format("<Process (Running): {}>", command_);
    return fmt::format("<Process (Retval={}): {}>", *code, command_);
}

// ── I/O ──────────────────────────────────────────────────────

void ChildProcess::close_stdin() {
    if (stdin_fd_ >= 0) {
        close(stdin_fd_);
        stdin_fd_ = -1;
    }
}

void ChildProcess::close_stdout() {
    if (stdout_fd_ >= 0) {
        close(stdout_fd_);
        stdout_fd_ = -1;
    }
}

void ChildProcess::write(const std::string& bytes) {
    if (stdin_fd_ < 0) throw ProcessDeadError(pid_);

    size_t sent = 0;
    while (sent < bytes.size()) {
        ssize_t w = ::write(stdin_fd_, bytes.data() + sent, bytes.size() - sent);
        if (w < 0) {
            if (errno == EINTR) continue;
            if (errno == EPIPE) {
                close_stdin();
                throw ProcessDeadError(pid_);
            }
            throw std::system_error(errno, std::generic_category(), "write");
        }
        sent += static_cast<size_t>(w);
    }
}

std::string ChildProcess::collect_output(bool quiet) {
    close_stdin();

    std::string output;
    if (stdout_fd_ < 0) {
        if (!quiet) {
            cj_log(fmt::format("drain: end of output. Pid {} is probably dead.", pid_));
        }
    } else {
        char buf[PROCESS_READ_BUF_SIZE];
        while (true) {
            ssize_t n = ::read(stdout_fd_, buf, sizeof(buf));
            if (n > 0) {
                output.append(buf, static_cast<size_t>(n));
            } else if (n < 0 && errno == EINTR) {
                continue;
            } else {
                break;  // EOF or read error
            }
        }
        close_stdout();
    }

    wait_for_exit();
    return output;
}

std::string ChildProcess::drain(bool quiet) {
    std::string out = trimmed(collect_output(quiet));
    std::string result = saved_output_ + out;
    saved_output_.clear();
    return result;
}

std::string ChildProcess::drain_bytes(bool quiet) {
    std::string result = saved_output_ + collect_output(quiet);
    saved_output_.clear();
    return result;
}

void ChildProcess::finish() {
    saved_output_ += drain(true);
}

std::string ChildProcess::read_available(int timeout_ms) {
    std::string output;
    if (stdout_fd_ < 0) return output;

    char buf[PROCESS_READ_BUF_SIZE];
    int wait = timeout_ms;
    while (true) {
        struct pollfd pfd = {stdout_fd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, wait);
        if (rc < 0 && errno == EINTR) continue;
        if (rc <= 0) break;

        ssize_t n = ::read(stdout_fd_, buf, sizeof(buf));
        if (n > 0) {
            output.append(buf, static_cast<size_t>(n));
            wait = 0;  // take what is already buffered, don't wait for more
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            close_stdout();  // EOF: the process closed its output
            break;
        }
    }
    return output;
}

// ── Termination ──────────────────────────────────────────────

void ChildProcess::send_signal(int sig, const char* label) {
    if (!running()) {
        cj_warn(fmt::format("{}: pid {} is already dead.", label, pid_));
        return;
    }
    if (::kill(pid_, sig) != 0) {
        cj_warn(fmt::format("{}: pid {} could not be signalled: {}",
                            label, pid_, std::strerror(errno)));
    }
}

void ChildProcess::terminate() {
    send_signal(SIGTERM, "terminate");
}

void ChildProcess::kill() {
    send_signal(SIGKILL, "kill");
}

} // namespace platform
