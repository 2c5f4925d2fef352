#pragma once

#include <string>
#include <optional>

namespace platform {

// One child process running `/bin/sh -c <command>`, with its stdin and its
// combined stdout+stderr connected to pipes owned by this object.
//
// drain() is the only call that waits for the process to exit. Output read
// by finish() is kept and handed out by the next drain().
class ChildProcess {
public:
    // Launch the command. Throws std::system_error if the OS refuses.
    static ChildProcess launch(const std::string& command);

    // A child still running at destruction is killed and reaped.
    ~ChildProcess();

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    int pid() const { return pid_; }
    const std::string& command() const { return command_; }

    // True while the OS process has not exited. Reaps it when it has.
    bool running();

    // Exit status once the process has exited: the exit code, or the
    // negated signal number if it was killed by a signal.
    std::optional<int> exit_code();

    // Send bytes to the process's stdin. Throws ProcessDeadError if stdin
    // was already closed (by drain()/finish()) or the reader has gone away.
    void write(const std::string& bytes);

    // Close stdin, wait for exit and return all output since the last drain
    // (previously saved output first), trimmed of surrounding whitespace.
    // Calling it again after exhaustion returns "" rather than failing.
    std::string drain(bool quiet = false);

    // Same as drain() but untrimmed.
    std::string drain_bytes(bool quiet = false);

    // drain() silently and keep the result for a later drain().
    void finish();

    // Non-blocking read of whatever output is available right now, waiting
    // at most timeout_ms for the first bytes.
    std::string read_available(int timeout_ms = 100);

    // SIGTERM / SIGKILL. An already-exited process is reported, not raised.
    void terminate();
    void kill();

    // "<Process (Running): cmd>" or "<Process (Retval=n): cmd>"
    std::string describe();

private:
    ChildProcess() = default;

    std::string command_;
    int pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    std::optional<int> exit_status_;
    std::string saved_output_;

    void release();
    void close_stdin();
    void close_stdout();
    std::string collect_output(bool quiet);
    void wait_for_exit();
    void send_signal(int sig, const char* label);
    void record_status(int status);
};

} // namespace platform
