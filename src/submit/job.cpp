#include "job.hpp"
#include "command_line.hpp"
#include "mail_map.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <regex>

Job::Job(const Config& config, CommandRunner& runner, const std::string& username)
    : config_(config),
      runner_(runner),
      username_(username),
      max_poll_seconds_(std::max(config.scheduler().max_poll_seconds, MIN_POLL_SECS)),
      sleeper_([](std::chrono::milliseconds ms) {
          platform::sleep_ms(static_cast<int>(ms.count()));
      }) {
    for (const auto& [key, value] : config_.setting_defaults()) {
        settings_.set_value(key, value);
    }
    set_email();
}

void Job::set_max_poll_seconds(double seconds) {
    max_poll_seconds_ = std::max(seconds, MIN_POLL_SECS);
}

std::string Job::describe() const {
    return fmt::format("<Job: {}@{}\n{}>", username_, server(), trimmed(settings_.preview()));
}

// ── Building ────────────────────────────────────────────────

std::string Job::resolve_executable(const std::string& name) {
    std::string quoted = shell_quote(name);
    if (runner_.execute("ls " + quoted).success()) {
        return name;
    }
    auto which = runner_.execute("which " + quoted);
    if (which.success() && !which.output.empty()) {
        return which.output;
    }
    cj_warn(fmt::format("Could not find Executable: {}", name));
    return name;
}

void Job::set_executable(const std::string& name) {
    std::string path = resolve_executable(name);

    // "\/" is an escaped slash inside a name, not a directory separator
    std::string unescaped = path;
    for (size_t pos; (pos = unescaped.find("\\/")) != std::string::npos;) {
        unescaped.erase(pos, 2);
    }
    if (unescaped.find('/') != std::string::npos) {
        settings_.set_transfer_executable(false);
    }

    if (executable_path_.empty()) {
        executable_path_ = path;
    } else if (executable_path_ != path) {
        cj_warn("Generally speaking, only one executable should be used per submission.");
    }
    settings_.set_executable(path);
}

void Job::set_email(const std::optional<std::string>& address) {
    if (address && !address->empty()) {
        settings_.set_email(*address);
        return;
    }

    const auto& notify = config_.notify();
    if (notify.mail_map.empty()) {
        if (!notify.fallback_address.empty()) settings_.set_email(notify.fallback_address);
        return;
    }

    auto r = runner_.execute("cat " + shell_quote(notify.mail_map));
    if (r.failed()) {
        cj_log(fmt::format("Mail map {} unreadable (exit {}), notify_user left unset",
                           notify.mail_map, r.exit_code));
        return;
    }

    auto found = lookup_mail_address(r.output, username_);
    if (found.is_ok()) {
        if (found.value.used_default) {
            std::cerr << fmt::format("Note: {} not in email mapping.  Using a default value.",
                                     username_) << std::endl;
        }
        settings_.set_email(found.value.address);
        return;
    }

    cj_log(fmt::format("Mail map lookup for '{}': {}", username_, found.error));
    if (!notify.fallback_address.empty()) {
        settings_.set_email(notify.fallback_address);
    }
}

void Job::enqueue(const std::string& command_line, int times) {
    CommandParts parts = split_command_line(command_line);

    set_executable(parts.executable);
    if (!parts.arguments.empty()) {
        settings_.set_arguments(parts.arguments);
    }

    settings_.flush();
    settings_.append_directive(times != 1 ? fmt::format("Queue {}", times) : "Queue");
}

Result<void> Job::save_submit_file(const std::string& path) const {
    std::ofstream f(path, std::ios::trunc);
    if (!f) {
        return Result<void>::Err("Cannot open " + path + " for writing");
    }
    f << submit_description();
    if (!f) {
        return Result<void>::Err("Failed writing " + path);
    }
    return Result<void>::Ok();
}

// ── Scheduler interaction ───────────────────────────────────

void Job::report_failure(const ExecResult& r) const {
    std::cerr << fmt::format("ERROR #{}: {}", r.exit_code, r.output) << std::endl;
}

std::optional<int> Job::submit() {
    if (cluster_) throw AlreadySubmittedError(*cluster_);

    const auto& sched = config_.scheduler();
    std::string cmd = fmt::format("{} -remote {}", sched.submit_command, sched.server);
    std::string description = settings_.flush();

    auto r = runner_.execute(cmd, description);
    if (r.failed()) {
        report_failure(r);
        std::cerr << fmt::format("WARNING: Since '{}' returned an error, your job was "
                                 "probably not submitted.  If your job submitted after "
                                 "all, this object will still not be able to monitor "
                                 "its status.", sched.submit_command)
                  << std::endl;
        return std::nullopt;
    }

    *out_ << r.output << std::endl;

    static const std::regex cluster_re("cluster (\\d+)");
    std::smatch m;
    if (!std::regex_search(r.output, m, cluster_re)) {
        throw BadFormatError(sched.submit_command);
    }
    int id = safe_stoi(m[1].str(), -1);
    if (id < 0) throw BadFormatError(sched.submit_command);

    cluster_ = id;
    append_cluster_log(id, fmt::format("submitted by {} to {}\n{}{}",
                                       username_, sched.server, description, r.output));
    cj_log(fmt::format("Submitted cluster {} as {}@{}", id, username_, sched.server));
    return cluster_;
}

int Job::require_cluster(const char* operation) const {
    if (!cluster_) throw SubmissionError(operation);
    return *cluster_;
}

// One "<cluster>.<proc>" line per process still queued.
int Job::count_queued() {
    int id = *cluster_;
    const auto& sched = config_.scheduler();
    auto r = runner_.execute(fmt::format(
        "{} {} -format \"%d.\" ClusterId -format \"%d\\n\" ProcId", sched.queue_command, id));
    if (r.failed()) {
        report_failure(r);
        throw BadFormatError(sched.queue_command);
    }
    return static_cast<int>(count_occurrences(r.output, fmt::format("{}.", id)));
}

std::string Job::query_status() {
    int id = require_cluster("status()");
    const auto& sched = config_.scheduler();
    auto r = runner_.execute(fmt::format("{} {}", sched.queue_command, id));
    if (r.failed()) {
        report_failure(r);
        throw BadFormatError(sched.queue_command);
    }
    return r.output;
}

int Job::poll() {
    require_cluster("poll()");
    return count_queued();
}

void Job::wait() {
    int id = require_cluster("wait()");
    std::string started = now_iso();

    int queued = count_queued();
    bool announced = queued > 0;
    if (announced) {
        *out_ << fmt::format("Waiting for cluster {} to finish", id) << std::flush;
    }

    double interval = WAIT_INITIAL_POLL_SECS;
    while (queued > 0) {
        *out_ << '.' << std::flush;
        double secs = std::min(interval, max_poll_seconds_);
        sleeper_(std::chrono::milliseconds(static_cast<long long>(secs * 1000)));
        interval += WAIT_POLL_STEP_SECS;
        queued = count_queued();
    }
    if (announced) *out_ << std::endl;

    append_cluster_log(id, fmt::format("left the queue after {}", format_duration(started)));
}

std::string Job::status() {
    std::string text = query_status();
    *out_ << text << std::endl;
    return text;
}
