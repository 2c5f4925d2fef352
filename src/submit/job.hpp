#pragma once

#include <chrono>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <core/config.hpp>
#include <runner/command_runner.hpp>
#include "settings.hpp"

// One Condor submission: stanzas are built up through settings() and
// enqueue(), sent together by submit(), then tracked by cluster id.
//
// All scheduler commands (and executable resolution, and the mail map
// lookup) go through the runner given at construction, which must outlive
// the job.
class Job {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    // Applies the configured setting defaults (Universe, request_*) and the
    // automatic notification address. Throws InvalidUniverseError or
    // SettingTypeError if a configured default is unacceptable.
    Job(const Config& config, CommandRunner& runner, const std::string& username);

    const std::string& username() const { return username_; }
    const std::string& server() const { return config_.scheduler().server; }

    SubmissionSettings& settings() { return settings_; }
    const SubmissionSettings& settings() const { return settings_; }

    // Where `name` lives from the runner's point of view: the name itself if
    // `ls` finds it, else what `which` prints, else (with a warning) the name.
    std::string resolve_executable(const std::string& name);

    // Resolve and set the Executable. A resolved path containing '/' turns
    // off transfer_executable. Warns when a different executable was
    // already used in this submission.
    void set_executable(const std::string& name);

    // With an address, use it. Without one (or empty), look the job's
    // identity up in the mail map, then its default entry, then the
    // configured fallback address. An unreadable map leaves it unset.
    void set_email(const std::optional<std::string>& address = std::nullopt);

    // Close the current stanza with `command_line` and "Queue" ("Queue N"
    // when times != 1). Throws BadQuotes on a stray double quote.
    void enqueue(const std::string& command_line, int times = 1);

    // Send the description to the scheduler. Returns the cluster id, or
    // nullopt (after a diagnostic on stderr) if the submit command failed.
    // Throws BadFormatError if the reply names no cluster and
    // AlreadySubmittedError on a second successful-job submit.
    std::optional<int> submit();

    // Number of processes of the cluster still in the queue.
    int poll();

    // Block until the cluster has left the queue.
    void wait();

    // Raw condor_q text for the cluster, printed to stdout and returned.
    std::string status();

    // Raw condor_q text for the cluster, handed to `formatter`.
    template <typename Formatter>
    auto status(Formatter&& formatter) -> decltype(formatter(std::string())) {
        return formatter(query_status());
    }

    // Full description (flushed stanzas plus pending attributes).
    std::string submit_description() const { return settings_.preview(); }

    // Write submit_description() to `path`. Works before and after submit().
    Result<void> save_submit_file(const std::string& path) const;

    std::optional<int> cluster() const { return cluster_; }
    bool submitted() const { return cluster_.has_value(); }

    double max_poll_seconds() const { return max_poll_seconds_; }
    // Values below MIN_POLL_SECS are raised to it.
    void set_max_poll_seconds(double seconds);

    // Replaces the sleep between wait() rounds.
    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    // Progress and replies go here (stdout by default).
    void set_output(std::ostream& out) { out_ = &out; }

    // "<Job: user@server\n<pending description>>"
    std::string describe() const;

private:
    Config config_;
    CommandRunner& runner_;
    std::string username_;
    SubmissionSettings settings_;
    std::string executable_path_;  // first executable of this submission
    std::optional<int> cluster_;
    double max_poll_seconds_;
    Sleeper sleeper_;
    std::ostream* out_ = &std::cout;

    int require_cluster(const char* operation) const;
    int count_queued();
    std::string query_status();
    void report_failure(const ExecResult& r) const;
};
