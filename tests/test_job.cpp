#include <gtest/gtest.h>
#include <submit/job.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include "fake_runner.hpp"
#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <vector>

namespace {

const char* SUBMIT_REPLY =
    "Submitting job(s).\n1 job(s) submitted to cluster 42.";

class JobTest : public ::testing::Test {
protected:
    FakeRunner runner;
    std::ostringstream out;
    std::vector<std::chrono::milliseconds> sleeps;

    std::unique_ptr<Job> make_job(const std::string& user = "alice",
                                  const Config& config = Config::defaults()) {
        auto job = std::make_unique<Job>(config, runner, user);
        job->set_output(out);
        job->set_sleeper([this](std::chrono::milliseconds ms) { sleeps.push_back(ms); });
        return job;
    }

    std::unique_ptr<Job> submitted_job() {
        runner.on("ls ", {0, ""});
        runner.on("condor_submit", {0, SUBMIT_REPLY});
        auto job = make_job();
        job->enqueue("prog");
        job->submit();
        return job;
    }
};

} // namespace

// ── Construction ────────────────────────────────────────────

TEST_F(JobTest, DefaultsApplied) {
    auto job = make_job();
    EXPECT_EQ(job->settings().universe(), "vanilla");
    EXPECT_EQ(job->settings().cpus(), 1);
    EXPECT_EQ(job->settings().memory_mb(), 1024);
    EXPECT_EQ(job->settings().disk_mb(), 32);
    EXPECT_EQ(job->username(), "alice");
    EXPECT_EQ(job->server(), "condor.cs.wlu.edu");
    EXPECT_FALSE(job->submitted());
}

TEST_F(JobTest, UnreadableMailMapLeavesEmailUnset) {
    auto job = make_job();
    EXPECT_THROW(job->settings().email(), EmptySetting);
    EXPECT_EQ(runner.commands_starting_with("cat ").size(), 1u);
}

TEST_F(JobTest, ConfiguredDefaultsFollowConfig) {
    auto config = Config::parse(
        "defaults:\n  universe: java\n  request_memory: 4096\n");
    ASSERT_TRUE(config.is_ok()) << config.error;
    auto job = make_job("alice", config.value);
    EXPECT_EQ(job->settings().universe(), "java");
    EXPECT_EQ(job->settings().memory_mb(), 4096);
    EXPECT_EQ(job->settings().cpus(), 1);
    EXPECT_EQ(job->settings().disk_mb(), 32);
}

TEST_F(JobTest, ConfiguredResourcesKeepDefaultUniverse) {
    auto config = Config::parse("defaults:\n  request_cpus: 4\n");
    ASSERT_TRUE(config.is_ok());
    auto job = make_job("alice", config.value);
    EXPECT_EQ(job->settings().universe(), "vanilla");
    EXPECT_EQ(job->settings().cpus(), 4);
}

TEST_F(JobTest, ConfiguredTransferModesReachDescriptionVerbatim) {
    runner.on("ls ", {0, ""});
    auto config = Config::parse(
        "defaults:\n"
        "  should_transfer_files: YES\n"
        "  when_to_transfer_output: ON_EXIT\n");
    ASSERT_TRUE(config.is_ok());
    auto job = make_job("alice", config.value);
    job->enqueue("prog");
    std::string text = job->submit_description();
    EXPECT_NE(text.find("should_transfer_files = YES\n"), std::string::npos);
    EXPECT_NE(text.find("when_to_transfer_output = ON_EXIT\n"), std::string::npos);
    EXPECT_EQ(text.find("True"), std::string::npos);
}

TEST_F(JobTest, BadConfiguredUniverseThrows) {
    auto config = Config::parse("defaults:\n  universe: cobol\n");
    ASSERT_TRUE(config.is_ok());
    EXPECT_THROW(make_job("alice", config.value), InvalidUniverseError);
}

TEST_F(JobTest, WronglyTypedDefaultThrows) {
    auto config = Config::parse("defaults:\n  request_cpus: lots\n");
    ASSERT_TRUE(config.is_ok());
    EXPECT_THROW(make_job("alice", config.value), SettingTypeError);
}

TEST_F(JobTest, Describe) {
    auto job = make_job();
    std::string text = job->describe();
    EXPECT_EQ(text.rfind("<Job: alice@condor.cs.wlu.edu\n", 0), 0u);
    EXPECT_NE(text.find("Universe = vanilla"), std::string::npos);
    EXPECT_EQ(text.back(), '>');
}

// ── Email lookup ────────────────────────────────────────────

TEST_F(JobTest, EmailFromMailMap) {
    runner.on("cat ", {0, "alice: alice@mail.wlu.edu\ndefault: help@wlu.edu\n"});
    auto job = make_job("alice");
    EXPECT_EQ(job->settings().email(), "alice@mail.wlu.edu");
}

TEST_F(JobTest, EmailFallsBackToDefaultEntry) {
    runner.on("cat ", {0, "alice: alice@mail.wlu.edu\ndefault: help@wlu.edu\n"});
    auto job = make_job("bob");
    EXPECT_EQ(job->settings().email(), "help@wlu.edu");
}

TEST_F(JobTest, EmailFallsBackToConfiguredAddress) {
    runner.on("cat ", {0, "alice: alice@mail.wlu.edu\n"});
    auto config = Config::parse("notify:\n  fallback_address: ops@wlu.edu\n");
    ASSERT_TRUE(config.is_ok());
    auto job = make_job("bob", config.value);
    EXPECT_EQ(job->settings().email(), "ops@wlu.edu");
}

TEST_F(JobTest, ExplicitEmailWins) {
    runner.on("cat ", {0, "alice: alice@mail.wlu.edu\n"});
    auto job = make_job("alice");
    job->set_email(std::string("me@example.com"));
    EXPECT_EQ(job->settings().email(), "me@example.com");
}

TEST_F(JobTest, MailMapPathIsQuoted) {
    make_job();
    auto cats = runner.commands_starting_with("cat ");
    ASSERT_EQ(cats.size(), 1u);
    EXPECT_EQ(cats[0], "cat '/mnt/config/scripts/mail_map.yaml'");
}

// ── Executable resolution ───────────────────────────────────

TEST_F(JobTest, ResolveExecutableFoundByLs) {
    runner.on("ls ", {0, "myprog"});
    auto job = make_job();
    EXPECT_EQ(job->resolve_executable("myprog"), "myprog");
    EXPECT_TRUE(runner.commands_starting_with("which ").empty());
}

TEST_F(JobTest, ResolveExecutableFoundByWhich) {
    runner.on("which ", {0, "/usr/bin/python3"});
    auto job = make_job();
    EXPECT_EQ(job->resolve_executable("python3"), "/usr/bin/python3");
}

TEST_F(JobTest, ResolveExecutableUnresolvedKeepsName) {
    auto job = make_job();
    EXPECT_EQ(job->resolve_executable("nowhere"), "nowhere");
}

TEST_F(JobTest, PathExecutableIsNotTransferred) {
    runner.on("which ", {0, "/usr/bin/python3"});
    auto job = make_job();
    job->set_executable("python3");
    EXPECT_EQ(job->settings().executable(), "/usr/bin/python3");
    EXPECT_FALSE(job->settings().transfer_executable());
}

TEST_F(JobTest, LocalExecutableKeepsTransferUnset) {
    runner.on("ls ", {0, ""});
    auto job = make_job();
    job->set_executable("prog");
    EXPECT_THROW(job->settings().transfer_executable(), EmptySetting);
}

// ── enqueue ─────────────────────────────────────────────────

TEST_F(JobTest, EnqueueWritesStanza) {
    runner.on("ls ", {0, ""});
    auto job = make_job();
    job->enqueue("prog a b");
    EXPECT_EQ(job->submit_description(),
              "Universe = vanilla\n"
              "request_cpus = 1\n"
              "request_memory = 1024\n"
              "request_disk = 32\n"
              "Executable = prog\n"
              "Arguments = \"a b\"\n"
              "Queue\n");
    EXPECT_TRUE(job->settings().empty());
}

TEST_F(JobTest, EnqueueRepeatCount) {
    runner.on("ls ", {0, ""});
    auto job = make_job();
    job->enqueue("prog", 3);
    std::string text = job->submit_description();
    EXPECT_NE(text.find("Queue 3\n"), std::string::npos);
    EXPECT_EQ(text.find("Arguments"), std::string::npos);
}

TEST_F(JobTest, SecondStanzaStartsEmpty) {
    runner.on("ls ", {0, ""});
    auto job = make_job();
    job->enqueue("prog 1");
    job->enqueue("prog 2");
    std::string text = job->submit_description();
    EXPECT_EQ(count_occurrences(text, "request_cpus"), 1u);
    EXPECT_EQ(count_occurrences(text, "Executable = prog"), 2u);
    EXPECT_EQ(count_occurrences(text, "Queue\n"), 2u);
}

TEST_F(JobTest, EnqueueRejectsLoneDoubleQuote) {
    runner.on("ls ", {0, ""});
    auto job = make_job();
    EXPECT_THROW(job->enqueue("echo \"a\""), BadQuotes);
}

TEST_F(JobTest, EnqueueAllowsDoubleQuoteInsideSingleQuotes) {
    runner.on("ls ", {0, ""});
    auto job = make_job();
    EXPECT_NO_THROW(job->enqueue("echo 'a\"b'"));
    EXPECT_NE(job->submit_description().find("Arguments = \"'a\"\"b'\"\n"), std::string::npos);
}

TEST_F(JobTest, EnqueueEscapedSpaceInExecutable) {
    runner.on("ls ", {0, ""});
    auto job = make_job();
    job->enqueue("my\\ prog --flag");
    EXPECT_EQ(runner.commands_starting_with("ls ").back(), "ls 'my prog'");
    EXPECT_NE(job->submit_description().find("Executable = my prog\n"), std::string::npos);
    EXPECT_NE(job->submit_description().find("Arguments = \"--flag\"\n"), std::string::npos);
}

TEST_F(JobTest, SaveSubmitFileDoesNotConsume) {
    runner.on("ls ", {0, ""});
    auto job = make_job();
    job->enqueue("prog");
    job->settings().set_output("out.txt");

    std::string path = (platform::temp_dir() / "condorjob_test_submit.sub").string();
    auto saved = job->save_submit_file(path);
    ASSERT_TRUE(saved.is_ok()) << saved.error;

    std::ifstream f(path);
    std::stringstream content;
    content << f.rdbuf();
    EXPECT_EQ(content.str(), job->submit_description());
    EXPECT_EQ(job->settings().output(), "out.txt");
    std::remove(path.c_str());
}

// ── submit ──────────────────────────────────────────────────

TEST_F(JobTest, SubmitReturnsCluster) {
    auto job = submitted_job();
    ASSERT_TRUE(job->cluster().has_value());
    EXPECT_EQ(*job->cluster(), 42);

    auto submits = runner.commands_starting_with("condor_submit");
    ASSERT_EQ(submits.size(), 1u);
    EXPECT_EQ(submits[0], "condor_submit -remote condor.cs.wlu.edu");

    const auto& call = runner.calls().back();
    ASSERT_TRUE(call.input.has_value());
    EXPECT_NE(call.input->find("Executable = prog\nQueue\n"), std::string::npos);
    EXPECT_NE(out.str().find("cluster 42"), std::string::npos);
}

TEST_F(JobTest, SubmitUsesConfiguredServer) {
    runner.on("ls ", {0, ""});
    runner.on("condor_submit", {0, SUBMIT_REPLY});
    auto job = make_job("alice", Config::defaults().set_server("submit.example.edu"));
    job->enqueue("prog");
    job->submit();
    EXPECT_EQ(runner.commands_starting_with("condor_submit")[0],
              "condor_submit -remote submit.example.edu");
}

TEST_F(JobTest, SubmitReplyWithoutClusterIsBadFormat) {
    runner.on("ls ", {0, ""});
    runner.on("condor_submit", {0, "Submitting job(s)."});
    auto job = make_job();
    job->enqueue("prog");
    EXPECT_THROW(job->submit(), BadFormatError);
    EXPECT_FALSE(job->submitted());
}

TEST_F(JobTest, SubmitFailureReturnsNothing) {
    runner.on("ls ", {0, ""});
    runner.on("condor_submit", {1, "ERROR: Failed to connect"});
    auto job = make_job();
    job->enqueue("prog");
    EXPECT_FALSE(job->submit().has_value());
    EXPECT_FALSE(job->submitted());
    EXPECT_THROW(job->poll(), SubmissionError);
}

TEST_F(JobTest, SecondSubmitThrows) {
    auto job = submitted_job();
    EXPECT_THROW(job->submit(), AlreadySubmittedError);
    EXPECT_EQ(*job->cluster(), 42);
}

TEST_F(JobTest, ClusterZeroIsSubmitted) {
    runner.on("ls ", {0, ""});
    runner.on("condor_submit", {0, "1 job(s) submitted to cluster 0."});
    auto job = make_job();
    job->enqueue("prog");
    auto cluster = job->submit();
    ASSERT_TRUE(cluster.has_value());
    EXPECT_EQ(*cluster, 0);
    runner.on("condor_q", {0, "0.0\n"});
    EXPECT_EQ(job->poll(), 1);
}

// ── poll / wait / status ────────────────────────────────────

TEST_F(JobTest, QueriesBeforeSubmitThrow) {
    auto job = make_job();
    EXPECT_THROW(job->poll(), SubmissionError);
    EXPECT_THROW(job->wait(), SubmissionError);
    EXPECT_THROW(job->status(), SubmissionError);
    EXPECT_TRUE(runner.commands_starting_with("condor_q").empty());
}

TEST_F(JobTest, PollCountsProcesses) {
    auto job = submitted_job();
    runner.on("condor_q", {0, "42.0\n42.1\n42.2\n"});
    EXPECT_EQ(job->poll(), 3);
    EXPECT_EQ(runner.calls().back().command,
              "condor_q 42 -format \"%d.\" ClusterId -format \"%d\\n\" ProcId");
}

TEST_F(JobTest, PollEmptyQueue) {
    auto job = submitted_job();
    runner.on("condor_q", {0, ""});
    EXPECT_EQ(job->poll(), 0);
}

TEST_F(JobTest, PollQueryFailureIsBadFormat) {
    auto job = submitted_job();
    runner.on("condor_q", {2, "Failed to fetch ads"});
    EXPECT_THROW(job->poll(), BadFormatError);
}

TEST_F(JobTest, WaitPollsUntilClusterLeaves) {
    auto job = submitted_job();
    runner.on("condor_q", {0, "42.0\n42.1\n"})
          .on("condor_q", {0, "42.1\n"})
          .on("condor_q", {0, ""});
    job->wait();

    EXPECT_EQ(runner.commands_starting_with("condor_q").size(), 3u);
    ASSERT_EQ(sleeps.size(), 2u);
    EXPECT_EQ(sleeps[0], std::chrono::milliseconds(1000));
    EXPECT_EQ(sleeps[1], std::chrono::milliseconds(1500));
    EXPECT_NE(out.str().find("Waiting for cluster 42 to finish.."), std::string::npos);
}

TEST_F(JobTest, WaitIntervalIsCapped) {
    auto job = submitted_job();
    job->set_max_poll_seconds(1.2);
    runner.on("condor_q", {0, "42.0\n"})
          .on("condor_q", {0, "42.0\n"})
          .on("condor_q", {0, "42.0\n"})
          .on("condor_q", {0, ""});
    job->wait();

    ASSERT_EQ(sleeps.size(), 3u);
    EXPECT_EQ(sleeps[0], std::chrono::milliseconds(1000));
    EXPECT_EQ(sleeps[1], std::chrono::milliseconds(1200));
    EXPECT_EQ(sleeps[2], std::chrono::milliseconds(1200));
}

TEST_F(JobTest, MaxPollSecondsHasPositiveFloor) {
    auto job = submitted_job();
    job->set_max_poll_seconds(0);
    EXPECT_DOUBLE_EQ(job->max_poll_seconds(), 0.1);
    runner.on("condor_q", {0, "42.0\n"}).on("condor_q", {0, ""});
    job->wait();
    ASSERT_EQ(sleeps.size(), 1u);
    EXPECT_EQ(sleeps[0], std::chrono::milliseconds(100));
}

TEST_F(JobTest, WaitOnFinishedClusterReturnsImmediately) {
    auto job = submitted_job();
    runner.on("condor_q", {0, ""});
    job->wait();
    EXPECT_TRUE(sleeps.empty());
    EXPECT_EQ(out.str().find("Waiting"), std::string::npos);
}

TEST_F(JobTest, WaitQueryFailureIsBadFormat) {
    auto job = submitted_job();
    runner.on("condor_q", {0, "42.0\n"}).on("condor_q", {1, "schedd down"});
    EXPECT_THROW(job->wait(), BadFormatError);
}

TEST_F(JobTest, StatusPrintsAndReturns) {
    auto job = submitted_job();
    runner.on("condor_q", {0, "-- Schedd: condor.cs.wlu.edu\n 42.0 alice R"});
    EXPECT_EQ(job->status(), "-- Schedd: condor.cs.wlu.edu\n 42.0 alice R");
    EXPECT_EQ(runner.calls().back().command, "condor_q 42");
    EXPECT_NE(out.str().find("42.0 alice R"), std::string::npos);
}

TEST_F(JobTest, StatusWithFormatter) {
    auto job = submitted_job();
    runner.on("condor_q", {0, "line one\nline two"});
    size_t lines = job->status([](const std::string& text) {
        return count_occurrences(text, "\n") + 1;
    });
    EXPECT_EQ(lines, 2u);
}
