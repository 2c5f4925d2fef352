#include <gtest/gtest.h>
#include <runner/shell_runner.hpp>

TEST(ShellRunner, LocalByDefault) {
    ShellRunner sh;
    EXPECT_TRUE(sh.is_local());
    EXPECT_EQ(sh.describe(), "<Shell: local machine>");
    EXPECT_EQ(sh.build_command("whoami"), "whoami");
}

TEST(ShellRunner, LocalhostIsLocal) {
    ShellRunner sh("LocalHost", "alice");
    EXPECT_TRUE(sh.is_local());
    EXPECT_EQ(sh.build_command("ls"), "ls");
}

TEST(ShellRunner, RemoteCommandIsQuotedForLogin) {
    ShellRunner sh("condor.cs.wlu.edu", "alice");
    EXPECT_FALSE(sh.is_local());
    EXPECT_EQ(sh.describe(), "<Shell: alice@condor.cs.wlu.edu>");
    EXPECT_EQ(sh.build_command("condor_q 42 -format \"%d.\" ClusterId"),
              "ssh alice@condor.cs.wlu.edu 'condor_q 42 -format \"%d.\" ClusterId'");
}

TEST(ShellRunner, RemoteEscapesSingleQuotes) {
    ShellRunner sh("host", "", "ssh -o BatchMode=yes");
    EXPECT_EQ(sh.describe(), "<Shell: host>");
    EXPECT_EQ(sh.build_command("echo 'hi'"), "ssh -o BatchMode=yes host 'echo '\\''hi'\\'''");
}

TEST(ShellRunner, ExitCodeMatchesProcess) {
    ShellRunner sh;
    for (int code : {0, 1, 7, 255}) {
        auto r = sh.execute("exit " + std::to_string(code));
        EXPECT_EQ(r.exit_code, code);
    }
}

TEST(ShellRunner, OutputTrimmed) {
    ShellRunner sh;
    auto r = sh.execute("echo '  spaced  '");
    EXPECT_TRUE(r.success());
    EXPECT_EQ(r.output, "spaced");
}

TEST(ShellRunner, InputFedToStdin) {
    ShellRunner sh;
    auto r = sh.execute("cat", std::string("Hello from stdin\n"));
    EXPECT_EQ(r.output, "Hello from stdin");
}

TEST(ShellRunner, BinaryKeepsBytes) {
    ShellRunner sh;
    auto r = sh.execute("printf 'a\\0b\\n'", std::nullopt, true);
    EXPECT_EQ(r.output, std::string("a\0b\n", 4));
}

TEST(ShellRunner, InputIgnoredByExitingCommand) {
    ShellRunner sh;
    auto r = sh.execute("exit 4", std::string(1 << 20, 'x'));
    EXPECT_EQ(r.exit_code, 4);
}

// Remote mode through a stand-in login command that just runs its last
// argument locally.
TEST(ShellRunner, RemoteRoundTripThroughLoginCommand) {
    ShellRunner sh("cluster", "alice", "sh -c 'shift; eval \"$1\"' login");
    auto r = sh.execute("echo \"it's $((6 * 7))\"");
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_EQ(r.output, "it's 42");
}
