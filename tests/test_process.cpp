#include <gtest/gtest.h>
#include <platform/process.hpp>
#include <core/utils.hpp>
#include <filesystem>
#include <fstream>
#include <signal.h>
#include <unistd.h>

namespace fs = std::filesystem;

class ProcessTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
            ("hubwarden_process_test_" + std::to_string(getpid()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(ProcessTest, ExitCodeIsReported) {
    auto r = platform::spawn("/bin/sh", {"-c", "exit 3"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.valid());
    EXPECT_GT(r.value.pid(), 0);
    EXPECT_EQ(r.value.wait(), 3);
    EXPECT_TRUE(r.value.exited());
    // A second wait returns the cached status.
    EXPECT_EQ(r.value.wait(), 3);
}

TEST_F(ProcessTest, ProgramIsResolvedOnPath) {
    auto r = platform::spawn("sh", {"-c", "exit 0"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.wait(), 0);
}

TEST_F(ProcessTest, SignalDeathIsReportedShellStyle) {
    auto r = platform::spawn("/bin/sh", {"-c", "sleep 30"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    kill(r.value.pid(), SIGKILL);
    EXPECT_EQ(r.value.wait(), 128 + SIGKILL);
}

TEST_F(ProcessTest, WaitWithTimeoutOnRunningChild) {
    auto r = platform::spawn("/bin/sh", {"-c", "sleep 30"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.wait(50), -1);
    EXPECT_FALSE(r.value.exited());
    kill(r.value.pid(), SIGKILL);
    EXPECT_EQ(r.value.wait(), 128 + SIGKILL);
}

TEST_F(ProcessTest, MissingProgramIsAnError) {
    auto r = platform::spawn("hubwarden-no-such-program", {});
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("not found"), std::string::npos);
    EXPECT_FALSE(r.value.valid());
}

TEST_F(ProcessTest, NonExecutablePathIsAnError) {
    auto script = test_dir / "not_executable.sh";
    std::ofstream(script) << "#!/bin/sh\nexit 0\n";
    fs::permissions(script, fs::perms::owner_read | fs::perms::owner_write);

    auto r = platform::spawn(script.string(), {});
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("exec"), std::string::npos);
}

TEST_F(ProcessTest, BadWorkdirIsAnError) {
    platform::SpawnOptions opts;
    opts.workdir = (test_dir / "missing").string();
    auto r = platform::spawn("/bin/sh", {"-c", "exit 0"}, opts);
    EXPECT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("chdir"), std::string::npos);
}

TEST_F(ProcessTest, OutputGoesToLogFile) {
    platform::SpawnOptions opts;
    opts.output_log = (test_dir / "out.log").string();
    auto r = platform::spawn("/bin/sh", {"-c", "echo to-stdout; echo to-stderr >&2"}, opts);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.wait(), 0);

    std::string log = read_file(opts.output_log);
    EXPECT_NE(log.find("to-stdout"), std::string::npos);
    EXPECT_NE(log.find("to-stderr"), std::string::npos);
}

TEST_F(ProcessTest, WorkdirAndEnvironmentAreApplied) {
    platform::SpawnOptions opts;
    opts.workdir = test_dir.string();
    opts.output_log = (test_dir / "env.log").string();
    opts.environment["HUBWARDEN_TEST_VAR"] = "present";
    auto r = platform::spawn("/bin/sh", {"-c", "pwd; echo $HUBWARDEN_TEST_VAR"}, opts);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.wait(), 0);

    std::string log = read_file(opts.output_log);
    EXPECT_NE(log.find(fs::canonical(test_dir).string()), std::string::npos);
    EXPECT_NE(log.find("present"), std::string::npos);
}

TEST_F(ProcessTest, DetachedChildLeadsItsOwnSession) {
    platform::SpawnOptions opts;
    opts.detach = true;
    auto r = platform::spawn("/bin/sh", {"-c", "sleep 30"}, opts);
    ASSERT_TRUE(r.is_ok()) << r.error;

    int pid = r.value.pid();
    // setsid() runs before exec, so the session exists once spawn returns.
    EXPECT_EQ(getsid(pid), pid);
    EXPECT_NE(getsid(pid), getsid(0));

    kill(pid, SIGKILL);
    r.value.wait();
}

TEST_F(ProcessTest, MoveTransfersOwnership) {
    auto r = platform::spawn("/bin/sh", {"-c", "exit 5"});
    ASSERT_TRUE(r.is_ok()) << r.error;
    platform::ProcessHandle moved = std::move(r.value);
    EXPECT_FALSE(r.value.valid());
    EXPECT_TRUE(moved.valid());
    EXPECT_EQ(moved.wait(), 5);
}
