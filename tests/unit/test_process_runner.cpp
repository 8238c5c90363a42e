#include <gtest/gtest.h>
#include "process_runner.h"
#include "test_helpers.h"
#include <filesystem>

namespace droidrun {
namespace {

class ProcessRunnerTest : public ::testing::Test {
protected:
    void SetUp() override { test_dir = testing_support::make_temp_dir(); }

    void TearDown() override { std::filesystem::remove_all(test_dir); }

    ProcessOptions options(int timeout_seconds = 5) {
        ProcessOptions opts;
        opts.working_dir = test_dir;
        opts.timeout = std::chrono::seconds(timeout_seconds);
        return opts;
    }

    std::string test_dir;
};

TEST_F(ProcessRunnerTest, CapturesStdoutAndStderr) {
    // Given: A command writing to both streams
    auto result = ProcessRunner::run({"/bin/sh", "-c", "echo out; echo err >&2"}, options());

    // Then: Both land in the combined transcript
    EXPECT_TRUE(result.succeeded()) << result.output;
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_NE(result.output.find("out"), std::string::npos);
    EXPECT_NE(result.output.find("err"), std::string::npos);
    EXPECT_FALSE(result.timed_out);
}

TEST_F(ProcessRunnerTest, ReportsNonZeroExit) {
    auto result = ProcessRunner::run({"/bin/sh", "-c", "echo compile error; exit 3"}, options());

    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_NE(result.output.find("compile error"), std::string::npos);
}

TEST_F(ProcessRunnerTest, RunsInWorkingDirectory) {
    auto result = ProcessRunner::run({"/bin/sh", "-c", "echo built > marker.txt"}, options());

    ASSERT_TRUE(result.succeeded()) << result.output;
    EXPECT_EQ(testing_support::read_file(std::filesystem::path(test_dir) / "marker.txt"), "built\n");
}

TEST_F(ProcessRunnerTest, PassesExtraEnvironment) {
    ProcessOptions opts = options();
    opts.environment["DROIDRUN_TEST_VALUE"] = "42";

    auto result = ProcessRunner::run({"/bin/sh", "-c", "echo value=$DROIDRUN_TEST_VALUE"}, opts);

    ASSERT_TRUE(result.succeeded());
    EXPECT_NE(result.output.find("value=42"), std::string::npos);
}

TEST_F(ProcessRunnerTest, KillsCommandPastDeadline) {
    // Given: A step that would run far longer than its limit
    auto start = std::chrono::steady_clock::now();
    auto result = ProcessRunner::run({"/bin/sh", "-c", "echo started; sleep 30"}, options(1));
    auto elapsed = std::chrono::steady_clock::now() - start;

    // Then: It is killed near the limit and flagged
    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.succeeded());
    EXPECT_LT(elapsed, std::chrono::seconds(10));
    EXPECT_NE(result.output.find("started"), std::string::npos);
}

TEST_F(ProcessRunnerTest, KillsBackgroundChildrenHoldingThePipe) {
    // The grandchild keeps stdout open; the group kill must still end the run
    auto start = std::chrono::steady_clock::now();
    auto result = ProcessRunner::run({"/bin/sh", "-c", "sleep 30 & echo parent done"}, options(1));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::seconds(10));
    EXPECT_NE(result.output.find("parent done"), std::string::npos);
}

TEST_F(ProcessRunnerTest, MissingExecutableFails) {
    auto result = ProcessRunner::run({"/nonexistent/droidrun-tool"}, options());

    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.exit_code, 127);
}

TEST_F(ProcessRunnerTest, EmptyCommandIsRejected) {
    auto result = ProcessRunner::run({}, options());
    EXPECT_FALSE(result.succeeded());
    EXPECT_FALSE(result.error_message.empty());
}

TEST_F(ProcessRunnerTest, KeepsTailOfLargeOutput) {
    ProcessOptions opts = options();
    opts.max_output_bytes = 1024;

    auto result = ProcessRunner::run(
        {"/bin/sh", "-c", "i=0; while [ $i -lt 2000 ]; do echo line$i; i=$((i+1)); done"}, opts);

    ASSERT_TRUE(result.succeeded());
    EXPECT_TRUE(result.output_truncated);
    EXPECT_LE(result.output.size(), 1024u);
    EXPECT_NE(result.output.find("line1999"), std::string::npos);
}

} // namespace
} // namespace droidrun
