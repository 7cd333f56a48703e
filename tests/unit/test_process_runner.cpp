#include <string>
#include <gtest/gtest.h>
#include "core/errors/agent_errors.hpp"
#include "core/process/process_runner.hpp"
#include "test_support.hpp"

namespace {

using agentbox::core::errors::get_error;
using agentbox::core::errors::get_value;
using agentbox::core::errors::is_error;
using agentbox::core::process::join_shell_command;
using agentbox::core::process::ProcessSpec;
using agentbox::core::process::run_process;
using agentbox::core::process::shell_quote;
using agentbox::test_support::TempDir;

TEST(ProcessRunnerTest, CapturesStdoutStderrAndExitCode) {
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", "echo out; echo err >&2; exit 3"};
    spec.timeout_ms = 5000;

    auto result = run_process(spec);
    ASSERT_FALSE(is_error(result));
    const auto& capture = get_value(result);
    EXPECT_EQ(capture.exit_code, 3);
    EXPECT_FALSE(capture.timed_out);
    EXPECT_EQ(capture.stdout_text, "out\n");
    EXPECT_EQ(capture.stderr_text, "err\n");
}

TEST(ProcessRunnerTest, RunsInWorkingDirectory) {
    TempDir dir("process");
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", "pwd -P"};
    spec.working_directory = dir.root();

    auto result = run_process(spec);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_text, dir.root().string() + "\n");
}

TEST(ProcessRunnerTest, TimeoutKillsProcessGroup) {
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", "sleep 30 & sleep 30; echo never"};
    spec.timeout_ms = 200;

    auto result = run_process(spec);
    ASSERT_FALSE(is_error(result));
    const auto& capture = get_value(result);
    EXPECT_TRUE(capture.timed_out);
    EXPECT_EQ(capture.stdout_text.find("never"), std::string::npos);
    EXPECT_LT(capture.duration_ms, 10000.0);
}

TEST(ProcessRunnerTest, MissingBinaryExits127) {
    ProcessSpec spec;
    spec.argv = {"/nonexistent/agentbox-binary"};

    auto result = run_process(spec);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 127);
}

TEST(ProcessRunnerTest, EmptyArgvIsRejected) {
    auto result = run_process(ProcessSpec{});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_process_spec");
}

TEST(ProcessRunnerTest, ShellQuotingSurvivesShell) {
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");

    const std::string tricky = "a 'quoted' $HOME `date` \"x\"\nnext";
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", join_shell_command({"printf", "%s", tricky})};

    auto result = run_process(spec);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_text, tricky);
}

}  // namespace
