#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/id_generator.hpp"
#include "core/config/runtime_config.hpp"
#include "core/errors/agent_errors.hpp"
#include "test_support.hpp"

namespace {

using agentbox::core::config::generate_workspace_id;
using agentbox::core::config::load_runtime_config;
using agentbox::core::config::parse_runtime_config;
using agentbox::core::config::RuntimeConfig;
using agentbox::core::errors::ErrorCategory;
using agentbox::core::errors::get_error;
using agentbox::core::errors::get_value;
using agentbox::core::errors::is_error;
using agentbox::core::logging::LogLevel;
using agentbox::test_support::TempDir;
using agentbox::test_support::write_text;

TEST(RuntimeConfigTest, DefaultsMatchAgentCli) {
    RuntimeConfig config;
    EXPECT_EQ(config.executor.agent_binary, "claude");
    EXPECT_EQ(config.executor.shell_flags, (std::vector<std::string>{"-ic"}));
    EXPECT_EQ(config.executor.timeout_ms, 300000u);
    EXPECT_EQ(config.retry.max_attempts, 3u);
    EXPECT_EQ(config.retry.initial_delay, std::chrono::milliseconds(1000));
    EXPECT_EQ(config.retry.max_delay, std::chrono::milliseconds(60000));
    EXPECT_TRUE(config.retry.jitter);
    EXPECT_EQ(config.workspace.base_dir.filename().string(), "agent_workspaces");
    EXPECT_FALSE(config.executor.shell.empty());
}

TEST(RuntimeConfigTest, OverridesKnownKeysAndIgnoresUnknown) {
    auto result = parse_runtime_config(R"({
        "executor": {"shell": "/bin/zsh", "agent_binary": "agent", "timeout_ms": 1000},
        "retry": {"max_attempts": 5, "initial_delay_ms": 10, "jitter": false},
        "workspace": {"base_dir": "/var/tmp/ws", "allowed_url_schemes": ["https"]},
        "log_level": "debug",
        "something_else": 1
    })");
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result);
    EXPECT_EQ(config.executor.shell, "/bin/zsh");
    EXPECT_EQ(config.executor.agent_binary, "agent");
    EXPECT_EQ(config.executor.timeout_ms, 1000u);
    EXPECT_EQ(config.retry.max_attempts, 5u);
    EXPECT_EQ(config.retry.initial_delay, std::chrono::milliseconds(10));
    EXPECT_EQ(config.retry.max_delay, std::chrono::milliseconds(60000));
    EXPECT_FALSE(config.retry.jitter);
    EXPECT_EQ(config.workspace.base_dir, std::filesystem::path("/var/tmp/ws"));
    EXPECT_EQ(config.workspace.allowed_url_schemes, (std::vector<std::string>{"https"}));
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
}

TEST(RuntimeConfigTest, WrongTypeIsInvalidConfig) {
    auto result = parse_runtime_config(R"({"retry": {"max_attempts": "three"}})");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Validation);
    EXPECT_EQ(get_error(result).code, "invalid_config");
}

TEST(RuntimeConfigTest, RejectsBadValues) {
    EXPECT_TRUE(is_error(parse_runtime_config("not json")));
    EXPECT_TRUE(is_error(parse_runtime_config(R"({"log_level": "loud"})")));
    EXPECT_TRUE(is_error(parse_runtime_config(R"({"retry": {"backoff_base": 0.5}})")));
    EXPECT_TRUE(is_error(parse_runtime_config(R"({"executor": {"agent_binary": ""}})")));
}

TEST(RuntimeConfigTest, LoadsFromFile) {
    TempDir dir("config");
    const auto path = dir.root() / "agentbox.json";
    write_text(path, R"({"workspace": {"git_binary": "/usr/local/bin/git"}})");

    auto result = load_runtime_config(path);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).workspace.git_binary, "/usr/local/bin/git");

    auto missing = load_runtime_config(dir.root() / "missing.json");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).path, (dir.root() / "missing.json").string());
}

TEST(RuntimeConfigTest, GeneratedWorkspaceIdsHavePrefix) {
    const auto first = generate_workspace_id();
    const auto second = generate_workspace_id();
    EXPECT_EQ(first.rfind("agent_", 0), 0u);
    EXPECT_EQ(first.size(), 14u);
    EXPECT_NE(first, second);
}

}  // namespace
