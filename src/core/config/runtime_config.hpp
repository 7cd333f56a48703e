#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"
#include "core/retry/retry_policy.hpp"

namespace agentbox::core::config {

    // $SHELL, or /bin/bash when unset.
    std::string default_shell();

    struct ExecutorConfig {
        std::string shell = default_shell();
        // Interactive so aliases and shell functions defining the agent resolve.
        std::vector<std::string> shell_flags = {"-ic"};
        std::string agent_binary = "claude";
        std::string permission_flag = "--dangerously-skip-permissions";
        std::uint32_t timeout_ms = 300000;
        bool debug = false;
    };

    struct WorkspaceConfig {
        std::filesystem::path base_dir =
            std::filesystem::temp_directory_path() / "agent_workspaces";
        std::string git_binary = "git";
        std::string tar_binary = "tar";
        std::uint32_t clone_timeout_ms = 600000;
        std::vector<std::string> allowed_url_schemes = {"https", "http"};
    };

    struct RuntimeConfig {
        ExecutorConfig executor;
        retry::RetryPolicy retry;
        WorkspaceConfig workspace;
        logging::LogLevel log_level = logging::LogLevel::INFO;
    };

    // Reads a JSON document shaped like
    //   {"executor": {...}, "retry": {...}, "workspace": {...}, "log_level": "info"}
    // Missing keys keep their defaults; unknown keys are ignored.
    errors::Result<RuntimeConfig> parse_runtime_config(const std::string& json_text);

    errors::Result<RuntimeConfig> load_runtime_config(const std::filesystem::path& path);

}  // namespace agentbox::core::config
