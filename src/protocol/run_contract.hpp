#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/resource_mapping.hpp"

namespace agentbox::protocol {

// Everything needed for one staged run: inputs, prompt, outputs, policy.
struct RunRequest {
    std::string prompt;
    std::optional<std::string> system_prompt;
    std::optional<std::string> workspace_id; // generated when absent
    std::optional<std::string> resume_token;

    std::vector<FileMapping> input_files;
    std::vector<FolderMapping> input_folders;
    std::vector<GitRepoMapping> input_repos;

    std::vector<OutputMapping> output_files;
    std::vector<OutputMapping> output_folders;

    std::uint32_t timeout_ms = 300000;
    bool cleanup = true; // false keeps the workspace as persistent
    bool debug = false;
};

struct HarvestedPath {
    std::string name;
    std::string source_relative;
    std::filesystem::path destination;
};

struct RunOutcome {
    bool success = false;
    std::string session_token;
    std::string result_text;
    double cost_usd = 0.0;
    std::vector<HarvestedPath> files_copied;
    std::vector<HarvestedPath> folders_copied;
    std::vector<std::string> missing_outputs;
    std::filesystem::path workspace_path;
    std::optional<core::errors::AgentError> error;
};

}  // namespace agentbox::protocol
