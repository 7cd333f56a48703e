#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/run_contract.hpp"
#include "session/session_executor.hpp"
#include "workspace/workspace_manager.hpp"

namespace agentbox::runtime {

struct OutputVerification {
    bool all_found = false;
    // "file: <name>", "folder: <name>", "file at destination: <path>", ...
    std::vector<std::string> missing;
};

// create workspace -> invoke agent -> harvest outputs -> cleanup, as one call.
// Both collaborators must outlive the coordinator.
class AgentRunCoordinator {
public:
    AgentRunCoordinator(workspace::WorkspaceManager& workspaces,
                        const session::SessionExecutor& executor);

    // Never throws and never returns a bare error: failures land in
    // RunOutcome::error with success == false.
    protocol::RunOutcome run_with_io(const protocol::RunRequest& request);

private:
    core::errors::Status validate_outputs(const protocol::RunRequest& request) const;

    void harvest_files(const std::filesystem::path& root,
                       const std::vector<protocol::OutputMapping>& outputs,
                       protocol::RunOutcome& outcome) const;

    void harvest_folders(const std::filesystem::path& root,
                         const std::vector<protocol::OutputMapping>& outputs,
                         protocol::RunOutcome& outcome) const;

    void release(const std::string& workspace_id);

    workspace::WorkspaceManager& workspaces_;
    const session::SessionExecutor& executor_;
};

OutputVerification verify_outputs(const protocol::RunOutcome& outcome,
                                  const std::vector<std::string>& expected_files,
                                  const std::vector<std::string>& expected_folders);

}  // namespace agentbox::runtime
