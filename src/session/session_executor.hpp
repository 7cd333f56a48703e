#pragma once

#include <future>
#include <optional>
#include <string>
#include <vector>
#include "core/config/runtime_config.hpp"
#include "core/errors/agent_errors.hpp"
#include "core/process/process_runner.hpp"
#include "core/retry/retry_policy.hpp"
#include "protocol/invocation_contract.hpp"

namespace agentbox::session {

// "<system_prompt>\n\n<prompt>", or prompt alone.
std::string compose_prompt(const std::string& prompt,
                           const std::optional<std::string>& system_prompt);

class SessionExecutor {
public:
    explicit SessionExecutor(core::config::ExecutorConfig config = {},
                             core::retry::RetryPolicy policy = {},
                             core::retry::SuspendFn suspend = core::retry::thread_sleep);

    // One logical call: invoke_once under the retry policy. Session errors
    // come back on the first failure.
    core::errors::Result<protocol::InvocationResult> invoke(
        const protocol::SessionInvocation& invocation) const;

    // Runs invoke() on a worker thread. The executor must outlive the future.
    std::future<core::errors::Result<protocol::InvocationResult>> invoke_async(
        protocol::SessionInvocation invocation) const;

    // A single process launch with no retry.
    core::errors::Result<protocol::InvocationResult> invoke_once(
        const protocol::SessionInvocation& invocation) const;

    // Agent argv, before shell quoting.
    std::vector<std::string> build_command(const protocol::SessionInvocation& invocation) const;

    core::process::ProcessSpec build_process_spec(
        const protocol::SessionInvocation& invocation) const;

    // Maps a non-zero exit to a Session or Execution error from stderr.
    static core::errors::AgentError classify_failure(
        int exit_code, const std::string& stderr_text,
        const std::optional<std::string>& resume_token);

    const core::config::ExecutorConfig& config() const { return config_; }
    const core::retry::RetryPolicy& retry_policy() const { return policy_; }

private:
    core::config::ExecutorConfig config_;
    core::retry::RetryPolicy policy_;
    core::retry::SuspendFn suspend_;
};

}  // namespace agentbox::session
