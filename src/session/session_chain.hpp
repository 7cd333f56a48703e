#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/agent_errors.hpp"
#include "protocol/invocation_contract.hpp"
#include "session/session_executor.hpp"

namespace agentbox::session {

// One conversation in one workspace. Each send resumes from the token of the
// last successful send; a failed send leaves the token where it was.
class SessionChain {
public:
    SessionChain(const SessionExecutor& executor, std::filesystem::path workspace_path,
                 std::optional<std::string> initial_token = std::nullopt);

    core::errors::Result<protocol::InvocationResult> send(const std::string& prompt,
                                                          std::uint32_t timeout_ms = 300000);

    const std::optional<std::string>& current_token() const { return token_; }

    // The next send starts a new conversation.
    void reset() { token_.reset(); }

    const std::filesystem::path& workspace_path() const { return workspace_path_; }

private:
    const SessionExecutor& executor_;
    std::filesystem::path workspace_path_;
    std::optional<std::string> token_;
};

}  // namespace agentbox::session
