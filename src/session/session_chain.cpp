#include "session/session_chain.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace agentbox::session {

SessionChain::SessionChain(const SessionExecutor& executor,
                           std::filesystem::path workspace_path,
                           std::optional<std::string> initial_token)
    : executor_(executor),
      workspace_path_(std::move(workspace_path)),
      token_(std::move(initial_token)) {}

core::errors::Result<protocol::InvocationResult> SessionChain::send(
    const std::string& prompt, const std::uint32_t timeout_ms) {
    protocol::SessionInvocation invocation;
    invocation.prompt = prompt;
    invocation.working_dir = workspace_path_;
    invocation.resume_token = token_;
    invocation.timeout_ms = timeout_ms;

    auto result = executor_.invoke(invocation);
    if (core::errors::is_error(result)) {
        LOG_WARN("Session chain kept token " + token_.value_or("<none>") + " after " +
                 core::errors::describe(core::errors::get_error(result)));
        return result;
    }

    token_ = core::errors::get_value(result).session_token;
    return result;
}

}  // namespace agentbox::session
