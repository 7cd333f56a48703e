#include "session/session_executor.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <initializer_list>
#include <utility>
#include "core/logging/logger.hpp"
#include "session/output_extractor.hpp"

namespace agentbox::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::InvocationResult;
using protocol::SessionInvocation;

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

bool contains_any(const std::string& haystack, std::initializer_list<const char*> needles) {
    return std::any_of(needles.begin(), needles.end(), [&haystack](const char* needle) {
        return haystack.find(needle) != std::string::npos;
    });
}

AgentError with_token(AgentError error, const std::optional<std::string>& token) {
    if (token.has_value() && error.session_token.empty()) {
        error.session_token = token.value();
    }
    return error;
}

}  // namespace

std::string compose_prompt(const std::string& prompt,
                           const std::optional<std::string>& system_prompt) {
    if (!system_prompt.has_value() || system_prompt->empty()) {
        return prompt;
    }
    return system_prompt.value() + "\n\n" + prompt;
}

SessionExecutor::SessionExecutor(core::config::ExecutorConfig config,
                                 core::retry::RetryPolicy policy,
                                 core::retry::SuspendFn suspend)
    : config_(std::move(config)), policy_(std::move(policy)), suspend_(std::move(suspend)) {}

std::vector<std::string> SessionExecutor::build_command(
    const SessionInvocation& invocation) const {
    std::vector<std::string> args = {config_.agent_binary};
    if (!config_.permission_flag.empty()) {
        args.push_back(config_.permission_flag);
    }
    args.insert(args.end(), {"-p", invocation.prompt, "--output-format", "json"});
    if (invocation.debug || config_.debug) {
        args.push_back("--debug");
    }
    if (invocation.resume_token.has_value()) {
        args.push_back("-r");
        args.push_back(invocation.resume_token.value());
    }
    return args;
}

core::process::ProcessSpec SessionExecutor::build_process_spec(
    const SessionInvocation& invocation) const {
    core::process::ProcessSpec spec;
    spec.argv.push_back(config_.shell);
    spec.argv.insert(spec.argv.end(), config_.shell_flags.begin(), config_.shell_flags.end());
    spec.argv.push_back(core::process::join_shell_command(build_command(invocation)));
    spec.working_directory = invocation.working_dir;
    spec.timeout_ms = invocation.timeout_ms != 0 ? invocation.timeout_ms : config_.timeout_ms;
    return spec;
}

AgentError SessionExecutor::classify_failure(const int exit_code,
                                             const std::string& stderr_text,
                                             const std::optional<std::string>& resume_token) {
    const auto lowered = to_lower(stderr_text);
    const std::string token = resume_token.value_or("");

    AgentError error{ErrorCategory::Execution,
                     "Agent exited with code " + std::to_string(exit_code) + ": " + stderr_text,
                     "agent_failed"};
    if (contains_any(lowered, {"session not found", "no conversation found with session id"})) {
        error = AgentError{ErrorCategory::Session, "Session not found: " + token,
                           "session_not_found",
                           "Start a new conversation without a resume token."};
    } else if (contains_any(lowered, {"invalid uuid", "not a valid uuid"})) {
        error = AgentError{ErrorCategory::Session, "Invalid session ID format: " + token,
                           "invalid_session_token",
                           "Resume tokens are the session ids returned by earlier calls."};
    } else if (lowered.find("rate limit") != std::string::npos) {
        error = AgentError{ErrorCategory::Execution, "Rate limit exceeded", "rate_limited"};
    }
    error.detail = stderr_text;
    error.session_token = token;
    return error;
}

core::errors::Result<InvocationResult> SessionExecutor::invoke_once(
    const SessionInvocation& invocation) const {
    const auto spec = build_process_spec(invocation);
    const bool debug = invocation.debug || config_.debug;

    LOG_INFO("Executing agent in " + spec.working_directory.string());
    LOG_DEBUG("Command: " + spec.argv.back());

    auto launched = core::process::run_process(spec);
    if (core::errors::is_error(launched)) {
        return with_token(core::errors::get_error(launched), invocation.resume_token);
    }
    const auto& capture = core::errors::get_value(launched);

    if (debug) {
        LOG_DEBUG("Agent exit code: " + std::to_string(capture.exit_code));
        LOG_DEBUG("STDERR:\n" + capture.stderr_text);
        LOG_DEBUG("STDOUT:\n" + capture.stdout_text);
    }

    if (capture.timed_out) {
        AgentError error{ErrorCategory::Execution,
                         "Command timed out after " + std::to_string(spec.timeout_ms) + "ms",
                         "timeout"};
        error.detail = capture.stderr_text;
        return with_token(std::move(error), invocation.resume_token);
    }
    if (capture.exit_code != 0) {
        return classify_failure(capture.exit_code, capture.stderr_text, invocation.resume_token);
    }

    auto extracted = extract_json_object(capture.stdout_text);
    if (core::errors::is_error(extracted)) {
        LOG_ERROR(core::errors::describe(core::errors::get_error(extracted)));
        return with_token(core::errors::get_error(extracted), invocation.resume_token);
    }
    const auto& payload = core::errors::get_value(extracted);

    const auto session_id = read_session_id(payload);
    if (!session_id.has_value()) {
        AgentError error{ErrorCategory::Execution, "Agent response carries no session id",
                         "missing_session_id"};
        error.detail = payload.dump();
        return with_token(std::move(error), invocation.resume_token);
    }

    InvocationResult result;
    result.success = true;
    result.session_token = session_id.value();
    result.result_text = read_result_text(payload);
    result.cost_usd = read_cost(payload);
    result.metadata = read_metadata(payload);
    result.raw = payload;

    LOG_INFO("Agent responded, session " + result.session_token);
    return result;
}

core::errors::Result<InvocationResult> SessionExecutor::invoke(
    const SessionInvocation& invocation) const {
    const std::function<core::errors::Result<InvocationResult>()> attempt =
        [this, &invocation]() { return invoke_once(invocation); };
    return core::retry::retry_with_backoff<InvocationResult>(attempt, policy_, suspend_);
}

std::future<core::errors::Result<InvocationResult>> SessionExecutor::invoke_async(
    SessionInvocation invocation) const {
    return std::async(std::launch::async,
                      [this, invocation = std::move(invocation)]() { return invoke(invocation); });
}

}  // namespace agentbox::session
