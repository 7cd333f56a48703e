#pragma once
#include <string>
#include <variant>

namespace agentbox::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Validation, // E.g., a destination path tries to leave the workspace
        Workspace,  // E.g., duplicate workspace id, clone failed
        Session,    // E.g., the resume token is unknown to the agent
        Execution,  // E.g., agent exited non-zero, timed out, printed no JSON
        Internal    // E.g., sidecar I/O or id generation failure
    };

    // The standardized error payload
    struct AgentError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";           // Helpful tips for the caller
        std::string detail = "";         // Raw stderr or tool output
        std::string path = "";           // Offending path, if any
        std::string workspace_id = "";
        std::string session_token = "";
    };

    // 2. Propagation strategy
    // A Result holds either a successful value of type T, OR an AgentError.
    template <typename T>
    using Result = std::variant<T, AgentError>;

    // Result<void> stand-in for operations that only report failure.
    struct Ok {};
    using Status = Result<Ok>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<AgentError>(result);
    }

    template <typename T>
    const AgentError& get_error(const Result<T>& result) {
        return std::get<AgentError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Validation: return "validation";
            case ErrorCategory::Workspace:  return "workspace";
            case ErrorCategory::Session:    return "session";
            case ErrorCategory::Execution:  return "execution";
            case ErrorCategory::Internal:   return "internal";
            default: return "unknown";
        }
    }

    // "[workspace/duplicate_workspace_id] Workspace 'x' already exists"
    inline std::string describe(const AgentError& error) {
        return "[" + to_string(error.category) + "/" + error.code + "] " +
               error.message;
    }

} // namespace agentbox::core::errors
