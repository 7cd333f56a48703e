#include "core/config/runtime_config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace agentbox::core::config {

using errors::AgentError;
using errors::ErrorCategory;
using nlohmann::json;

namespace {

template <typename T>
void read_key(const json& object, const char* key, T& target) {
    const auto it = object.find(key);
    if (it != object.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

void read_executor(const json& section, ExecutorConfig& executor) {
    read_key(section, "shell", executor.shell);
    read_key(section, "shell_flags", executor.shell_flags);
    read_key(section, "agent_binary", executor.agent_binary);
    read_key(section, "permission_flag", executor.permission_flag);
    read_key(section, "timeout_ms", executor.timeout_ms);
    read_key(section, "debug", executor.debug);
}

void read_retry(const json& section, retry::RetryPolicy& policy) {
    read_key(section, "max_attempts", policy.max_attempts);
    read_key(section, "backoff_base", policy.backoff_base);
    read_key(section, "jitter", policy.jitter);

    std::int64_t initial_ms = policy.initial_delay.count();
    std::int64_t max_ms = policy.max_delay.count();
    read_key(section, "initial_delay_ms", initial_ms);
    read_key(section, "max_delay_ms", max_ms);
    policy.initial_delay = std::chrono::milliseconds(initial_ms);
    policy.max_delay = std::chrono::milliseconds(max_ms);
}

void read_workspace(const json& section, WorkspaceConfig& workspace) {
    std::string base_dir = workspace.base_dir.string();
    read_key(section, "base_dir", base_dir);
    workspace.base_dir = base_dir;
    read_key(section, "git_binary", workspace.git_binary);
    read_key(section, "tar_binary", workspace.tar_binary);
    read_key(section, "clone_timeout_ms", workspace.clone_timeout_ms);
    read_key(section, "allowed_url_schemes", workspace.allowed_url_schemes);
}

errors::Result<logging::LogLevel> parse_log_level(const std::string& text) {
    if (text == "debug") return logging::LogLevel::DEBUG;
    if (text == "info") return logging::LogLevel::INFO;
    if (text == "warn" || text == "warning") return logging::LogLevel::WARN;
    if (text == "error") return logging::LogLevel::ERROR;
    return AgentError{ErrorCategory::Validation, "Unknown log level: " + text,
                      "invalid_config", "Use one of debug, info, warn, error."};
}

}  // namespace

std::string default_shell() {
    const char* shell = std::getenv("SHELL");
    if (shell != nullptr && shell[0] != '\0') {
        return shell;
    }
    return "/bin/bash";
}

errors::Result<RuntimeConfig> parse_runtime_config(const std::string& json_text) {
    const json document = json::parse(json_text, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return AgentError{ErrorCategory::Validation,
                          "Configuration is not a JSON object.", "invalid_config"};
    }

    RuntimeConfig config;
    std::string log_level;
    try {
        if (document.contains("executor")) {
            read_executor(document.at("executor"), config.executor);
        }
        if (document.contains("retry")) {
            read_retry(document.at("retry"), config.retry);
        }
        if (document.contains("workspace")) {
            read_workspace(document.at("workspace"), config.workspace);
        }
        read_key(document, "log_level", log_level);
    } catch (const json::exception& ex) {
        return AgentError{ErrorCategory::Validation,
                          std::string("Configuration value has the wrong type: ") +
                              ex.what(),
                          "invalid_config"};
    }

    if (!log_level.empty()) {
        auto level = parse_log_level(log_level);
        if (errors::is_error(level)) {
            return errors::get_error(level);
        }
        config.log_level = errors::get_value(level);
    }

    if (config.executor.shell.empty() || config.executor.agent_binary.empty()) {
        return AgentError{ErrorCategory::Validation,
                          "executor.shell and executor.agent_binary cannot be empty.",
                          "invalid_config"};
    }
    if (config.retry.backoff_base < 1.0) {
        return AgentError{ErrorCategory::Validation,
                          "retry.backoff_base must be at least 1.0.",
                          "invalid_config"};
    }
    return config;
}

errors::Result<RuntimeConfig> load_runtime_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        AgentError error{ErrorCategory::Validation,
                         "Unable to open configuration file: " + path.string(),
                         "config_open_failed"};
        error.path = path.string();
        return error;
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    auto parsed = parse_runtime_config(buffer.str());
    if (errors::is_error(parsed)) {
        auto error = errors::get_error(parsed);
        error.path = path.string();
        return error;
    }
    return parsed;
}

}  // namespace agentbox::core::config
