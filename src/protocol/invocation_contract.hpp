#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace agentbox::protocol {

// One call to the external agent.
struct SessionInvocation {
    std::string prompt;
    std::filesystem::path working_dir = std::filesystem::current_path();
    // Token from the previous successful call in this workspace; none starts
    // a fresh conversation.
    std::optional<std::string> resume_token;
    std::uint32_t timeout_ms = 300000;
    bool debug = false;
};

struct InvocationResult {
    bool success = false;
    std::string session_token;
    std::string result_text;
    std::optional<double> cost_usd;
    nlohmann::json metadata = nlohmann::json::object();
    nlohmann::json raw = nlohmann::json::object();
};

}  // namespace agentbox::protocol
