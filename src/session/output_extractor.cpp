#include "session/output_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace agentbox::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::string trim_left(const std::string& line) {
    auto it = std::find_if(line.begin(), line.end(), [](const char c) {
        return std::isspace(static_cast<unsigned char>(c)) == 0;
    });
    return std::string(it, line.end());
}

long brace_balance(const std::string& line) {
    const auto opens = std::count(line.begin(), line.end(), '{');
    const auto closes = std::count(line.begin(), line.end(), '}');
    return static_cast<long>(opens) - static_cast<long>(closes);
}

const json* first_present(const json& payload, const std::vector<const char*>& keys) {
    for (const auto* key : keys) {
        auto it = payload.find(key);
        if (it != payload.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

}  // namespace

core::errors::Result<json> extract_json_object(const std::string& text) {
    std::istringstream input(text);
    std::string line;
    std::string accumulated;
    bool in_object = false;
    long balance = 0;

    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!in_object) {
            const auto trimmed = trim_left(line);
            if (trimmed.empty() || trimmed.front() != '{') {
                continue;
            }
            in_object = true;
        }

        accumulated += line;
        accumulated += '\n';
        balance += brace_balance(line);
        if (balance <= 0) {
            break;
        }
    }

    if (!in_object) {
        AgentError error{ErrorCategory::Execution, "No JSON output found in agent response",
                         "no_structured_output"};
        error.detail = text;
        return error;
    }

    json payload = json::parse(accumulated, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        AgentError error{ErrorCategory::Execution, "Failed to parse JSON from agent output",
                         "invalid_json"};
        error.detail = accumulated;
        return error;
    }
    return payload;
}

std::optional<std::string> read_session_id(const json& payload) {
    const json* value = first_present(payload, {"session_id", "sessionId", "sid"});
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_string()) {
        return value->get<std::string>();
    }
    return value->dump();
}

std::string read_result_text(const json& payload) {
    for (const auto* key : {"result", "message", "response", "output", "text"}) {
        auto it = payload.find(key);
        if (it == payload.end() || it->is_null()) {
            continue;
        }
        if (it->is_string()) {
            if (!it->get_ref<const std::string&>().empty()) {
                return it->get<std::string>();
            }
            continue;
        }
        return it->dump();
    }
    return payload.dump(2);
}

std::optional<double> read_cost(const json& payload) {
    const json* value = first_present(payload, {"total_cost_usd", "cost_usd"});
    if (value == nullptr || !value->is_number()) {
        return std::nullopt;
    }
    return value->get<double>();
}

json read_metadata(const json& payload) {
    for (const auto* key : {"metadata", "meta", "info"}) {
        auto it = payload.find(key);
        if (it != payload.end() && it->is_object()) {
            return *it;
        }
    }

    json metadata = json::object();
    for (const auto* key : {"tokens_used", "duration_ms", "model", "timestamp", "num_turns"}) {
        auto it = payload.find(key);
        if (it != payload.end()) {
            metadata[key] = *it;
        }
    }
    return metadata;
}

}  // namespace agentbox::session
