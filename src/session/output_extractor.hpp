#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"

namespace agentbox::session {

// Pulls the single JSON object out of agent stdout that may carry shell
// banners before and after it.
//
// The object starts on the first line whose trimmed text begins with '{' and
// ends on the line where the running count of '{' minus '}' returns to zero.
// Braces inside string literals are counted too, so a string holding an
// unbalanced brace can end the scan early or late.
core::errors::Result<nlohmann::json> extract_json_object(const std::string& text);

// session_id, sessionId, then sid.
std::optional<std::string> read_session_id(const nlohmann::json& payload);

// First non-empty of result, message, response, output, text; otherwise the
// whole payload pretty-printed.
std::string read_result_text(const nlohmann::json& payload);

std::optional<double> read_cost(const nlohmann::json& payload);

nlohmann::json read_metadata(const nlohmann::json& payload);

}  // namespace agentbox::session
