#pragma once
#include <cstddef>
#include <random>
#include <sstream>
#include <string>

namespace agentbox::core::config {

    // Random lowercase hex string of the given length, e.g. "3fa09c1e"
    inline std::string random_hex(std::size_t length = 8) {
        thread_local std::mt19937 gen{std::random_device{}()};
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        for (std::size_t i = 0; i < length; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // Default workspace id for a coordinated run: "agent_" + 8 hex chars
    inline std::string generate_workspace_id() {
        return "agent_" + random_hex(8);
    }

} // namespace agentbox::core::config
