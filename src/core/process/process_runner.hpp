#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"

namespace agentbox::core::process {

    struct ProcessSpec {
        // argv[0] is resolved through PATH.
        std::vector<std::string> argv;
        std::filesystem::path working_directory = ".";
        // 0 disables the timeout.
        std::uint32_t timeout_ms = 0;
    };

    struct ProcessCapture {
        int exit_code = -1;
        bool timed_out = false;
        std::string stdout_text;
        std::string stderr_text;
        double duration_ms = 0.0;
    };

    // Runs the child in its own session with stdin on /dev/null. On timeout the
    // whole process group is killed, so shells and their children go together.
    // Errors are only returned when the child could not be started at all; a
    // non-zero exit is reported through ProcessCapture::exit_code.
    errors::Result<ProcessCapture> run_process(const ProcessSpec& spec);

    // 'value' with embedded single quotes escaped, safe to paste into sh -c.
    std::string shell_quote(const std::string& value);

    std::string join_shell_command(const std::vector<std::string>& args);

}  // namespace agentbox::core::process
