#include "runtime/agent_run_coordinator.hpp"

#include <algorithm>
#include <string>
#include <system_error>
#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"
#include "policy/path_containment.hpp"

namespace agentbox::runtime {

using protocol::HarvestedPath;
using protocol::OutputMapping;
using protocol::RunOutcome;
using protocol::RunRequest;

namespace {

// An existing directory receives <dest>/<name>; anything else is the target.
std::filesystem::path harvest_target(const OutputMapping& mapping) {
    std::error_code ec;
    if (std::filesystem::is_directory(mapping.dest_path, ec)) {
        return mapping.dest_path / mapping.name;
    }
    return mapping.dest_path;
}

// Names are joined onto host destinations that may later be replaced, so
// each must be exactly one path component.
bool is_single_component(const std::string& name) {
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
}

std::string relative_to_root(const std::filesystem::path& path,
                             const std::filesystem::path& root) {
    return path.lexically_relative(root).generic_string();
}

}  // namespace

AgentRunCoordinator::AgentRunCoordinator(workspace::WorkspaceManager& workspaces,
                                         const session::SessionExecutor& executor)
    : workspaces_(workspaces), executor_(executor) {}

core::errors::Status AgentRunCoordinator::validate_outputs(const RunRequest& request) const {
    const policy::ContainmentGuard guard{};
    for (const auto* outputs : {&request.output_files, &request.output_folders}) {
        for (const auto& mapping : *outputs) {
            if (!is_single_component(mapping.name)) {
                core::errors::AgentError error{
                    core::errors::ErrorCategory::Validation,
                    "Output name must be a single path component: '" + mapping.name + "'",
                    "invalid_mapping"};
                error.path = mapping.name;
                return error;
            }
            auto checked = guard.validate_relative(mapping.source_path);
            if (core::errors::is_error(checked)) {
                return core::errors::get_error(checked);
            }
        }
    }
    return core::errors::Ok{};
}

void AgentRunCoordinator::harvest_files(const std::filesystem::path& root,
                                        const std::vector<OutputMapping>& outputs,
                                        RunOutcome& outcome) const {
    const policy::ContainmentGuard guard{};
    for (const auto& mapping : outputs) {
        auto resolved = guard.resolve(root, mapping.source_path);
        std::error_code ec;
        if (core::errors::is_error(resolved) ||
            !std::filesystem::is_regular_file(core::errors::get_value(resolved), ec)) {
            LOG_WARN("Expected output file not found: " + mapping.source_path);
            outcome.missing_outputs.push_back(mapping.name);
            continue;
        }
        const auto source = core::errors::get_value(resolved);
        const auto target = harvest_target(mapping);

        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path(), ec);
        }
        std::filesystem::copy_file(source, target,
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            LOG_WARN("Failed to copy output file " + source.string() + ": " + ec.message());
            outcome.missing_outputs.push_back(mapping.name);
            continue;
        }
        const auto modified = std::filesystem::last_write_time(source, ec);
        if (!ec) {
            std::filesystem::last_write_time(target, modified, ec);
        }

        LOG_INFO("Copied file: " + source.string() + " -> " + target.string());
        outcome.files_copied.push_back(
            HarvestedPath{mapping.name, relative_to_root(source, root), target});
    }
}

void AgentRunCoordinator::harvest_folders(const std::filesystem::path& root,
                                          const std::vector<OutputMapping>& outputs,
                                          RunOutcome& outcome) const {
    const policy::ContainmentGuard guard{};
    for (const auto& mapping : outputs) {
        auto resolved = guard.resolve(root, mapping.source_path);
        std::error_code ec;
        if (core::errors::is_error(resolved) ||
            !std::filesystem::is_directory(core::errors::get_value(resolved), ec)) {
            LOG_WARN("Expected output folder not found: " + mapping.source_path);
            outcome.missing_outputs.push_back(mapping.name);
            continue;
        }
        const auto source = core::errors::get_value(resolved);
        const auto target = harvest_target(mapping);

        std::filesystem::remove_all(target, ec);
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path(), ec);
        }
        ec.clear();
        // Links the agent left behind are copied as their targets.
        std::filesystem::copy(source, target, std::filesystem::copy_options::recursive,
                              ec);
        if (ec) {
            LOG_WARN("Failed to copy output folder " + source.string() + ": " + ec.message());
            outcome.missing_outputs.push_back(mapping.name);
            continue;
        }

        LOG_INFO("Copied folder: " + source.string() + " -> " + target.string());
        outcome.folders_copied.push_back(
            HarvestedPath{mapping.name, relative_to_root(source, root), target});
    }
}

void AgentRunCoordinator::release(const std::string& workspace_id) {
    LOG_INFO("Cleaning up workspace: " + workspace_id);
    auto removed = workspaces_.cleanup_workspace(workspace_id);
    if (core::errors::is_error(removed)) {
        LOG_ERROR("Cleanup failed: " +
                  core::errors::describe(core::errors::get_error(removed)));
    }
}

RunOutcome AgentRunCoordinator::run_with_io(const RunRequest& request) {
    RunOutcome outcome;

    auto outputs_ok = validate_outputs(request);
    if (core::errors::is_error(outputs_ok)) {
        outcome.error = core::errors::get_error(outputs_ok);
        LOG_ERROR("Agent execution failed: " + core::errors::describe(*outcome.error));
        return outcome;
    }

    const std::string workspace_id =
        request.workspace_id.value_or(core::config::generate_workspace_id());

    LOG_INFO("Creating workspace '" + workspace_id + "' with inputs");
    auto created = workspaces_.create_workspace(workspace_id, request.input_files,
                                                request.input_folders, request.input_repos,
                                                !request.cleanup);
    if (core::errors::is_error(created)) {
        outcome.error = core::errors::get_error(created);
        LOG_ERROR("Agent execution failed: " + core::errors::describe(*outcome.error));
        return outcome;
    }
    const auto root = core::errors::get_value(created);
    outcome.workspace_path = root;

    protocol::SessionInvocation invocation;
    invocation.prompt = session::compose_prompt(request.prompt, request.system_prompt);
    invocation.working_dir = root;
    invocation.resume_token = request.resume_token;
    invocation.timeout_ms = request.timeout_ms;
    invocation.debug = request.debug;

    LOG_INFO("Running agent in workspace: " + root.string());
    auto invoked = executor_.invoke(invocation);
    if (core::errors::is_error(invoked)) {
        outcome.error = core::errors::get_error(invoked);
        outcome.error->workspace_id = workspace_id;
        LOG_ERROR("Agent execution failed: " + core::errors::describe(*outcome.error));
        if (request.cleanup) {
            release(workspace_id);
        }
        return outcome;
    }

    const auto& response = core::errors::get_value(invoked);
    outcome.success = true;
    outcome.session_token = response.session_token;
    outcome.result_text = response.result_text;
    outcome.cost_usd = response.cost_usd.value_or(0.0);

    LOG_INFO("Extracting outputs from workspace");
    harvest_files(root, request.output_files, outcome);
    harvest_folders(root, request.output_folders, outcome);

    if (request.cleanup) {
        release(workspace_id);
    }
    return outcome;
}

OutputVerification verify_outputs(const RunOutcome& outcome,
                                  const std::vector<std::string>& expected_files,
                                  const std::vector<std::string>& expected_folders) {
    OutputVerification verification;

    auto harvested = [](const std::vector<HarvestedPath>& copied, const std::string& name) {
        return std::any_of(copied.begin(), copied.end(),
                           [&name](const HarvestedPath& entry) { return entry.name == name; });
    };

    for (const auto& name : expected_files) {
        if (!harvested(outcome.files_copied, name)) {
            verification.missing.push_back("file: " + name);
        }
    }
    for (const auto& name : expected_folders) {
        if (!harvested(outcome.folders_copied, name)) {
            verification.missing.push_back("folder: " + name);
        }
    }

    std::error_code ec;
    for (const auto& entry : outcome.files_copied) {
        if (!std::filesystem::exists(entry.destination, ec)) {
            verification.missing.push_back("file at destination: " +
                                           entry.destination.string());
        }
    }
    for (const auto& entry : outcome.folders_copied) {
        if (!std::filesystem::exists(entry.destination, ec)) {
            verification.missing.push_back("folder at destination: " +
                                           entry.destination.string());
        }
    }

    verification.all_found = verification.missing.empty();
    return verification;
}

}  // namespace agentbox::runtime
