#include "workspace/resource_importer.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <regex>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"
#include "core/process/process_runner.hpp"
#include "workspace/workspace_metadata.hpp"

namespace agentbox::workspace {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

constexpr std::uint32_t kGitProbeTimeoutMs = 10000;
// Longer URLs are rejected before regex matching, which recurses per character.
constexpr std::size_t kMaxRemoteUrlLength = 2048;

AgentError mapping_error(const std::string& message, const std::string& path) {
    AgentError error{ErrorCategory::Validation, message, "invalid_mapping"};
    error.path = path;
    return error;
}

AgentError workspace_error(const std::string& message, const std::string& code,
                           const std::string& path, const std::string& detail = "") {
    AgentError error{ErrorCategory::Workspace, message, code};
    error.path = path;
    error.detail = detail;
    return error;
}

std::string join_relative(const std::string& dest_path, const std::string& name) {
    if (dest_path.empty() || dest_path == ".") {
        return name;
    }
    return (std::filesystem::path(dest_path) / name).string();
}

// Moves every entry of `staging` into `root`, refusing to overwrite.
core::errors::Status promote_staged_clone(const std::filesystem::path& staging,
                                          const std::filesystem::path& root) {
    std::error_code ec;
    std::vector<std::filesystem::path> entries;
    for (const auto& entry : std::filesystem::directory_iterator(staging, ec)) {
        entries.push_back(entry.path());
    }
    if (ec) {
        return workspace_error("Unable to read staged clone: " + staging.string(),
                               "clone_failed", staging.string(), ec.message());
    }

    for (const auto& entry : entries) {
        const auto target = root / entry.filename();
        if (std::filesystem::exists(target, ec)) {
            return workspace_error(
                "Clone would overwrite existing workspace entry: " + target.string(),
                "clone_failed", target.string());
        }
        std::filesystem::rename(entry, target, ec);
        if (ec) {
            return workspace_error("Unable to move cloned entry into workspace root: " +
                                       target.string(),
                                   "clone_failed", target.string(), ec.message());
        }
    }

    std::filesystem::remove_all(staging, ec);
    return core::errors::Ok{};
}

}  // namespace

ResourceImporter::ResourceImporter(core::config::WorkspaceConfig config)
    : config_(std::move(config)) {}

core::errors::Result<std::filesystem::path> ResourceImporter::resolve_named_destination(
    const std::filesystem::path& workspace_root, const std::string& dest_path,
    const std::string& name) const {
    if (name.empty()) {
        return mapping_error("Resource name cannot be empty.", dest_path);
    }

    auto resolved = guard_.resolve(workspace_root, join_relative(dest_path, name));
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }

    // A name like "." would otherwise target the workspace root itself.
    std::error_code ec;
    const auto canonical_root = std::filesystem::weakly_canonical(workspace_root, ec);
    const auto& target = core::errors::get_value(resolved);
    if (!ec && target.lexically_normal() == canonical_root.lexically_normal()) {
        return mapping_error("Resource would replace the workspace root: " + name,
                             dest_path);
    }
    auto reserved =
        reject_reserved(workspace_root, target, join_relative(dest_path, name));
    if (core::errors::is_error(reserved)) {
        return core::errors::get_error(reserved);
    }
    return target;
}

core::errors::Status ResourceImporter::reject_reserved(
    const std::filesystem::path& workspace_root, const std::filesystem::path& target,
    const std::string& relative_path) const {
    std::error_code ec;
    const auto canonical_root = std::filesystem::weakly_canonical(workspace_root, ec);
    const auto root = ec ? workspace_root : canonical_root;
    if (target.lexically_normal() == (root / kMetadataFileName).lexically_normal()) {
        AgentError error{ErrorCategory::Validation,
                         "Path is reserved in the workspace: " + relative_path,
                         "reserved_path"};
        error.path = relative_path;
        return error;
    }
    return core::errors::Ok{};
}

core::errors::Result<std::filesystem::path> ResourceImporter::import_file(
    const std::filesystem::path& workspace_root,
    const protocol::FileMapping& mapping) const {
    std::error_code ec;
    if (!std::filesystem::exists(mapping.source_path, ec) || ec) {
        return mapping_error("Source file not found: " + mapping.source_path.string(),
                             mapping.source_path.string());
    }
    if (!std::filesystem::is_regular_file(mapping.source_path, ec) || ec) {
        return mapping_error("Source is not a file: " + mapping.source_path.string(),
                             mapping.source_path.string());
    }

    auto resolved = resolve_named_destination(workspace_root, mapping.dest_path,
                                              mapping.name);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto dest_file = core::errors::get_value(resolved);

    std::filesystem::create_directories(dest_file.parent_path(), ec);
    if (ec) {
        return workspace_error("Unable to create destination directory: " +
                                   dest_file.parent_path().string(),
                               "copy_failed", dest_file.parent_path().string(),
                               ec.message());
    }

    LOG_INFO("Copying file: " + mapping.source_path.string() + " -> " +
             dest_file.string());
    std::filesystem::copy_file(mapping.source_path, dest_file,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        return workspace_error("Failed to copy file to " + dest_file.string(),
                               "copy_failed", dest_file.string(), ec.message());
    }

    // Keep mode bits and mtime like `cp -p`; failures here are not fatal.
    const auto source_status = std::filesystem::status(mapping.source_path, ec);
    if (!ec) {
        std::filesystem::permissions(dest_file, source_status.permissions(), ec);
    }
    const auto source_mtime = std::filesystem::last_write_time(mapping.source_path, ec);
    if (!ec) {
        std::filesystem::last_write_time(dest_file, source_mtime, ec);
    }

    if (!std::filesystem::exists(dest_file, ec) || ec) {
        return workspace_error("Copied file is missing: " + dest_file.string(),
                               "copy_failed", dest_file.string());
    }
    return dest_file;
}

core::errors::Result<std::filesystem::path> ResourceImporter::import_folder(
    const std::filesystem::path& workspace_root,
    const protocol::FolderMapping& mapping) const {
    std::error_code ec;
    if (!std::filesystem::exists(mapping.source_path, ec) || ec) {
        return mapping_error("Source folder not found: " + mapping.source_path.string(),
                             mapping.source_path.string());
    }
    if (!std::filesystem::is_directory(mapping.source_path, ec) || ec) {
        return mapping_error("Source is not a folder: " + mapping.source_path.string(),
                             mapping.source_path.string());
    }

    auto resolved = resolve_named_destination(workspace_root, mapping.dest_path,
                                              mapping.name);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto dest_folder = core::errors::get_value(resolved);

    if (std::filesystem::exists(dest_folder, ec)) {
        LOG_WARN("Destination folder exists, removing: " + dest_folder.string());
        std::filesystem::remove_all(dest_folder, ec);
        if (ec) {
            return workspace_error("Unable to replace folder: " + dest_folder.string(),
                                   "copy_failed", dest_folder.string(), ec.message());
        }
    }

    std::filesystem::create_directories(dest_folder.parent_path(), ec);
    if (ec) {
        return workspace_error("Unable to create destination directory: " +
                                   dest_folder.parent_path().string(),
                               "copy_failed", dest_folder.parent_path().string(),
                               ec.message());
    }

    LOG_INFO("Copying folder: " + mapping.source_path.string() + " -> " +
             dest_folder.string());
    // Symlinks are followed so no link inside the workspace points back out.
    std::filesystem::copy(mapping.source_path, dest_folder,
                          std::filesystem::copy_options::recursive, ec);
    if (ec) {
        return workspace_error("Failed to copy folder to " + dest_folder.string(),
                               "copy_failed", dest_folder.string(), ec.message());
    }

    if (!std::filesystem::is_directory(dest_folder, ec) || ec) {
        return workspace_error("Copied folder is missing: " + dest_folder.string(),
                               "copy_failed", dest_folder.string());
    }
    return dest_folder;
}

core::errors::Status ResourceImporter::validate_remote_url(const std::string& url) const {
    if (url.empty()) {
        AgentError error{ErrorCategory::Validation, "Repository URL cannot be empty.",
                         "invalid_remote_url"};
        return error;
    }
    if (url.size() > kMaxRemoteUrlLength) {
        AgentError error{ErrorCategory::Validation,
                         "Repository URL is longer than " +
                             std::to_string(kMaxRemoteUrlLength) + " characters.",
                         "invalid_remote_url"};
        error.path = url.substr(0, 64) + "...";
        return error;
    }

    // scheme://host[:port]/owner/repo[/more][.git][/]
    static const std::regex kRemotePattern(
        R"(^([A-Za-z][A-Za-z0-9+.\-]*)://([A-Za-z0-9.\-]*)(:[0-9]+)?((/[A-Za-z0-9_.~\-]+){2,})/?$)");
    std::smatch match;
    if (!std::regex_match(url, match, kRemotePattern)) {
        AgentError error{ErrorCategory::Validation, "Invalid repository URL: " + url,
                         "invalid_remote_url",
                         "Expected scheme://host/owner/repo, e.g. "
                         "https://github.com/owner/repo"};
        error.path = url;
        return error;
    }

    std::string scheme = match[1].str();
    std::transform(scheme.begin(), scheme.end(), scheme.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    const auto& allowed = config_.allowed_url_schemes;
    if (std::find(allowed.begin(), allowed.end(), scheme) == allowed.end()) {
        AgentError error{ErrorCategory::Validation,
                         "Repository URL scheme is not allowed: " + scheme,
                         "invalid_remote_url"};
        error.path = url;
        return error;
    }
    if (scheme != "file" && match[2].str().empty()) {
        AgentError error{ErrorCategory::Validation,
                         "Repository URL has no host: " + url, "invalid_remote_url"};
        error.path = url;
        return error;
    }
    return core::errors::Ok{};
}

bool ResourceImporter::is_git_available() const {
    core::process::ProcessSpec spec;
    spec.argv = {config_.git_binary, "--version"};
    spec.timeout_ms = kGitProbeTimeoutMs;
    auto probe = core::process::run_process(spec);
    if (core::errors::is_error(probe)) {
        return false;
    }
    const auto& capture = core::errors::get_value(probe);
    if (capture.exit_code != 0 || capture.timed_out) {
        return false;
    }
    LOG_DEBUG("Git version: " + capture.stdout_text);
    return true;
}

core::errors::Status ResourceImporter::run_clone(
    const std::filesystem::path& workspace_root,
    const protocol::GitRepoMapping& mapping,
    const std::filesystem::path& target) const {
    core::process::ProcessSpec spec;
    spec.argv = {config_.git_binary, "clone"};
    if (mapping.shallow) {
        spec.argv.push_back("--depth");
        spec.argv.push_back("1");
    }
    if (mapping.branch.has_value() && !mapping.branch->empty()) {
        spec.argv.push_back("--branch");
        spec.argv.push_back(mapping.branch.value());
    }
    spec.argv.push_back(mapping.remote_url);
    spec.argv.push_back(target.string());
    spec.working_directory = workspace_root;
    spec.timeout_ms = config_.clone_timeout_ms;

    LOG_INFO("Cloning repository: " + mapping.remote_url + " -> " + target.string());
    auto cloned = core::process::run_process(spec);
    if (core::errors::is_error(cloned)) {
        const auto& spawn_error = core::errors::get_error(cloned);
        return workspace_error("Failed to start git clone: " + spawn_error.message,
                               "clone_failed", target.string());
    }

    const auto& capture = core::errors::get_value(cloned);
    if (capture.timed_out) {
        return workspace_error("git clone timed out: " + mapping.remote_url,
                               "clone_failed", target.string(), capture.stderr_text);
    }
    if (capture.exit_code != 0) {
        LOG_ERROR("Git clone failed: " + capture.stderr_text);
        return workspace_error("Failed to clone repository: " + mapping.remote_url,
                               "clone_failed", target.string(), capture.stderr_text);
    }
    LOG_DEBUG("Git clone output: " + capture.stderr_text);
    return core::errors::Ok{};
}

core::errors::Result<std::filesystem::path> ResourceImporter::import_repo(
    const std::filesystem::path& workspace_root,
    const protocol::GitRepoMapping& mapping) const {
    auto url_check = validate_remote_url(mapping.remote_url);
    if (core::errors::is_error(url_check)) {
        return core::errors::get_error(url_check);
    }

    auto resolved = guard_.resolve(workspace_root, mapping.dest_path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const auto clone_target = core::errors::get_value(resolved);
    auto reserved = reject_reserved(workspace_root, clone_target, mapping.dest_path);
    if (core::errors::is_error(reserved)) {
        return core::errors::get_error(reserved);
    }
    const bool into_root = mapping.dest_path.empty() || mapping.dest_path == ".";

    std::error_code ec;
    if (into_root) {
        // The root already holds the metadata sidecar, and git refuses to
        // clone into a non-empty directory.
        const auto staging = clone_target / (".clone-" + core::config::random_hex(8));
        auto cloned = run_clone(workspace_root, mapping, staging);
        if (core::errors::is_error(cloned)) {
            std::filesystem::remove_all(staging, ec);
            return core::errors::get_error(cloned);
        }
        auto promoted = promote_staged_clone(staging, clone_target);
        if (core::errors::is_error(promoted)) {
            std::filesystem::remove_all(staging, ec);
            return core::errors::get_error(promoted);
        }
    } else {
        std::filesystem::create_directories(clone_target.parent_path(), ec);
        if (ec) {
            return workspace_error("Unable to create clone parent directory: " +
                                       clone_target.parent_path().string(),
                                   "clone_failed", clone_target.string(), ec.message());
        }
        auto cloned = run_clone(workspace_root, mapping, clone_target);
        if (core::errors::is_error(cloned)) {
            return core::errors::get_error(cloned);
        }
    }

    if (!std::filesystem::is_directory(clone_target, ec) || ec) {
        return workspace_error("Repository was not cloned to " + clone_target.string(),
                               "clone_verification_failed", clone_target.string());
    }
    if (!std::filesystem::exists(clone_target / ".git", ec) || ec) {
        return workspace_error(
            "Cloned directory is not a git repository: " + clone_target.string(),
            "clone_verification_failed", clone_target.string());
    }
    return clone_target;
}

core::errors::Result<std::filesystem::path> ResourceImporter::import_resource(
    const std::filesystem::path& workspace_root,
    const protocol::ResourceMapping& mapping) const {
    if (const auto* file = std::get_if<protocol::FileMapping>(&mapping)) {
        return import_file(workspace_root, *file);
    }
    if (const auto* folder = std::get_if<protocol::FolderMapping>(&mapping)) {
        return import_folder(workspace_root, *folder);
    }
    return import_repo(workspace_root, std::get<protocol::GitRepoMapping>(mapping));
}

}  // namespace agentbox::workspace
