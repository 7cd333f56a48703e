#include "workspace/workspace_manager.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"
#include "core/process/process_runner.hpp"
#include "policy/path_containment.hpp"

namespace agentbox::workspace {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

constexpr std::uint32_t kExportTimeoutMs = 600000;

AgentError with_workspace(AgentError error, const std::string& workspace_id) {
    if (error.workspace_id.empty()) {
        error.workspace_id = workspace_id;
    }
    return error;
}

AgentError not_found(const std::string& workspace_id) {
    AgentError error{ErrorCategory::Workspace, "Workspace not found: " + workspace_id,
                     "workspace_not_found"};
    error.workspace_id = workspace_id;
    return error;
}

}  // namespace

WorkspaceManager::WorkspaceManager(core::config::WorkspaceConfig config)
    : config_(std::move(config)), importer_(config_) {}

core::errors::Status WorkspaceManager::validate_workspace_id(
    const std::string& workspace_id) {
    const bool bad_component = workspace_id.empty() || workspace_id == "." ||
                               workspace_id == ".." ||
                               workspace_id.find('/') != std::string::npos ||
                               workspace_id.find('\0') != std::string::npos;
    if (bad_component) {
        AgentError error{ErrorCategory::Validation,
                         "Invalid workspace id: '" + workspace_id + "'",
                         "invalid_workspace_id",
                         "Workspace ids must be a single path component."};
        error.workspace_id = workspace_id;
        return error;
    }
    return core::errors::Ok{};
}

std::shared_ptr<std::mutex> WorkspaceManager::lock_for(
    const std::string& workspace_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = id_locks_[workspace_id];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

void WorkspaceManager::release_lock(const std::string& workspace_id,
                                    const std::shared_ptr<std::mutex>& held) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (workspaces_.count(workspace_id) != 0) {
        return;
    }
    auto it = id_locks_.find(workspace_id);
    // One reference in the map, one in the caller; anything more is a waiter.
    if (it != id_locks_.end() && it->second == held && held.use_count() == 2) {
        id_locks_.erase(it);
    }
}

std::optional<WorkspaceRecord> WorkspaceManager::find_record(
    const std::string& workspace_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workspaces_.find(workspace_id);
    if (it == workspaces_.end()) {
        return std::nullopt;
    }
    return it->second;
}

core::errors::Result<std::filesystem::path> WorkspaceManager::allocate_root(
    const std::string& workspace_id, const bool persistent) const {
    std::error_code ec;
    std::filesystem::create_directories(config_.base_dir, ec);
    if (ec) {
        AgentError error{ErrorCategory::Workspace,
                         "Unable to create workspace base directory: " +
                             config_.base_dir.string(),
                         "workspace_create_failed"};
        error.path = config_.base_dir.string();
        error.detail = ec.message();
        return error;
    }

    std::filesystem::path root;
    if (persistent) {
        root = config_.base_dir / ("persistent_" + workspace_id);
        std::filesystem::create_directories(root, ec);
        if (ec) {
            AgentError error{ErrorCategory::Workspace,
                             "Unable to create workspace directory: " + root.string(),
                             "workspace_create_failed"};
            error.path = root.string();
            error.detail = ec.message();
            return error;
        }
    } else {
        const std::string pattern =
            (config_.base_dir / (workspace_id + "_XXXXXX")).string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (mkdtemp(buffer.data()) == nullptr) {
            AgentError error{ErrorCategory::Workspace,
                             "Unable to create workspace directory under " +
                                 config_.base_dir.string(),
                             "workspace_create_failed"};
            error.path = pattern;
            error.detail = std::strerror(errno);
            return error;
        }
        root = std::filesystem::path(buffer.data());
    }

    const auto canonical = std::filesystem::weakly_canonical(root, ec);
    return ec ? root : canonical;
}

core::errors::Status WorkspaceManager::populate(
    const std::filesystem::path& root, const std::vector<protocol::FileMapping>& files,
    const std::vector<protocol::FolderMapping>& folders,
    const std::vector<protocol::GitRepoMapping>& repos) const {
    for (const auto& file : files) {
        auto imported = importer_.import_file(root, file);
        if (core::errors::is_error(imported)) {
            LOG_ERROR("Failed to copy file " + file.name + ": " +
                      core::errors::get_error(imported).message);
            return core::errors::get_error(imported);
        }
    }

    for (const auto& folder : folders) {
        auto imported = importer_.import_folder(root, folder);
        if (core::errors::is_error(imported)) {
            LOG_ERROR("Failed to copy folder " + folder.name + ": " +
                      core::errors::get_error(imported).message);
            return core::errors::get_error(imported);
        }
    }

    if (repos.empty()) {
        return core::errors::Ok{};
    }
    if (!importer_.is_git_available()) {
        return AgentError{ErrorCategory::Workspace,
                          "Git is not installed or not in PATH: " + config_.git_binary,
                          "git_unavailable",
                          "Install git or set workspace.git_binary."};
    }
    for (const auto& repo : repos) {
        auto imported = importer_.import_repo(root, repo);
        if (core::errors::is_error(imported)) {
            LOG_ERROR("Failed to clone repo " + repo.remote_url + ": " +
                      core::errors::get_error(imported).message);
            return core::errors::get_error(imported);
        }
    }
    return core::errors::Ok{};
}

core::errors::Result<std::filesystem::path> WorkspaceManager::create_workspace(
    const std::string& workspace_id, const std::vector<protocol::FileMapping>& files,
    const std::vector<protocol::FolderMapping>& folders,
    const std::vector<protocol::GitRepoMapping>& repos, const bool persistent) {
    auto id_check = validate_workspace_id(workspace_id);
    if (core::errors::is_error(id_check)) {
        return core::errors::get_error(id_check);
    }

    const auto id_lock = lock_for(workspace_id);
    std::lock_guard<std::mutex> id_guard(*id_lock);
    auto created = create_locked(workspace_id, files, folders, repos, persistent);
    release_lock(workspace_id, id_lock);
    return created;
}

core::errors::Result<std::filesystem::path> WorkspaceManager::create_locked(
    const std::string& workspace_id, const std::vector<protocol::FileMapping>& files,
    const std::vector<protocol::FolderMapping>& folders,
    const std::vector<protocol::GitRepoMapping>& repos, const bool persistent) {
    if (find_record(workspace_id).has_value()) {
        AgentError error{ErrorCategory::Workspace,
                         "Workspace '" + workspace_id + "' already exists",
                         "duplicate_workspace_id"};
        error.workspace_id = workspace_id;
        return error;
    }

    auto allocated = allocate_root(workspace_id, persistent);
    if (core::errors::is_error(allocated)) {
        return with_workspace(core::errors::get_error(allocated), workspace_id);
    }
    const auto root = core::errors::get_value(allocated);
    LOG_INFO("Creating workspace: " + root.string());

    auto rollback = [&root, persistent]() {
        if (persistent) {
            return;
        }
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
        if (ec) {
            LOG_WARN("Rollback could not remove " + root.string() + ": " + ec.message());
        }
    };

    WorkspaceMetadata metadata;
    metadata.workspace_id = workspace_id;
    metadata.created_at = utc_timestamp();
    metadata.persistent = persistent;
    metadata.resources = ResourceManifest{files, folders, repos};

    const MetadataSidecar sidecar(root);
    auto written = sidecar.write(metadata);
    if (core::errors::is_error(written)) {
        rollback();
        return with_workspace(core::errors::get_error(written), workspace_id);
    }

    auto populated = populate(root, files, folders, repos);
    if (core::errors::is_error(populated)) {
        LOG_ERROR("Failed to create workspace " + workspace_id + ": " +
                  core::errors::get_error(populated).message);
        rollback();
        return with_workspace(core::errors::get_error(populated), workspace_id);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        workspaces_[workspace_id] = WorkspaceRecord{workspace_id, root, persistent};
    }
    LOG_INFO("Workspace created successfully: " + workspace_id);
    return root;
}

std::optional<std::filesystem::path> WorkspaceManager::get_workspace(
    const std::string& workspace_id) const {
    auto record = find_record(workspace_id);
    if (!record.has_value()) {
        return std::nullopt;
    }
    return record->root_path;
}

std::map<std::string, WorkspaceInfo> WorkspaceManager::list_workspaces() const {
    std::vector<WorkspaceRecord> records;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records.reserve(workspaces_.size());
        for (const auto& entry : workspaces_) {
            records.push_back(entry.second);
        }
    }

    std::map<std::string, WorkspaceInfo> result;
    for (const auto& record : records) {
        WorkspaceInfo info;
        info.path = record.root_path;
        std::error_code ec;
        info.exists = std::filesystem::exists(record.root_path, ec) && !ec;
        info.persistent = record.persistent;

        if (info.exists) {
            auto metadata = MetadataSidecar(record.root_path).read();
            if (!core::errors::is_error(metadata)) {
                const auto& loaded = core::errors::get_value(metadata);
                info.created_at = loaded.created_at;
                info.persistent = record.persistent || loaded.persistent;
                info.resources = loaded.resources;
            } else {
                LOG_WARN("Unreadable metadata for workspace " + record.workspace_id +
                         ": " + core::errors::get_error(metadata).message);
            }
        }
        result.emplace(record.workspace_id, std::move(info));
    }
    return result;
}

core::errors::Result<bool> WorkspaceManager::cleanup_workspace(
    const std::string& workspace_id, const bool force) {
    const auto id_lock = lock_for(workspace_id);
    std::lock_guard<std::mutex> id_guard(*id_lock);

    auto record = find_record(workspace_id);
    if (!record.has_value()) {
        LOG_WARN("Workspace not found: " + workspace_id);
        release_lock(workspace_id, id_lock);
        return false;
    }

    // The sidecar lives inside the agent-writable root, so it may add
    // persistence but never remove it.
    bool persistent = record->persistent;
    auto metadata = MetadataSidecar(record->root_path).read();
    if (!core::errors::is_error(metadata)) {
        persistent = persistent || core::errors::get_value(metadata).persistent;
    }
    if (persistent && !force) {
        LOG_INFO("Workspace is persistent, skipping cleanup: " + workspace_id);
        return false;
    }

    std::error_code ec;
    std::filesystem::remove_all(record->root_path, ec);
    if (ec) {
        LOG_ERROR("Failed to cleanup workspace " + workspace_id + ": " + ec.message());
        AgentError error{ErrorCategory::Workspace,
                         "Failed to remove workspace directory: " +
                             record->root_path.string(),
                         "cleanup_failed"};
        error.workspace_id = workspace_id;
        error.path = record->root_path.string();
        error.detail = ec.message();
        return error;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        workspaces_.erase(workspace_id);
    }
    release_lock(workspace_id, id_lock);
    LOG_INFO("Cleaned up workspace: " + workspace_id);
    return true;
}

std::size_t WorkspaceManager::cleanup_all(const bool force) {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ids.reserve(workspaces_.size());
        for (const auto& entry : workspaces_) {
            ids.push_back(entry.first);
        }
    }

    std::size_t cleaned = 0;
    for (const auto& workspace_id : ids) {
        auto removed = cleanup_workspace(workspace_id, force);
        if (core::errors::is_error(removed)) {
            LOG_ERROR(core::errors::describe(core::errors::get_error(removed)));
            continue;
        }
        if (core::errors::get_value(removed)) {
            ++cleaned;
        }
    }
    return cleaned;
}

core::errors::Result<std::filesystem::path> WorkspaceManager::export_workspace(
    const std::string& workspace_id, const std::filesystem::path& output_path) {
    const auto id_lock = lock_for(workspace_id);
    std::lock_guard<std::mutex> id_guard(*id_lock);

    auto record = find_record(workspace_id);
    std::error_code ec;
    if (!record.has_value() || !std::filesystem::exists(record->root_path, ec)) {
        release_lock(workspace_id, id_lock);
        return not_found(workspace_id);
    }

    std::filesystem::path archive = output_path;
    archive.replace_extension(".tar");
    if (archive.has_parent_path()) {
        std::filesystem::create_directories(archive.parent_path(), ec);
    }

    core::process::ProcessSpec spec;
    spec.argv = {config_.tar_binary, "-cf", archive.string(), "-C",
                 record->root_path.string(), "."};
    spec.timeout_ms = kExportTimeoutMs;
    auto archived = core::process::run_process(spec);
    if (core::errors::is_error(archived)) {
        return with_workspace(core::errors::get_error(archived), workspace_id);
    }

    const auto& capture = core::errors::get_value(archived);
    if (capture.exit_code != 0 || capture.timed_out) {
        AgentError error{ErrorCategory::Workspace,
                         "Failed to archive workspace to " + archive.string(),
                         "export_failed"};
        error.workspace_id = workspace_id;
        error.path = archive.string();
        error.detail = capture.stderr_text;
        return error;
    }

    LOG_INFO("Exported workspace to: " + archive.string());
    return archive;
}

core::errors::Result<std::filesystem::path> WorkspaceManager::write_file(
    const std::string& workspace_id, const std::string& relative_path,
    const std::string& bytes) const {
    const auto id_lock = lock_for(workspace_id);
    std::lock_guard<std::mutex> id_guard(*id_lock);

    auto record = find_record(workspace_id);
    if (!record.has_value()) {
        release_lock(workspace_id, id_lock);
        return not_found(workspace_id);
    }

    const policy::ContainmentGuard guard{};
    auto resolved = guard.resolve(record->root_path, relative_path);
    if (core::errors::is_error(resolved)) {
        return with_workspace(core::errors::get_error(resolved), workspace_id);
    }
    const auto target = core::errors::get_value(resolved);
    if (target == record->root_path / kMetadataFileName || target == record->root_path) {
        AgentError error{ErrorCategory::Validation,
                         "Path is reserved in the workspace: " + relative_path,
                         "reserved_path"};
        error.workspace_id = workspace_id;
        error.path = relative_path;
        return error;
    }

    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (ec || !out.is_open()) {
        AgentError error{ErrorCategory::Workspace, "Unable to open file: " + target.string(),
                         "write_failed"};
        error.workspace_id = workspace_id;
        error.path = target.string();
        return error;
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out.good()) {
        AgentError error{ErrorCategory::Workspace,
                         "Unable to write file: " + target.string(), "write_failed"};
        error.workspace_id = workspace_id;
        error.path = target.string();
        return error;
    }
    return target;
}

core::errors::Result<std::string> WorkspaceManager::read_file(
    const std::string& workspace_id, const std::string& relative_path) const {
    const auto id_lock = lock_for(workspace_id);
    std::lock_guard<std::mutex> id_guard(*id_lock);

    auto record = find_record(workspace_id);
    if (!record.has_value()) {
        release_lock(workspace_id, id_lock);
        return not_found(workspace_id);
    }

    const policy::ContainmentGuard guard{};
    auto resolved = guard.resolve(record->root_path, relative_path);
    if (core::errors::is_error(resolved)) {
        return with_workspace(core::errors::get_error(resolved), workspace_id);
    }
    const auto target = core::errors::get_value(resolved);

    std::ifstream in(target, std::ios::binary);
    if (!in.is_open()) {
        AgentError error{ErrorCategory::Workspace, "Unable to open file: " + target.string(),
                         "read_failed"};
        error.workspace_id = workspace_id;
        error.path = target.string();
        return error;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::size_t WorkspaceManager::workspace_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workspaces_.size();
}

std::size_t WorkspaceManager::lock_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return id_locks_.size();
}

}  // namespace agentbox::workspace
