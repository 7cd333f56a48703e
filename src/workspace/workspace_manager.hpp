#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/config/runtime_config.hpp"
#include "core/errors/agent_errors.hpp"
#include "protocol/resource_mapping.hpp"
#include "workspace/resource_importer.hpp"
#include "workspace/workspace_metadata.hpp"

namespace agentbox::workspace {

struct WorkspaceRecord {
    std::string workspace_id;
    std::filesystem::path root_path;
    bool persistent = false;
};

struct WorkspaceInfo {
    std::filesystem::path path;
    bool exists = false;
    bool persistent = false;
    std::string created_at;
    ResourceManifest resources;
};

// Owns the set of active workspaces. Thread-safe: the registry map is guarded
// by one mutex, and every operation touching a workspace directory also holds
// that id's own mutex for the whole sequence. Per-id mutexes live only while
// the id is tracked or some caller holds them.
class WorkspaceManager {
public:
    explicit WorkspaceManager(core::config::WorkspaceConfig config = {});

    WorkspaceManager(const WorkspaceManager&) = delete;
    WorkspaceManager& operator=(const WorkspaceManager&) = delete;

    core::errors::Result<std::filesystem::path> create_workspace(
        const std::string& workspace_id,
        const std::vector<protocol::FileMapping>& files = {},
        const std::vector<protocol::FolderMapping>& folders = {},
        const std::vector<protocol::GitRepoMapping>& repos = {},
        bool persistent = false);

    std::optional<std::filesystem::path> get_workspace(
        const std::string& workspace_id) const;

    std::map<std::string, WorkspaceInfo> list_workspaces() const;

    // false when the id is unknown, or persistent and not forced.
    core::errors::Result<bool> cleanup_workspace(const std::string& workspace_id,
                                                 bool force = false);

    // Number of workspaces removed.
    std::size_t cleanup_all(bool force = false);

    // Writes a tar archive of the workspace; returns the archive path.
    core::errors::Result<std::filesystem::path> export_workspace(
        const std::string& workspace_id, const std::filesystem::path& output_path);

    core::errors::Result<std::filesystem::path> write_file(
        const std::string& workspace_id, const std::string& relative_path,
        const std::string& bytes) const;

    core::errors::Result<std::string> read_file(const std::string& workspace_id,
                                                const std::string& relative_path) const;

    std::size_t workspace_count() const;

    // Number of per-id mutexes currently allocated.
    std::size_t lock_count() const;

    const std::filesystem::path& base_dir() const { return config_.base_dir; }

private:
    std::shared_ptr<std::mutex> lock_for(const std::string& workspace_id) const;
    // Drops the id's mutex when the id is untracked and `held` is the only
    // outside reference. Call while still holding *held.
    void release_lock(const std::string& workspace_id,
                      const std::shared_ptr<std::mutex>& held) const;
    std::optional<WorkspaceRecord> find_record(const std::string& workspace_id) const;

    core::errors::Result<std::filesystem::path> create_locked(
        const std::string& workspace_id, const std::vector<protocol::FileMapping>& files,
        const std::vector<protocol::FolderMapping>& folders,
        const std::vector<protocol::GitRepoMapping>& repos, bool persistent);

    core::errors::Result<std::filesystem::path> allocate_root(
        const std::string& workspace_id, bool persistent) const;

    core::errors::Status populate(const std::filesystem::path& root,
                                  const std::vector<protocol::FileMapping>& files,
                                  const std::vector<protocol::FolderMapping>& folders,
                                  const std::vector<protocol::GitRepoMapping>& repos) const;

    static core::errors::Status validate_workspace_id(const std::string& workspace_id);

    core::config::WorkspaceConfig config_;
    ResourceImporter importer_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, WorkspaceRecord> workspaces_;
    mutable std::unordered_map<std::string, std::shared_ptr<std::mutex>> id_locks_;
};

}  // namespace agentbox::workspace
