#pragma once

#include <filesystem>
#include <string>
#include "core/config/runtime_config.hpp"
#include "core/errors/agent_errors.hpp"
#include "policy/path_containment.hpp"
#include "protocol/resource_mapping.hpp"

namespace agentbox::workspace {

// Stages a single resource into an existing workspace directory. Every
// destination goes through ContainmentGuard first.
class ResourceImporter {
public:
    explicit ResourceImporter(core::config::WorkspaceConfig config = {});

    // Returns the path of the copied file.
    core::errors::Result<std::filesystem::path> import_file(
        const std::filesystem::path& workspace_root,
        const protocol::FileMapping& mapping) const;

    // Replaces any existing folder of the same name; returns its path.
    core::errors::Result<std::filesystem::path> import_folder(
        const std::filesystem::path& workspace_root,
        const protocol::FolderMapping& mapping) const;

    // Returns the clone directory.
    core::errors::Result<std::filesystem::path> import_repo(
        const std::filesystem::path& workspace_root,
        const protocol::GitRepoMapping& mapping) const;

    core::errors::Result<std::filesystem::path> import_resource(
        const std::filesystem::path& workspace_root,
        const protocol::ResourceMapping& mapping) const;

    core::errors::Status validate_remote_url(const std::string& url) const;

    bool is_git_available() const;

private:
    core::errors::Result<std::filesystem::path> resolve_named_destination(
        const std::filesystem::path& workspace_root, const std::string& dest_path,
        const std::string& name) const;

    // The metadata sidecar at the top of the root is never an import target.
    core::errors::Status reject_reserved(const std::filesystem::path& workspace_root,
                                         const std::filesystem::path& target,
                                         const std::string& relative_path) const;

    core::errors::Status run_clone(const std::filesystem::path& workspace_root,
                                   const protocol::GitRepoMapping& mapping,
                                   const std::filesystem::path& target) const;

    core::config::WorkspaceConfig config_;
    policy::ContainmentGuard guard_;
};

}  // namespace agentbox::workspace
