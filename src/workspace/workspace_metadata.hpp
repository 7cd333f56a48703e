#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/resource_mapping.hpp"

namespace agentbox::workspace {

inline constexpr const char* kMetadataFileName = ".workspace_metadata.json";

struct ResourceManifest {
    std::vector<protocol::FileMapping> files;
    std::vector<protocol::FolderMapping> folders;
    std::vector<protocol::GitRepoMapping> repos;
};

struct WorkspaceMetadata {
    std::string workspace_id;
    std::string created_at; // ISO-8601, UTC
    bool persistent = false;
    ResourceManifest resources;
};

nlohmann::json manifest_to_json(const ResourceManifest& manifest);

// Current UTC time as "2024-01-31T12:00:00Z".
std::string utc_timestamp();

// The JSON sidecar kept at the top of every workspace directory.
class MetadataSidecar {
public:
    explicit MetadataSidecar(std::filesystem::path workspace_root);

    core::errors::Result<std::filesystem::path> write(
        const WorkspaceMetadata& metadata) const;

    core::errors::Result<WorkspaceMetadata> read() const;

    std::filesystem::path file_path() const;

private:
    std::filesystem::path workspace_root_;
};

}  // namespace agentbox::workspace
