#include "workspace/workspace_metadata.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

namespace agentbox::workspace {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

json file_to_json(const protocol::FileMapping& mapping) {
    json payload;
    payload["name"] = mapping.name;
    payload["src_path"] = mapping.source_path.string();
    payload["dest_path"] = mapping.dest_path;
    return payload;
}

json folder_to_json(const protocol::FolderMapping& mapping) {
    json payload;
    payload["name"] = mapping.name;
    payload["src_path"] = mapping.source_path.string();
    payload["dest_path"] = mapping.dest_path;
    return payload;
}

json repo_to_json(const protocol::GitRepoMapping& mapping) {
    json payload;
    payload["remote_url"] = mapping.remote_url;
    payload["dest_path"] = mapping.dest_path;
    payload["branch"] = mapping.branch.has_value() ? json(mapping.branch.value()) : json();
    payload["shallow"] = mapping.shallow;
    return payload;
}

ResourceManifest manifest_from_json(const json& resources) {
    ResourceManifest manifest;
    for (const auto& item : resources.value("files", json::array())) {
        manifest.files.push_back({item.value("name", ""),
                                  item.value("src_path", ""),
                                  item.value("dest_path", "")});
    }
    for (const auto& item : resources.value("folders", json::array())) {
        manifest.folders.push_back({item.value("name", ""),
                                    item.value("src_path", ""),
                                    item.value("dest_path", "")});
    }
    for (const auto& item : resources.value("repos", json::array())) {
        protocol::GitRepoMapping repo;
        repo.remote_url = item.value("remote_url", "");
        repo.dest_path = item.value("dest_path", "");
        if (item.contains("branch") && item.at("branch").is_string()) {
            repo.branch = item.at("branch").get<std::string>();
        }
        repo.shallow = item.value("shallow", true);
        manifest.repos.push_back(std::move(repo));
    }
    return manifest;
}

}  // namespace

json manifest_to_json(const ResourceManifest& manifest) {
    json resources;
    resources["files"] = json::array();
    resources["folders"] = json::array();
    resources["repos"] = json::array();
    for (const auto& file : manifest.files) {
        resources["files"].push_back(file_to_json(file));
    }
    for (const auto& folder : manifest.folders) {
        resources["folders"].push_back(folder_to_json(folder));
    }
    for (const auto& repo : manifest.repos) {
        resources["repos"].push_back(repo_to_json(repo));
    }
    return resources;
}

std::string utc_timestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::now());
    std::tm tm_buf{};
    gmtime_r(&now, &tm_buf);
    std::ostringstream out;
    out << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

MetadataSidecar::MetadataSidecar(std::filesystem::path workspace_root)
    : workspace_root_(std::move(workspace_root)) {}

std::filesystem::path MetadataSidecar::file_path() const {
    return workspace_root_ / kMetadataFileName;
}

core::errors::Result<std::filesystem::path> MetadataSidecar::write(
    const WorkspaceMetadata& metadata) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(workspace_root_, ec) || ec) {
        AgentError error{ErrorCategory::Internal,
                         "Workspace root is not a directory: " + workspace_root_.string(),
                         "invalid_workspace_root"};
        error.workspace_id = metadata.workspace_id;
        return error;
    }

    json document;
    document["workspace_id"] = metadata.workspace_id;
    document["created_at"] = metadata.created_at;
    document["persistent"] = metadata.persistent;
    document["resources"] = manifest_to_json(metadata.resources);

    const auto path = file_path();
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        AgentError error{ErrorCategory::Internal,
                         "Unable to open metadata file: " + path.string(),
                         "metadata_open_failed"};
        error.path = path.string();
        return error;
    }

    out << document.dump(2) << "\n";
    if (!out.good()) {
        AgentError error{ErrorCategory::Internal,
                         "Unable to write metadata file: " + path.string(),
                         "metadata_write_failed"};
        error.path = path.string();
        return error;
    }
    return path;
}

core::errors::Result<WorkspaceMetadata> MetadataSidecar::read() const {
    const auto path = file_path();
    std::ifstream in(path);
    if (!in.is_open()) {
        AgentError error{ErrorCategory::Internal,
                         "Unable to open metadata file: " + path.string(),
                         "metadata_open_failed"};
        error.path = path.string();
        return error;
    }

    const json document = json::parse(in, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        AgentError error{ErrorCategory::Internal,
                         "Metadata file is not valid JSON: " + path.string(),
                         "metadata_parse_failed"};
        error.path = path.string();
        return error;
    }

    try {
        WorkspaceMetadata metadata;
        metadata.workspace_id = document.value("workspace_id", "");
        metadata.created_at = document.value("created_at", "");
        metadata.persistent = document.value("persistent", false);
        metadata.resources = manifest_from_json(document.value("resources", json::object()));
        return metadata;
    } catch (const json::exception& ex) {
        AgentError error{ErrorCategory::Internal,
                         std::string("Metadata file has unexpected shape: ") + ex.what(),
                         "metadata_parse_failed"};
        error.path = path.string();
        return error;
    }
}

}  // namespace agentbox::workspace
