#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace agentbox::protocol {

    // Copy a host file to <workspace>/<dest_path>/<name>
    struct FileMapping {
        std::string name;
        std::filesystem::path source_path;
        std::string dest_path;
    };

    // Copy a host directory tree to <workspace>/<dest_path>/<name>
    struct FolderMapping {
        std::string name;
        std::filesystem::path source_path;
        std::string dest_path;
    };

    // Clone a remote repository to <workspace>/<dest_path> ("" or "." is the root)
    struct GitRepoMapping {
        std::string remote_url;
        std::string dest_path;
        std::optional<std::string> branch;
        bool shallow = true; // --depth 1
    };

    using ResourceMapping = std::variant<FileMapping, FolderMapping, GitRepoMapping>;

    // Harvest <workspace>/<source_path> back to a host path after a run
    struct OutputMapping {
        std::string name;
        std::string source_path;
        std::filesystem::path dest_path;
    };

} // namespace agentbox::protocol
