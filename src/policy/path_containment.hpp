#pragma once

#include <filesystem>
#include <string>
#include "core/errors/agent_errors.hpp"

namespace agentbox::policy {

class ContainmentGuard {
public:
    // Lexical check only: rejects absolute paths and any ".." segment.
    // "" and "." are accepted and mean the workspace root itself.
    core::errors::Result<std::filesystem::path> validate_relative(
        const std::string& relative_dest) const;

    // Validates relative_dest, resolves it under workspace_root and re-checks
    // the resolved path (symlinks followed) is still inside the root.
    // The returned path is absolute and canonical up to its first missing
    // component.
    core::errors::Result<std::filesystem::path> resolve(
        const std::filesystem::path& workspace_root,
        const std::string& relative_dest) const;

    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
};

}  // namespace agentbox::policy
