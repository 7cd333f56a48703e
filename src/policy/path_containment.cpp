#include "policy/path_containment.hpp"

#include <system_error>

namespace agentbox::policy {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

AgentError containment_error(const std::string& message, const std::string& code,
                             const std::string& path) {
    AgentError error{ErrorCategory::Validation, message, code};
    error.path = path;
    return error;
}

bool has_parent_segment(const std::filesystem::path& path) {
    for (const auto& part : path) {
        if (part == "..") {
            return true;
        }
    }
    return false;
}

}  // namespace

bool ContainmentGuard::is_within_root(const std::filesystem::path& root,
                                      const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

core::errors::Result<std::filesystem::path> ContainmentGuard::validate_relative(
    const std::string& relative_dest) const {
    const std::filesystem::path raw(relative_dest);
    if (raw.is_absolute() || raw.has_root_directory() || raw.has_root_name()) {
        return containment_error("Destination must be relative: " + relative_dest,
                                 "path_traversal", relative_dest);
    }
    if (has_parent_segment(raw)) {
        return containment_error(
            "Destination contains a parent-directory segment: " + relative_dest,
            "path_traversal", relative_dest);
    }

    const std::filesystem::path normalized = raw.lexically_normal();
    if (has_parent_segment(normalized)) {
        return containment_error("Destination escapes workspace: " + relative_dest,
                                 "path_traversal", relative_dest);
    }
    return normalized;
}

core::errors::Result<std::filesystem::path> ContainmentGuard::resolve(
    const std::filesystem::path& workspace_root,
    const std::string& relative_dest) const {
    auto validated = validate_relative(relative_dest);
    if (core::errors::is_error(validated)) {
        return core::errors::get_error(validated);
    }
    const std::filesystem::path normalized = core::errors::get_value(validated);

    std::error_code ec;
    if (!std::filesystem::is_directory(workspace_root, ec) || ec) {
        return containment_error(
            "Workspace root is not an existing directory: " + workspace_root.string(),
            "invalid_workspace_root", workspace_root.string());
    }

    const std::filesystem::path canonical_root =
        std::filesystem::weakly_canonical(workspace_root, ec);
    if (ec) {
        return containment_error(
            "Unable to resolve workspace root: " + workspace_root.string(),
            "invalid_workspace_root", workspace_root.string());
    }

    if (normalized.empty() || normalized == ".") {
        return canonical_root;
    }

    const std::filesystem::path canonical_candidate =
        std::filesystem::weakly_canonical(canonical_root / normalized, ec);
    if (ec) {
        return containment_error("Unable to resolve destination: " + relative_dest,
                                 "invalid_path", relative_dest);
    }

    // Second check after resolution catches symlinks pointing out of the root.
    if (!is_within_root(canonical_root, canonical_candidate)) {
        return containment_error(
            "Path escapes workspace root: " + canonical_candidate.string(),
            "path_outside_workspace", relative_dest);
    }

    return canonical_candidate;
}

}  // namespace agentbox::policy
