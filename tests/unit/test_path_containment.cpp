#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "core/errors/agent_errors.hpp"
#include "policy/path_containment.hpp"
#include "test_support.hpp"

namespace {

using agentbox::core::errors::ErrorCategory;
using agentbox::core::errors::get_error;
using agentbox::core::errors::get_value;
using agentbox::core::errors::is_error;
using agentbox::policy::ContainmentGuard;
using agentbox::test_support::TempDir;

TEST(PathContainmentTest, RejectsParentSegments) {
    TempDir dir("containment");
    ContainmentGuard guard;

    for (const std::string bad : {"..", "../x", "a/../../x", "a/..", "sub/../.."}) {
        auto result = guard.resolve(dir.root(), bad);
        ASSERT_TRUE(is_error(result)) << bad;
        EXPECT_EQ(get_error(result).category, ErrorCategory::Validation) << bad;
        EXPECT_EQ(get_error(result).code, "path_traversal") << bad;
    }
}

TEST(PathContainmentTest, RejectsAbsolutePaths) {
    TempDir dir("containment");
    ContainmentGuard guard;

    auto result = guard.resolve(dir.root(), "/etc/passwd");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Validation);
    EXPECT_EQ(get_error(result).code, "path_traversal");
}

TEST(PathContainmentTest, AllowsDotsInsideNames) {
    ContainmentGuard guard;
    auto result = guard.validate_relative("notes..v2/file.txt");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), std::filesystem::path("notes..v2/file.txt"));
}

TEST(PathContainmentTest, ResolvesUnderRoot) {
    TempDir dir("containment");
    ContainmentGuard guard;

    auto result = guard.resolve(dir.root(), "sub/./deeper/file.txt");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), dir.root() / "sub" / "deeper" / "file.txt");
    EXPECT_TRUE(ContainmentGuard::is_within_root(dir.root(), get_value(result)));
}

TEST(PathContainmentTest, EmptyAndDotMeanRoot) {
    TempDir dir("containment");
    ContainmentGuard guard;

    auto empty = guard.resolve(dir.root(), "");
    auto dot = guard.resolve(dir.root(), ".");
    ASSERT_FALSE(is_error(empty));
    ASSERT_FALSE(is_error(dot));
    EXPECT_EQ(get_value(empty), dir.root());
    EXPECT_EQ(get_value(dot), dir.root());
}

TEST(PathContainmentTest, RejectsSymlinkEscape) {
    TempDir dir("containment");
    TempDir outside("outside");
    std::filesystem::create_directory_symlink(outside.root(), dir.root() / "link");

    ContainmentGuard guard;
    auto result = guard.resolve(dir.root(), "link/secret.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Validation);
    EXPECT_EQ(get_error(result).code, "path_outside_workspace");
}

TEST(PathContainmentTest, MissingRootIsRejected) {
    TempDir dir("containment");
    ContainmentGuard guard;

    auto result = guard.resolve(dir.root() / "missing", "a.txt");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_workspace_root");
}

TEST(PathContainmentTest, SiblingWithSharedPrefixIsOutside) {
    EXPECT_FALSE(ContainmentGuard::is_within_root("/tmp/ws", "/tmp/ws2/file"));
    EXPECT_TRUE(ContainmentGuard::is_within_root("/tmp/ws", "/tmp/ws/file"));
}

}  // namespace
