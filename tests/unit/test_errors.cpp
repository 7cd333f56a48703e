#include <gtest/gtest.h>
#include "core/errors/agent_errors.hpp"

using namespace agentbox::core::errors;

// A dummy function to simulate a workspace lookup failing
Result<std::string> simulate_lookup(bool should_fail) {
    if (should_fail) {
        return AgentError{ErrorCategory::Workspace, "Workspace not found: ws1",
                          "workspace_not_found"};
    }
    return std::string("/tmp/agent_workspaces/ws1_abc123");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_lookup(false);

    // Check that it is NOT an error
    EXPECT_FALSE(is_error(result));
    // Check that the value is correct
    EXPECT_EQ(get_value(result), "/tmp/agent_workspaces/ws1_abc123");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_lookup(true);

    // Check that it IS an error
    EXPECT_TRUE(is_error(result));

    // Check the error details
    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Workspace);
    EXPECT_EQ(error.code, "workspace_not_found");
    EXPECT_TRUE(error.session_token.empty());
}

TEST(ErrorModelTest, StatusCarriesOkOrError) {
    Status ok = Ok{};
    Status failed = AgentError{ErrorCategory::Validation, "bad"};

    EXPECT_FALSE(is_error(ok));
    ASSERT_TRUE(is_error(failed));
    EXPECT_EQ(get_error(failed).code, "unknown_error");
}

TEST(ErrorModelTest, DescribeIncludesCategoryAndCode) {
    const AgentError error{ErrorCategory::Session, "Session not found: abc",
                           "session_not_found"};
    EXPECT_EQ(describe(error), "[session/session_not_found] Session not found: abc");
    EXPECT_EQ(to_string(ErrorCategory::Execution), "execution");
}
