#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/agent_errors.hpp"
#include "core/retry/retry_policy.hpp"

namespace {

using agentbox::core::errors::AgentError;
using agentbox::core::errors::ErrorCategory;
using agentbox::core::errors::get_error;
using agentbox::core::errors::get_value;
using agentbox::core::errors::is_error;
using agentbox::core::errors::Result;
using agentbox::core::retry::BackoffSchedule;
using agentbox::core::retry::retry_with_backoff;
using agentbox::core::retry::run_with_retry;
using agentbox::core::retry::run_with_retry_async;
using agentbox::core::retry::RetryPolicy;
using std::chrono::milliseconds;

RetryPolicy fast_policy(std::uint32_t attempts) {
    RetryPolicy policy;
    policy.max_attempts = attempts;
    policy.initial_delay = milliseconds(1000);
    policy.max_delay = milliseconds(60000);
    policy.backoff_base = 2.0;
    policy.jitter = false;
    return policy;
}

TEST(RetryPolicyTest, RetriesExecutionErrorsUntilSuccess) {
    int calls = 0;
    std::vector<milliseconds> delays;
    const std::function<Result<int>()> op = [&calls]() -> Result<int> {
        ++calls;
        if (calls < 3) {
            return AgentError{ErrorCategory::Execution, "transient"};
        }
        return 42;
    };

    auto result = retry_with_backoff<int>(op, fast_policy(3),
                                          [&delays](milliseconds d) { delays.push_back(d); });
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), 42);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(delays, (std::vector<milliseconds>{milliseconds(1000), milliseconds(2000)}));
}

TEST(RetryPolicyTest, ReturnsLastErrorAfterMaxAttempts) {
    int calls = 0;
    std::vector<milliseconds> delays;
    const std::function<Result<int>()> op = [&calls]() -> Result<int> {
        ++calls;
        return AgentError{ErrorCategory::Execution, "attempt " + std::to_string(calls)};
    };

    auto result = retry_with_backoff<int>(op, fast_policy(3),
                                          [&delays](milliseconds d) { delays.push_back(d); });
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).message, "attempt 3");
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(delays.size(), 2u);
}

TEST(RetryPolicyTest, SessionErrorsAreNotRetried) {
    int calls = 0;
    int sleeps = 0;
    const std::function<Result<int>()> op = [&calls]() -> Result<int> {
        ++calls;
        return AgentError{ErrorCategory::Session, "unknown session", "session_not_found"};
    };

    auto result = retry_with_backoff<int>(op, fast_policy(5),
                                          [&sleeps](milliseconds) { ++sleeps; });
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Session);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(sleeps, 0);
}

TEST(RetryPolicyTest, DelaySequenceIsCappedAtMaxDelay) {
    RetryPolicy policy = fast_policy(8);
    policy.max_delay = milliseconds(5000);

    BackoffSchedule schedule(policy);
    std::vector<long long> observed;
    for (int i = 0; i < 6; ++i) {
        observed.push_back(schedule.next().count());
    }
    EXPECT_EQ(observed, (std::vector<long long>{1000, 2000, 4000, 5000, 5000, 5000}));
}

TEST(RetryPolicyTest, JitterStaysWithinHalfToFullDelay) {
    RetryPolicy policy = fast_policy(3);
    policy.jitter = true;

    for (int trial = 0; trial < 50; ++trial) {
        BackoffSchedule schedule(policy);
        const auto first = schedule.next().count();
        const auto second = schedule.next().count();
        EXPECT_GE(first, 500);
        EXPECT_LE(first, 1000);
        EXPECT_GE(second, 1000);
        EXPECT_LE(second, 2000);
    }
}

TEST(RetryPolicyTest, BlockingAdapterReturnsImmediateSuccess) {
    int calls = 0;
    const std::function<Result<std::string>()> op = [&calls]() -> Result<std::string> {
        ++calls;
        return std::string("ok");
    };

    auto result = run_with_retry<std::string>(op, fast_policy(3));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "ok");
    EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, AsyncAdapterRunsSameLoop) {
    std::atomic<int> calls{0};
    std::function<Result<int>()> op = [&calls]() -> Result<int> {
        if (++calls < 2) {
            return AgentError{ErrorCategory::Execution, "transient"};
        }
        return 7;
    };

    auto future = run_with_retry_async<int>(op, fast_policy(3), [](milliseconds) {});
    auto result = future.get();
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), 7);
    EXPECT_EQ(calls.load(), 2);
}

}  // namespace
