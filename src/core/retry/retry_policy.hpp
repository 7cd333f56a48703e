#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <random>
#include <string>
#include <utility>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"

namespace agentbox::core::retry {

    struct RetryPolicy {
        std::uint32_t max_attempts = 3;
        std::chrono::milliseconds initial_delay{1000};
        std::chrono::milliseconds max_delay{60000};
        double backoff_base = 2.0;
        bool jitter = true;
        std::vector<errors::ErrorCategory> retryable = {
            errors::ErrorCategory::Execution};

        bool is_retryable(const errors::AgentError& error) const;
    };

    // How the retry loop waits between attempts.
    using SuspendFn = std::function<void(std::chrono::milliseconds)>;

    // Delay sequence: initial_delay, initial_delay * base, ... capped at max_delay.
    // With jitter, each returned delay is scaled by uniform(0.5, 1.0); the
    // un-jittered value is what grows.
    class BackoffSchedule {
    public:
        explicit BackoffSchedule(const RetryPolicy& policy);

        std::chrono::milliseconds next();

    private:
        double current_ms_;
        double max_ms_;
        double base_;
        bool jitter_;
        std::mt19937 gen_;
    };

    void thread_sleep(std::chrono::milliseconds delay);

    template <typename T>
    errors::Result<T> retry_with_backoff(
        const std::function<errors::Result<T>()>& operation,
        const RetryPolicy& policy, const SuspendFn& suspend) {
        BackoffSchedule schedule(policy);
        const std::uint32_t max_attempts = std::max<std::uint32_t>(policy.max_attempts, 1);

        for (std::uint32_t attempt = 1;; ++attempt) {
            errors::Result<T> result = operation();
            if (!errors::is_error(result)) {
                return result;
            }

            const auto& error = errors::get_error(result);
            if (!policy.is_retryable(error)) {
                return result;
            }
            if (attempt >= max_attempts) {
                LOG_ERROR("Failed after " + std::to_string(max_attempts) +
                          " attempts: " + errors::describe(error));
                return result;
            }

            const auto delay = schedule.next();
            LOG_WARN("Attempt " + std::to_string(attempt) + "/" +
                     std::to_string(max_attempts) + " failed: " +
                     errors::describe(error) + ". Retrying in " +
                     std::to_string(delay.count()) + "ms...");
            suspend(delay);
        }
    }

    // Blocking adapter: waits on the caller's thread.
    template <typename T>
    errors::Result<T> run_with_retry(const std::function<errors::Result<T>()>& operation,
                                     const RetryPolicy& policy) {
        return retry_with_backoff<T>(operation, policy, thread_sleep);
    }

    // Non-blocking adapter: the whole attempt loop, waits included, runs on a
    // worker thread.
    template <typename T>
    std::future<errors::Result<T>> run_with_retry_async(
        std::function<errors::Result<T>()> operation, RetryPolicy policy,
        SuspendFn suspend = thread_sleep) {
        return std::async(std::launch::async,
                          [operation = std::move(operation), policy = std::move(policy),
                           suspend = std::move(suspend)]() {
                              return retry_with_backoff<T>(operation, policy, suspend);
                          });
    }

}  // namespace agentbox::core::retry
