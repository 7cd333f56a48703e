#include "core/retry/retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace agentbox::core::retry {

bool RetryPolicy::is_retryable(const errors::AgentError& error) const {
    return std::find(retryable.begin(), retryable.end(), error.category) !=
           retryable.end();
}

BackoffSchedule::BackoffSchedule(const RetryPolicy& policy)
    : current_ms_(static_cast<double>(policy.initial_delay.count())),
      max_ms_(static_cast<double>(policy.max_delay.count())),
      base_(policy.backoff_base),
      jitter_(policy.jitter),
      gen_(std::random_device{}()) {}

std::chrono::milliseconds BackoffSchedule::next() {
    double actual_ms = std::min(current_ms_, max_ms_);
    if (jitter_) {
        std::uniform_real_distribution<double> dis(0.5, 1.0);
        actual_ms *= dis(gen_);
    }
    current_ms_ = std::min(current_ms_ * base_, max_ms_);
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(actual_ms)));
}

void thread_sleep(const std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
}

}  // namespace agentbox::core::retry
