#pragma once

#include <tally/core/types.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <thread>
#include <type_traits>

namespace tally {

/**
 * @brief Exponential backoff settings for retryable operations
 */
struct RetryPolicy {
    int maxAttempts = 5;                  ///< Total attempts including the first one
    Duration initialDelay{100};           ///< Wait before the second attempt
    double backoffMultiplier = 2.0;       ///< Delay growth per attempt
    Duration maxDelay{5000};              ///< Upper bound for a single wait
};

using SleepFunction = std::function<void(Duration)>;

/**
 * @brief Delay to wait after the given (1-based) failed attempt
 */
inline Duration backoffDelay(const RetryPolicy& policy, int failedAttempt) {
    double delay = static_cast<double>(policy.initialDelay.count());
    for (int i = 1; i < failedAttempt; ++i) {
        delay *= policy.backoffMultiplier;
        if (delay >= static_cast<double>(policy.maxDelay.count())) {
            return policy.maxDelay;
        }
    }
    return std::min(Duration{static_cast<Duration::rep>(delay)}, policy.maxDelay);
}

/**
 * @brief Run fn until it succeeds, the error is not retryable, or attempts run out
 *
 * @param fn          callable returning a Result<T>
 * @param shouldRetry (const Error&, int attempt) -> bool, called after each failure;
 *                    may perform cleanup such as dropping a broken connection
 * @param sleep       optional sleep hook (tests pass a recorder)
 * @return the first successful Result, or the last failure
 */
template <typename Fn, typename ShouldRetry>
auto retryWithBackoff(const RetryPolicy& policy, Fn&& fn, ShouldRetry&& shouldRetry,
                      const SleepFunction& sleep = {}) -> std::invoke_result_t<Fn&> {
    const int attempts = std::max(1, policy.maxAttempts);
    for (int attempt = 1;; ++attempt) {
        auto result = fn();
        if (result) {
            return result;
        }
        if (attempt >= attempts || !shouldRetry(result.error(), attempt)) {
            return result;
        }
        auto delay = backoffDelay(policy, attempt);
        if (sleep) {
            sleep(delay);
        } else {
            std::this_thread::sleep_for(delay);
        }
    }
}

} // namespace tally
