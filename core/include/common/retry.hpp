#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <thread>

namespace pc {
    struct RetryPolicy {
        int max_attempts = 3;
        std::chrono::milliseconds base_delay{1000};

        // Replaceable so tests do not sleep.
        std::function<void(std::chrono::milliseconds)> sleep = [](std::chrono::milliseconds d) {
            std::this_thread::sleep_for(d);
        };
    };

    // base * 2^(attempt-1), attempt is 1-based
    inline std::chrono::milliseconds backoff_delay(const RetryPolicy& p, int attempt) {
        const int shift = std::clamp(attempt - 1, 0, 20);
        return p.base_delay * (int64_t{1} << shift);
    }

    using RetryFailureFn = std::function<void(int attempt, const std::exception& e)>;
    using RetryablePredicate = std::function<bool(const std::exception& e)>;

    // Runs fn(attempt) until it returns or max_attempts is reached. The last exception is
    // rethrown; a non-retryable exception is rethrown immediately.
    template <class Fn>
    auto with_retry(const RetryPolicy& policy,
                    Fn&& fn,
                    const RetryFailureFn& on_failure = {},
                    const RetryablePredicate& retryable = {}) -> decltype(fn(1)) {
        const int max_attempts = std::max(1, policy.max_attempts);
        for (int attempt = 1;; ++attempt) {
            try {
                return fn(attempt);
            } catch (const std::exception& e) {
                if (on_failure) on_failure(attempt, e);
                if (attempt >= max_attempts) throw;
                if (retryable && !retryable(e)) throw;

                const auto delay = backoff_delay(policy, attempt);
                if (policy.sleep && delay.count() > 0) policy.sleep(delay);
            }
        }
    }
}
