#pragma once

#include <stash/result.hpp>
#include <stash/config.hpp>
#include <stash/log.hpp>
#include <chrono>
#include <functional>
#include <string>

namespace stash {

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds base_delay{500};
    std::chrono::milliseconds max_delay{8000};
    bool jitter = true;

    // Replaced in tests to avoid real sleeps
    std::function<void(std::chrono::milliseconds)> sleeper;

    static RetryPolicy from_config(const SyncConfig& cfg);
    static RetryPolicy none();

    // Delay before attempt number `attempt` (1-based, so attempt 2 is the
    // first retry): base * 2^(attempt-2), capped, plus up to 50% jitter.
    std::chrono::milliseconds delay_for(int attempt) const;
    void sleep(std::chrono::milliseconds d) const;
};

// Call fn until it succeeds, fails with a non-retryable error, or the
// attempts run out. Only Transport and RateLimited are retried.
template<typename F>
auto with_retry(const RetryPolicy& policy, const std::string& what, F&& fn)
    -> decltype(fn()) {
    int attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
    for (int attempt = 1;; ++attempt) {
        auto result = fn();
        if (result.is_ok() || !result.error().is_retryable() || attempt >= attempts) {
            return result;
        }
        auto delay = policy.delay_for(attempt + 1);
        log::warn("%s failed (%s), retrying in %lldms [%d/%d]",
                  what.c_str(), result.error().message.c_str(),
                  static_cast<long long>(delay.count()), attempt + 1, attempts);
        policy.sleep(delay);
    }
}

} // namespace stash
