#include <stash/retry.hpp>

#include <algorithm>
#include <random>
#include <thread>

namespace stash {

RetryPolicy RetryPolicy::from_config(const SyncConfig& cfg) {
    RetryPolicy p;
    p.max_attempts = cfg.attempts;
    p.base_delay = std::chrono::milliseconds(cfg.backoff_ms);
    p.max_delay = std::chrono::milliseconds(cfg.max_backoff_ms);
    return p;
}

RetryPolicy RetryPolicy::none() {
    RetryPolicy p;
    p.max_attempts = 1;
    p.jitter = false;
    return p;
}

std::chrono::milliseconds RetryPolicy::delay_for(int attempt) const {
    if (attempt < 2) return std::chrono::milliseconds(0);
    long long delay = base_delay.count();
    for (int i = 2; i < attempt && delay < max_delay.count(); ++i) {
        delay *= 2;
    }
    delay = std::min<long long>(delay, max_delay.count());
    if (jitter && delay > 0) {
        static thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_int_distribution<long long> dist(0, delay / 2);
        delay += dist(rng);
    }
    return std::chrono::milliseconds(delay);
}

void RetryPolicy::sleep(std::chrono::milliseconds d) const {
    if (sleeper) {
        sleeper(d);
    } else if (d.count() > 0) {
        std::this_thread::sleep_for(d);
    }
}

} // namespace stash
