#include <catch2/catch.hpp>
#include <stash/retry.hpp>
#include <vector>

using namespace stash;
using std::chrono::milliseconds;

static RetryPolicy recording_policy(std::vector<milliseconds>& sleeps, int attempts = 3) {
    RetryPolicy p;
    p.max_attempts = attempts;
    p.base_delay = milliseconds(100);
    p.max_delay = milliseconds(250);
    p.jitter = false;
    p.sleeper = [&sleeps](milliseconds d) { sleeps.push_back(d); };
    return p;
}

TEST_CASE("success on the first attempt does not sleep", "[retry]") {
    std::vector<milliseconds> sleeps;
    int calls = 0;
    auto r = with_retry(recording_policy(sleeps), "op", [&] {
        ++calls;
        return Result<int>::ok(7);
    });
    REQUIRE(r.value() == 7);
    REQUIRE(calls == 1);
    REQUIRE(sleeps.empty());
}

TEST_CASE("transient failures are retried with backoff", "[retry]") {
    std::vector<milliseconds> sleeps;
    int calls = 0;
    auto r = with_retry(recording_policy(sleeps), "op", [&]() -> Result<int> {
        if (++calls < 3) return StashError{StashError::Transport, "reset"};
        return Result<int>::ok(1);
    });
    REQUIRE(r.is_ok());
    REQUIRE(calls == 3);
    REQUIRE(sleeps == std::vector<milliseconds>{milliseconds(100), milliseconds(200)});
}

TEST_CASE("attempts are capped and the last error returned", "[retry]") {
    std::vector<milliseconds> sleeps;
    int calls = 0;
    auto r = with_retry(recording_policy(sleeps), "op", [&]() -> Result<int> {
        ++calls;
        return StashError{StashError::RateLimited, "slow down " + std::to_string(calls)};
    });
    REQUIRE(r.is_err(StashError::RateLimited));
    REQUIRE(r.error().message == "slow down 3");
    REQUIRE(calls == 3);
    REQUIRE(sleeps.size() == 2);
}

TEST_CASE("non-retryable errors return immediately", "[retry]") {
    std::vector<milliseconds> sleeps;
    for (auto code : {StashError::AuthenticationFailed, StashError::CorruptLocalState,
                      StashError::RemoteNotFound, StashError::RevisionMismatch}) {
        int calls = 0;
        auto r = with_retry(recording_policy(sleeps), "op", [&]() -> Status {
            ++calls;
            return StashError{code, "no"};
        });
        REQUIRE(r.is_err(code));
        REQUIRE(calls == 1);
    }
    REQUIRE(sleeps.empty());
}

TEST_CASE("delay doubles up to the cap", "[retry]") {
    std::vector<milliseconds> sleeps;
    auto p = recording_policy(sleeps, 6);
    REQUIRE(p.delay_for(1) == milliseconds(0));
    REQUIRE(p.delay_for(2) == milliseconds(100));
    REQUIRE(p.delay_for(3) == milliseconds(200));
    REQUIRE(p.delay_for(4) == milliseconds(250));
    REQUIRE(p.delay_for(9) == milliseconds(250));
}

TEST_CASE("jitter adds at most half the delay", "[retry]") {
    RetryPolicy p;
    p.base_delay = milliseconds(100);
    p.max_delay = milliseconds(1000);
    p.jitter = true;
    for (int i = 0; i < 50; ++i) {
        auto d = p.delay_for(2);
        REQUIRE(d >= milliseconds(100));
        REQUIRE(d <= milliseconds(150));
    }
}

TEST_CASE("policy from config", "[retry]") {
    SyncConfig cfg;
    cfg.attempts = 5;
    cfg.backoff_ms = 10;
    cfg.max_backoff_ms = 40;
    auto p = RetryPolicy::from_config(cfg);
    REQUIRE(p.max_attempts == 5);
    REQUIRE(p.base_delay == milliseconds(10));
    REQUIRE(p.max_delay == milliseconds(40));
    REQUIRE(RetryPolicy::none().max_attempts == 1);
}
