#include <catch2/catch.hpp>
#include <stash/result.hpp>
#include <memory>
#include <string>

using namespace stash;

static Result<int> try_double(Result<int> input) {
    STASH_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Status try_steps(bool fail_second, int& steps) {
    auto first = Result<int>::ok(1);
    STASH_TRY(first);
    ++steps;
    auto second = fail_second
        ? Result<int>::err(StashError{StashError::Transport, "connection reset"})
        : Result<int>::ok(2);
    STASH_TRY(second);
    ++steps;
    return ok_status();
}

TEST_CASE("Ok result holds its value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
    REQUIRE(static_cast<bool>(r));
}

TEST_CASE("Err result holds its error", "[result]") {
    auto r = Result<int>::err(StashError{StashError::NotFound, "no script named 'x'"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StashError::NotFound);
    REQUIRE(r.error().message == "no script named 'x'");
    REQUIRE_FALSE(static_cast<bool>(r));
}

TEST_CASE("is_err(code) matches only that code", "[result]") {
    Result<int> r = StashError{StashError::RemoteNotFound, "gone"};
    REQUIRE(r.is_err(StashError::RemoteNotFound));
    REQUIRE_FALSE(r.is_err(StashError::Transport));
    REQUIRE_FALSE(Result<int>::ok(1).is_err(StashError::RemoteNotFound));
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(StashError{StashError::IO, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("value_or falls back on Err", "[result]") {
    REQUIRE(Result<int>::ok(3).value_or(9) == 3);
    REQUIRE(Result<int>::err(StashError{StashError::IO, "x"}).value_or(9) == 9);
}

TEST_CASE("map() transforms Ok and passes Err through", "[result]") {
    auto ok = Result<int>::ok(5).map([](int x) { return std::to_string(x); });
    REQUIRE(ok.value() == "5");

    bool called = false;
    auto err = Result<int>::err(StashError{StashError::Parse, "bad"})
        .map([&](int x) { called = true; return x; });
    REQUIRE(err.is_err(StashError::Parse));
    REQUIRE_FALSE(called);
}

TEST_CASE("and_then() short-circuits on Err", "[result]") {
    auto r = Result<int>::err(StashError{StashError::SyncConflict, "moved"});
    bool called = false;
    auto chained = r.and_then([&](int x) {
        called = true;
        return Result<int>::ok(x + 1);
    });
    REQUIRE(chained.is_err(StashError::SyncConflict));
    REQUIRE_FALSE(called);

    auto ok = Result<int>::ok(1).and_then([](int x) { return Result<int>::ok(x + 1); });
    REQUIRE(ok.value() == 2);
}

TEST_CASE("STASH_TRY propagates errors across result types", "[result]") {
    auto output = try_double(Result<int>::err(StashError{StashError::Parse, "syntax error"}));
    REQUIRE(output.is_err(StashError::Parse));
    REQUIRE(output.error().message == "syntax error");
    REQUIRE(try_double(Result<int>::ok(7)).value() == 14);
}

TEST_CASE("STASH_TRY stops at the first failing step", "[result]") {
    int steps = 0;
    auto s = try_steps(true, steps);
    REQUIRE(s.is_err(StashError::Transport));
    REQUIRE(steps == 1);

    steps = 0;
    REQUIRE(try_steps(false, steps).is_ok());
    REQUIRE(steps == 2);
}

TEST_CASE("Result with move-only type", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(*r.value() == 99);
    auto taken = std::move(r).value();
    REQUIRE(*taken == 99);
}

TEST_CASE("StashError format() with hint and location", "[error]") {
    StashError e{StashError::CorruptLocalState, "mapping file is unreadable",
                 "repair it by hand", "/home/u/.stash/mapping.json", 3};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[CorruptLocalState]: mapping file is unreadable") == 0);
    REQUIRE(formatted.find("\n  hint: repair it by hand") != std::string::npos);
    REQUIRE(formatted.find("--> /home/u/.stash/mapping.json:3") != std::string::npos);
}

TEST_CASE("StashError format() without hint or file", "[error]") {
    StashError e{StashError::Parse, "unexpected token"};
    REQUIRE(e.format() == "error[Parse]: unexpected token");
}

TEST_CASE("Only transport failures and rate limits are retryable", "[error]") {
    REQUIRE(StashError{StashError::Transport, ""}.is_retryable());
    REQUIRE(StashError{StashError::RateLimited, ""}.is_retryable());
    REQUIRE_FALSE(StashError{StashError::AuthenticationFailed, ""}.is_retryable());
    REQUIRE_FALSE(StashError{StashError::CorruptLocalState, ""}.is_retryable());
    REQUIRE_FALSE(StashError{StashError::RevisionMismatch, ""}.is_retryable());
    REQUIRE_FALSE(StashError{StashError::RemoteNotFound, ""}.is_retryable());
}

TEST_CASE("code_name() covers the sync taxonomy", "[error]") {
    REQUIRE(std::string(StashError::code_name(StashError::AmbiguousMapping)) == "AmbiguousMapping");
    REQUIRE(std::string(StashError::code_name(StashError::NoMappingFound)) == "NoMappingFound");
    REQUIRE(std::string(StashError::code_name(StashError::SyncAlreadyInProgress)) == "SyncAlreadyInProgress");
    REQUIRE(std::string(StashError::code_name(StashError::Cancelled)) == "Cancelled");
}
