#include <catch2/catch.hpp>
#include <stash/process.hpp>
#include <chrono>

using namespace stash;

TEST_CASE("run_command echo", "[process]") {
    auto r = run_command({"echo", "hello"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 0);
    REQUIRE(r.value().stdout_str == "hello\n");
}

TEST_CASE("run_command false returns nonzero", "[process]") {
    auto r = run_command({"false"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code != 0);
}

TEST_CASE("run_command captures stderr", "[process]") {
    auto r = run_command({"sh", "-c", "echo err >&2"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stderr_str == "err\n");
}

TEST_CASE("run_command passes arguments unmodified", "[process]") {
    auto r = run_command({"sh", "-c", "printf '%s|' \"$@\"", "sh", "a b", "", "--flag", "*"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str == "a b||--flag|*|");
}

TEST_CASE("run_command empty args error", "[process]") {
    auto r = run_command({});
    REQUIRE(r.is_err(StashError::InvalidArg));
}

TEST_CASE("run_command with working dir", "[process]") {
    auto r = run_command({"pwd"}, "/tmp");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str.find("tmp") != std::string::npos);
}

TEST_CASE("run_command nonexistent binary exits 127", "[process]") {
    auto r = run_command({"__stash_nonexistent_binary_xyz__"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 127);
}

TEST_CASE("run_command timeout", "[process]") {
    auto r = run_command({"sleep", "5"}, "", 1);
    REQUIRE(r.is_err(StashError::IO));
    REQUIRE(r.error().message.find("timed out") != std::string::npos);
}

TEST_CASE("run_interactive returns the exit code", "[process]") {
    auto r = run_interactive({"sh", "-c", "exit 3"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == 3);
}

TEST_CASE("run_interactive timeout", "[process]") {
    auto started = std::chrono::steady_clock::now();
    auto r = run_interactive({"sleep", "5"}, "", 1);
    REQUIRE(r.is_err(StashError::IO));
    REQUIRE(r.error().message.find("timed out") != std::string::npos);
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(4));
}

TEST_CASE("run_interactive with a timeout still reports the exit code", "[process]") {
    auto r = run_interactive({"sh", "-c", "exit 4"}, "", 10);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == 4);
}
