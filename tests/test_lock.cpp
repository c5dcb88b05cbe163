#include <catch2/catch.hpp>
#include <stash/lock.hpp>
#include "support/temp_dir.hpp"
#include <chrono>
#include <filesystem>

using namespace stash;
using stash::testing::TempDir;
namespace fs = std::filesystem;

TEST_CASE("lock file exists while held and is removed on scope exit", "[lock]") {
    TempDir td;
    std::string path = (td.path / "sync.lock").string();
    {
        auto lock = SyncLock::acquire(path, 3600);
        REQUIRE(lock.is_ok());
        REQUIRE(fs::exists(path));
    }
    REQUIRE_FALSE(fs::exists(path));
}

TEST_CASE("second acquire fails with SyncAlreadyInProgress", "[lock]") {
    TempDir td;
    std::string path = (td.path / "sync.lock").string();
    auto first = SyncLock::acquire(path, 3600);
    REQUIRE(first.is_ok());

    auto second = SyncLock::acquire(path, 3600);
    REQUIRE(second.is_err(StashError::SyncAlreadyInProgress));
    REQUIRE_FALSE(second.error().hint.empty());
    // The failed attempt must not remove the holder's file
    REQUIRE(fs::exists(path));
}

TEST_CASE("stale lock is reclaimed", "[lock]") {
    TempDir td;
    td.write_file("sync.lock", "12345 2020-01-01T00:00:00Z\n");
    std::string path = (td.path / "sync.lock").string();
    fs::last_write_time(path, fs::file_time_type::clock::now() - std::chrono::hours(2));

    auto lock = SyncLock::acquire(path, 3600);
    REQUIRE(lock.is_ok());
    REQUIRE(td.read_file("sync.lock") != "12345 2020-01-01T00:00:00Z\n");
}

TEST_CASE("fresh foreign lock is not reclaimed", "[lock]") {
    TempDir td;
    td.write_file("sync.lock", "12345\n");
    auto lock = SyncLock::acquire((td.path / "sync.lock").string(), 3600);
    REQUIRE(lock.is_err(StashError::SyncAlreadyInProgress));
}

TEST_CASE("moved lock is released once", "[lock]") {
    TempDir td;
    std::string path = (td.path / "sync.lock").string();
    auto r = SyncLock::acquire(path, 3600);
    REQUIRE(r.is_ok());
    {
        SyncLock moved = std::move(r).value();
        REQUIRE(moved.path() == path);
    }
    REQUIRE_FALSE(fs::exists(path));
    REQUIRE(SyncLock::acquire(path, 3600).is_ok());
}

TEST_CASE("reclaim removes a lock that is still the stale one", "[lock]") {
    TempDir td;
    td.write_file("sync.lock", "12345 2020-01-01T00:00:00Z\n");
    std::string path = (td.path / "sync.lock").string();

    auto seen = snapshot_lock(path);
    REQUIRE(seen.is_ok());
    REQUIRE(seen.value().has_value());
    REQUIRE(seen.value()->content == "12345 2020-01-01T00:00:00Z\n");

    auto reclaimed = reclaim_stale_lock(path, *seen.value());
    REQUIRE(reclaimed.is_ok());
    REQUIRE(reclaimed.value());
    REQUIRE_FALSE(fs::exists(path));
}

TEST_CASE("reclaim leaves a lock taken after the staleness check", "[lock]") {
    TempDir td;
    td.write_file("sync.lock", "12345 2020-01-01T00:00:00Z\n");
    std::string path = (td.path / "sync.lock").string();
    auto seen = snapshot_lock(path);
    REQUIRE(seen.is_ok());

    // Another process reclaimed it first and now holds a fresh lock
    fs::remove(path);
    td.write_file("sync.lock", "67890 2024-06-01T12:00:00Z\n");

    auto reclaimed = reclaim_stale_lock(path, *seen.value());
    REQUIRE(reclaimed.is_ok());
    REQUIRE_FALSE(reclaimed.value());
    REQUIRE(td.read_file("sync.lock") == "67890 2024-06-01T12:00:00Z\n");

    size_t files = 0;
    for (const auto& e : fs::directory_iterator(td.path)) {
        (void)e;
        ++files;
    }
    REQUIRE(files == 1);
}

TEST_CASE("reclaim of a lock that is already gone lets the caller retry", "[lock]") {
    TempDir td;
    std::string path = (td.path / "sync.lock").string();
    REQUIRE_FALSE(snapshot_lock(path).value().has_value());

    LockSnapshot seen;
    seen.content = "1\n";
    auto reclaimed = reclaim_stale_lock(path, seen);
    REQUIRE(reclaimed.is_ok());
    REQUIRE(reclaimed.value());
}
