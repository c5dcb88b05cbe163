#include <stash/lock.hpp>
#include <stash/clock.hpp>
#include <stash/log.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace stash {

static Result<bool> try_create(const std::string& path) {
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd < 0) {
        if (errno == EEXIST) return Result<bool>::ok(false);
        return StashError{StashError::IO,
            "cannot create lock file " + path + ": " + strerror(errno)};
    }
    std::string stamp = std::to_string(getpid()) + " " + format_utc(now_utc()) + "\n";
    ssize_t n = write(fd, stamp.data(), stamp.size());
    close(fd);
    if (n < 0) {
        std::error_code ec;
        fs::remove(path, ec);
        return StashError{StashError::IO,
            "cannot write lock file " + path + ": " + strerror(errno)};
    }
    return Result<bool>::ok(true);
}

static Result<std::optional<LockSnapshot>> snapshot_file(const std::string& path) {
    using R = Result<std::optional<LockSnapshot>>;
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT) return R::ok(std::nullopt);
        return StashError{StashError::IO,
            "cannot stat lock file " + path + ": " + strerror(errno)};
    }

    LockSnapshot snap;
    snap.inode = static_cast<uint64_t>(st.st_ino);
    snap.mtime_sec = static_cast<int64_t>(st.st_mtim.tv_sec);
    snap.mtime_nsec = static_cast<int64_t>(st.st_mtim.tv_nsec);

    std::ifstream in(path, std::ios::binary);
    if (in.is_open()) {
        std::ostringstream ss;
        ss << in.rdbuf();
        snap.content = ss.str();
    }
    return R::ok(std::move(snap));
}

Result<std::optional<LockSnapshot>> snapshot_lock(const std::string& path) {
    return snapshot_file(path);
}

Result<bool> reclaim_stale_lock(const std::string& path, const LockSnapshot& seen) {
    std::string aside = path + ".stale." + std::to_string(getpid());
    if (::rename(path.c_str(), aside.c_str()) != 0) {
        // Already reclaimed by someone else
        if (errno == ENOENT) return Result<bool>::ok(true);
        return StashError{StashError::IO,
            "cannot move stale lock " + path + ": " + strerror(errno)};
    }

    auto moved = snapshot_file(aside);
    std::error_code ec;
    if (moved.is_ok() && moved.value() && *moved.value() == seen) {
        fs::remove(aside, ec);
        return Result<bool>::ok(true);
    }

    // The file changed after it was judged stale, so it belongs to a live
    // process. link() fails rather than clobber a lock created since.
    if (::link(aside.c_str(), path.c_str()) != 0) {
        log::warn("could not restore sync lock %s: %s", path.c_str(), strerror(errno));
    }
    fs::remove(aside, ec);
    return Result<bool>::ok(false);
}

static bool is_stale(const LockSnapshot& snap, int stale_seconds) {
    auto age = static_cast<int64_t>(std::time(nullptr)) - snap.mtime_sec;
    return age >= stale_seconds;
}

Result<SyncLock> SyncLock::acquire(const std::string& path, int stale_seconds) {
    std::error_code ec;
    fs::path p(path);
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
        if (ec) {
            return StashError{StashError::IO,
                "cannot create directory " + p.parent_path().string() + ": " + ec.message()};
        }
    }

    auto created = try_create(path);
    if (created.is_err()) return std::move(created).error();
    if (created.value()) return Result<SyncLock>::ok(SyncLock(path));

    if (stale_seconds > 0) {
        auto seen = snapshot_file(path);
        if (seen.is_err()) return std::move(seen).error();
        if (seen.value() && is_stale(*seen.value(), stale_seconds)) {
            log::warn("reclaiming stale sync lock %s", path.c_str());
            auto reclaimed = reclaim_stale_lock(path, *seen.value());
            if (reclaimed.is_err()) return std::move(reclaimed).error();
            if (reclaimed.value()) {
                auto retried = try_create(path);
                if (retried.is_err()) return std::move(retried).error();
                if (retried.value()) return Result<SyncLock>::ok(SyncLock(path));
            }
        }
    }

    return StashError{StashError::SyncAlreadyInProgress,
        "another sync is already running",
        "wait for it to finish, or remove " + path + " if no stash process is alive"};
}

SyncLock::SyncLock(SyncLock&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

SyncLock& SyncLock::operator=(SyncLock&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

SyncLock::~SyncLock() {
    release();
}

void SyncLock::release() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        log::warn("failed to remove sync lock %s: %s", path_.c_str(), ec.message().c_str());
    }
    path_.clear();
}

} // namespace stash
