#pragma once

#include <stash/result.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace stash {

// Advisory lock file held for the duration of one sync run. Two runs
// against the same local store never overlap; the second one fails with
// SyncAlreadyInProgress. A lock older than stale_seconds is assumed to
// belong to a crashed process and is taken over.
class SyncLock {
public:
    static Result<SyncLock> acquire(const std::string& path, int stale_seconds);

    SyncLock(SyncLock&& other) noexcept;
    SyncLock& operator=(SyncLock&& other) noexcept;
    SyncLock(const SyncLock&) = delete;
    SyncLock& operator=(const SyncLock&) = delete;
    ~SyncLock();

    const std::string& path() const { return path_; }
    void release();

private:
    explicit SyncLock(std::string path) : path_(std::move(path)) {}
    std::string path_;
};

// What a lock file looked like when it was judged stale
struct LockSnapshot {
    uint64_t inode = 0;
    int64_t mtime_sec = 0;
    int64_t mtime_nsec = 0;
    std::string content;

    bool operator==(const LockSnapshot& o) const {
        return inode == o.inode && mtime_sec == o.mtime_sec &&
               mtime_nsec == o.mtime_nsec && content == o.content;
    }
};

// None when no lock file exists
Result<std::optional<LockSnapshot>> snapshot_lock(const std::string& path);

// Move the lock file aside and delete it, but only if it is still the file
// described by `seen`. A lock another process took in the meantime is put
// back and false is returned. True means the caller may try to create the
// lock again.
Result<bool> reclaim_stale_lock(const std::string& path, const LockSnapshot& seen);

} // namespace stash
