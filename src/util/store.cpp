#include <stash/store.hpp>
#include <stash/name.hpp>
#include <stash/log.hpp>
#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace stash {

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// File helpers
// ---------------------------------------------------------------------------

Result<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return StashError{StashError::IO, "cannot open " + path};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return StashError{StashError::IO, "read failed: " + path};
    }
    return Result<std::string>::ok(ss.str());
}

static Status fsync_directory(const fs::path& dir) {
    std::string d = dir.empty() ? "." : dir.string();
    int fd = ::open(d.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return StashError{StashError::IO,
            "cannot open directory " + d + ": " + std::strerror(errno)};
    }
    int rc = ::fsync(fd);
    int saved = errno;
    ::close(fd);
    if (rc != 0) {
        return StashError{StashError::IO,
            "fsync failed on " + d + ": " + std::strerror(saved)};
    }
    return ok_status();
}

static Status write_all_synced(const std::string& path, const std::string& content) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        return StashError{StashError::IO,
            "cannot write " + path + ": " + std::strerror(errno)};
    }

    const char* data = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            int saved = errno;
            ::close(fd);
            return StashError{StashError::IO,
                "write failed: " + path + ": " + std::strerror(saved)};
        }
        data += n;
        left -= static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        int saved = errno;
        ::close(fd);
        return StashError{StashError::IO,
            "fsync failed on " + path + ": " + std::strerror(saved)};
    }
    if (::close(fd) != 0) {
        return StashError{StashError::IO,
            "close failed on " + path + ": " + std::strerror(errno)};
    }
    return ok_status();
}

Status write_file_atomic(const std::string& path, const std::string& content) {
    fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return StashError{StashError::IO,
                "cannot create directory " + target.parent_path().string() +
                ": " + ec.message()};
        }
    }

    // The data must be on disk before the rename makes it visible, and the
    // rename itself is durable only once the directory is synced.
    std::string tmp = path + ".tmp." + std::to_string(getpid());
    auto written = write_all_synced(tmp, content);
    if (written.is_err()) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return written;
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return StashError{StashError::IO,
            "cannot replace " + path + ": " + ec.message()};
    }
    return fsync_directory(target.parent_path());
}

// ---------------------------------------------------------------------------
// LocalStore
// ---------------------------------------------------------------------------

LocalStore::LocalStore(std::string root)
    : root_(std::move(root)) {}

std::string LocalStore::mapping_path() const {
    return (fs::path(root_) / "mapping.json").string();
}

std::string LocalStore::pointer_path() const {
    return (fs::path(root_) / "pointer.json").string();
}

std::string LocalStore::lock_path() const {
    return (fs::path(root_) / "sync.lock").string();
}

std::string LocalStore::scripts_dir() const {
    return (fs::path(root_) / "scripts").string();
}

std::string LocalStore::script_path(const std::string& name) const {
    return (fs::path(scripts_dir()) / script_file_name(name)).string();
}

Result<MappingRecord> LocalStore::load() const {
    std::string path = mapping_path();
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        log::debug("no mapping file at %s, starting empty", path.c_str());
        return Result<MappingRecord>::ok(MappingRecord{});
    }

    auto content = read_file(path);
    if (content.is_err()) {
        return StashError{StashError::CorruptLocalState,
            content.error().message,
            "check permissions on " + path};
    }

    auto record = MappingRecord::from_local_json(content.value());
    if (record.is_err()) {
        return StashError{StashError::CorruptLocalState,
            "mapping file is unreadable: " + record.error().message,
            "repair or move " + path + " aside; it is never reset automatically",
            path, 0};
    }
    return record;
}

Status LocalStore::save(const MappingRecord& record) const {
    std::string content;
    try {
        content = record.to_local_json();
    } catch (const json::exception& e) {
        return StashError{StashError::InvalidArg,
            std::string("cannot encode the mapping record: ") + e.what(),
            "script names, descriptions and tags must be UTF-8"};
    }
    return write_file_atomic(mapping_path(), content);
}

Status LocalStore::cache_script(const std::string& name, const std::string& content) const {
    STASH_TRY(ScriptName::parse(name));
    return write_file_atomic(script_path(name), content);
}

Result<std::string> LocalStore::read_cached_script(const std::string& name) const {
    STASH_TRY(ScriptName::parse(name));
    std::string path = script_path(name);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return StashError{StashError::NotFound,
            "script '" + name + "' is not cached locally"};
    }
    return read_file(path);
}

bool LocalStore::has_cached_script(const std::string& name) const {
    if (!ScriptName::is_valid(name)) return false;
    std::error_code ec;
    return fs::exists(script_path(name), ec);
}

Status LocalStore::remove_cached_script(const std::string& name) const {
    STASH_TRY(ScriptName::parse(name));
    std::error_code ec;
    fs::remove(script_path(name), ec);
    if (ec) {
        return StashError{StashError::IO,
            "cannot remove cached script '" + name + "': " + ec.message()};
    }
    return ok_status();
}

Result<std::optional<RemoteDocumentPointer>> LocalStore::load_pointer() const {
    using R = Result<std::optional<RemoteDocumentPointer>>;
    std::string path = pointer_path();
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return R::ok(std::nullopt);
    }

    auto content = read_file(path);
    if (content.is_err()) {
        return StashError{StashError::CorruptLocalState, content.error().message};
    }

    RemoteDocumentPointer ptr;
    try {
        json j = json::parse(content.value());
        ptr.document_id = j.at("document_id").get<std::string>();
        if (j.contains("owner") && j.at("owner").is_string()) {
            ptr.owner = j.at("owner").get<std::string>();
        }
        if (j.contains("adopted_at") && j.at("adopted_at").is_string()) {
            auto ts = parse_utc(j.at("adopted_at").get<std::string>());
            if (ts.is_err()) {
                return StashError{StashError::CorruptLocalState,
                    "pointer file: " + ts.error().message, "", path, 0};
            }
            ptr.adopted_at = ts.value();
        }
    } catch (const json::exception& e) {
        return StashError{StashError::CorruptLocalState,
            std::string("pointer file is unreadable: ") + e.what(),
            "repair or delete " + path + " to rediscover the mapping",
            path, 0};
    }

    if (ptr.document_id.empty()) {
        return StashError{StashError::CorruptLocalState,
            "pointer file has an empty document_id", "", path, 0};
    }
    return R::ok(std::move(ptr));
}

Status LocalStore::save_pointer(const RemoteDocumentPointer& pointer) const {
    json j;
    j["document_id"] = pointer.document_id;
    j["owner"] = pointer.owner;
    j["adopted_at"] = format_utc(pointer.adopted_at);
    std::string content;
    try {
        content = j.dump(2) + "\n";
    } catch (const json::exception& e) {
        return StashError{StashError::InvalidArg,
            std::string("cannot encode the pointer file: ") + e.what()};
    }
    return write_file_atomic(pointer_path(), content);
}

} // namespace stash
