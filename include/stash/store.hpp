#pragma once

#include <stash/result.hpp>
#include <stash/mapping.hpp>
#include <optional>
#include <string>

namespace stash {

// Which remote document holds the mapping record, and whose account
// discovery searched to find it
struct RemoteDocumentPointer {
    std::string document_id;
    std::string owner;
    Timestamp adopted_at = 0;

    bool operator==(const RemoteDocumentPointer& o) const {
        return document_id == o.document_id && owner == o.owner &&
               adopted_at == o.adopted_at;
    }
};

// Durable local state under one root directory:
//
//   <root>/mapping.json        mapping record + revision
//   <root>/pointer.json        RemoteDocumentPointer
//   <root>/scripts/<file>      cached script bodies
//   <root>/sync.lock           advisory lock held during a sync
class LocalStore {
public:
    explicit LocalStore(std::string root);

    // Missing file: empty record without revision.
    // Unreadable or unparsable file: CorruptLocalState.
    Result<MappingRecord> load() const;
    Status save(const MappingRecord& record) const;

    Status cache_script(const std::string& name, const std::string& content) const;
    Result<std::string> read_cached_script(const std::string& name) const;
    bool has_cached_script(const std::string& name) const;
    Status remove_cached_script(const std::string& name) const;

    Result<std::optional<RemoteDocumentPointer>> load_pointer() const;
    Status save_pointer(const RemoteDocumentPointer& pointer) const;

    const std::string& root() const { return root_; }
    std::string mapping_path() const;
    std::string pointer_path() const;
    std::string lock_path() const;
    std::string scripts_dir() const;
    std::string script_path(const std::string& name) const;

private:
    std::string root_;
};

// Write to a sibling temp file, then rename over the target, so readers
// see either the old or the new contents and never a partial file.
Status write_file_atomic(const std::string& path, const std::string& content);

Result<std::string> read_file(const std::string& path);

} // namespace stash
