#pragma once

#include <stash/result.hpp>
#include <stash/header.hpp>
#include <stash/mapping.hpp>
#include <stash/remote.hpp>
#include <stash/retry.hpp>
#include <stash/store.hpp>
#include <set>
#include <string>
#include <vector>

namespace stash {

struct InventoryOptions {
    RetryPolicy retry;
    bool private_documents = true;
    int lock_stale_seconds = 3600;
    HeaderDefaults header_defaults;
};

// Local edits to the script inventory. Changes land in the local store
// and reach the remote mapping record on the next push; publish() and
// remove() also touch the script's own remote document directly.
class Inventory {
public:
    Inventory(LocalStore& local, DocumentStore& remote, InventoryOptions options);

    // New unpublished entry. The body gets a default metadata header when
    // it has none; an empty description is taken from that header.
    Result<ScriptEntry> add(const std::string& name, const std::string& content,
                            const std::set<std::string>& tags = {},
                            const std::string& description = "");

    Result<ScriptEntry> update(const std::string& name, const std::string& content);

    // Drops the entry and its cached body, remembers the removal for the
    // next push, and deletes the script document if there is one.
    Status remove(const std::string& name);

    Result<std::vector<ScriptEntry>> list() const;
    Result<ScriptEntry> lookup(const std::string& name) const;

    // Cached body, downloaded first when missing or when refresh is set
    Result<std::string> fetch_script(const std::string& name, bool refresh = false);

    // Upload the cached body to the script's document, creating it when
    // the entry is unpublished or its document has disappeared
    Result<ScriptEntry> publish(const std::string& name);

private:
    Result<MappingRecord> load_existing(const std::string& name) const;

    LocalStore& local_;
    DocumentStore& remote_;
    InventoryOptions options_;
};

} // namespace stash
