#pragma once

#include <stash/result.hpp>
#include <stash/clock.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace stash {

// Description reserved for mapping-record documents. Discovery matches it
// exactly; script documents are described as "[stash] <name>" and can
// never collide with it. Bump the version suffix when the schema changes.
inline constexpr const char* kMappingSentinel = "stash:mapping-record:v1";
inline constexpr int kMappingSchemaVersion = 1;

// File name the mapping record is stored under inside its remote document
inline constexpr const char* kMappingFileName = "stash-mapping.json";

std::string script_document_description(const std::string& script_name);
std::string script_file_name(const std::string& script_name);

struct ScriptEntry {
    std::string script_name;
    std::string document_id;      // empty until first published
    Timestamp created_at = 0;
    Timestamp updated_at = 0;
    std::set<std::string> tags;
    std::string description;

    bool is_published() const { return !document_id.empty(); }

    bool operator==(const ScriptEntry& o) const;
    bool operator!=(const ScriptEntry& o) const { return !(*this == o); }
};

struct MappingRecord {
    std::map<std::string, ScriptEntry> entries;
    std::optional<std::string> revision;       // none until first sync

    // Local-only bookkeeping, never written to the remote document
    std::optional<Timestamp> last_synced;
    std::set<std::string> pending_removals;
    std::set<std::string> modified;            // published, body edited since last push

    const ScriptEntry* find(const std::string& name) const;
    ScriptEntry* find(const std::string& name);

    // Insert or replace; the key is the entry's script_name
    Status upsert(ScriptEntry entry);
    bool erase(const std::string& name);

    // Remote document content: {"schema": 1, "entries": {...}}
    std::string to_document_json() const;
    static Result<MappingRecord> from_document_json(const std::string& content);

    // Local file: document content plus revision and local bookkeeping
    std::string to_local_json() const;
    static Result<MappingRecord> from_local_json(const std::string& content);
};

} // namespace stash
