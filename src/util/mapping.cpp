#include <stash/mapping.hpp>
#include <stash/name.hpp>
#include <nlohmann/json.hpp>

namespace stash {

using json = nlohmann::json;

std::string script_document_description(const std::string& script_name) {
    return "[stash] " + script_name;
}

std::string script_file_name(const std::string& script_name) {
    const std::string ext = ".py";
    if (script_name.size() > ext.size() &&
        script_name.compare(script_name.size() - ext.size(), ext.size(), ext) == 0) {
        return script_name;
    }
    return script_name + ext;
}

bool ScriptEntry::operator==(const ScriptEntry& o) const {
    return script_name == o.script_name &&
           document_id == o.document_id &&
           created_at == o.created_at &&
           updated_at == o.updated_at &&
           tags == o.tags &&
           description == o.description;
}

// ---------------------------------------------------------------------------
// MappingRecord
// ---------------------------------------------------------------------------

const ScriptEntry* MappingRecord::find(const std::string& name) const {
    auto it = entries.find(name);
    return it == entries.end() ? nullptr : &it->second;
}

ScriptEntry* MappingRecord::find(const std::string& name) {
    auto it = entries.find(name);
    return it == entries.end() ? nullptr : &it->second;
}

Status MappingRecord::upsert(ScriptEntry entry) {
    STASH_TRY(ScriptName::parse(entry.script_name));
    STASH_TRY(check_utf8(entry.description, "description of '" + entry.script_name + "'"));
    for (const auto& tag : entry.tags) {
        STASH_TRY(check_utf8(tag, "tag of '" + entry.script_name + "'"));
    }
    std::string key = entry.script_name;
    entries[key] = std::move(entry);
    return ok_status();
}

bool MappingRecord::erase(const std::string& name) {
    return entries.erase(name) > 0;
}

// ---------------------------------------------------------------------------
// JSON conversion
// ---------------------------------------------------------------------------

static json entry_to_json(const ScriptEntry& e) {
    json j;
    j["script_name"] = e.script_name;
    j["document_id"] = e.document_id;
    j["created_at"] = format_utc(e.created_at);
    j["updated_at"] = format_utc(e.updated_at);
    j["tags"] = json::array();
    for (const auto& t : e.tags) j["tags"].push_back(t);
    if (!e.description.empty()) j["description"] = e.description;
    return j;
}

static Result<Timestamp> timestamp_field(const json& j, const char* field,
                                         const std::string& name) {
    if (!j.contains(field)) return Result<Timestamp>::ok(0);
    const auto& v = j.at(field);
    if (!v.is_string()) {
        return StashError{StashError::Parse,
            "entry '" + name + "': " + field + " must be a string"};
    }
    auto ts = parse_utc(v.get<std::string>());
    if (ts.is_err()) {
        return StashError{StashError::Parse,
            "entry '" + name + "': " + ts.error().message};
    }
    return ts;
}

static Result<ScriptEntry> entry_from_json(const std::string& key, const json& j) {
    if (!j.is_object()) {
        return StashError{StashError::Parse,
            "entry '" + key + "' must be an object"};
    }
    auto name = ScriptName::parse(key);
    if (name.is_err()) {
        return StashError{StashError::Parse, name.error().message};
    }

    ScriptEntry e;
    e.script_name = key;

    if (j.contains("script_name")) {
        const auto& sn = j.at("script_name");
        if (!sn.is_string() || sn.get<std::string>() != key) {
            return StashError{StashError::Parse,
                "entry '" + key + "': script_name does not match its key"};
        }
    }

    if (j.contains("document_id")) {
        const auto& id = j.at("document_id");
        if (id.is_string()) {
            e.document_id = id.get<std::string>();
        } else if (!id.is_null()) {
            return StashError{StashError::Parse,
                "entry '" + key + "': document_id must be a string"};
        }
    }

    auto created = timestamp_field(j, "created_at", key);
    if (created.is_err()) return std::move(created).error();
    e.created_at = created.value();

    auto updated = timestamp_field(j, "updated_at", key);
    if (updated.is_err()) return std::move(updated).error();
    e.updated_at = updated.value();

    if (j.contains("tags")) {
        const auto& tags = j.at("tags");
        if (!tags.is_array()) {
            return StashError{StashError::Parse,
                "entry '" + key + "': tags must be an array"};
        }
        for (const auto& t : tags) {
            if (!t.is_string()) {
                return StashError{StashError::Parse,
                    "entry '" + key + "': tags must be strings"};
            }
            e.tags.insert(t.get<std::string>());
        }
    }

    if (j.contains("description") && j.at("description").is_string()) {
        e.description = j.at("description").get<std::string>();
    }

    return Result<ScriptEntry>::ok(std::move(e));
}

static json record_to_json(const MappingRecord& record) {
    json j;
    j["schema"] = kMappingSchemaVersion;
    j["entries"] = json::object();
    for (const auto& [name, entry] : record.entries) {
        j["entries"][name] = entry_to_json(entry);
    }
    return j;
}

static Result<MappingRecord> record_from_json(const json& j) {
    if (!j.is_object()) {
        return StashError{StashError::Parse, "mapping record must be a JSON object"};
    }

    if (j.contains("schema")) {
        const auto& schema = j.at("schema");
        if (!schema.is_number_integer()) {
            return StashError{StashError::Parse, "mapping schema must be an integer"};
        }
        int version = schema.get<int>();
        if (version < 1 || version > kMappingSchemaVersion) {
            return StashError{StashError::Parse,
                "unsupported mapping schema version " + std::to_string(version),
                "upgrade stash to read this inventory"};
        }
    }

    if (!j.contains("entries") || !j.at("entries").is_object()) {
        return StashError{StashError::Parse,
            "mapping record has no 'entries' object"};
    }

    MappingRecord record;
    for (const auto& [key, value] : j.at("entries").items()) {
        auto entry = entry_from_json(key, value);
        if (entry.is_err()) return std::move(entry).error();
        record.entries.emplace(key, std::move(entry).value());
    }
    return Result<MappingRecord>::ok(std::move(record));
}

static Result<json> parse_json(const std::string& content) {
    try {
        return Result<json>::ok(json::parse(content));
    } catch (const json::exception& e) {
        return StashError{StashError::Parse,
            std::string("invalid JSON: ") + e.what()};
    }
}

std::string MappingRecord::to_document_json() const {
    return record_to_json(*this).dump(2) + "\n";
}

Result<MappingRecord> MappingRecord::from_document_json(const std::string& content) {
    auto j = parse_json(content);
    if (j.is_err()) return std::move(j).error();
    return record_from_json(j.value());
}

std::string MappingRecord::to_local_json() const {
    json j = record_to_json(*this);
    j["revision"] = revision ? json(*revision) : json(nullptr);
    j["last_synced"] = last_synced ? json(format_utc(*last_synced)) : json(nullptr);
    j["pending_removals"] = json::array();
    for (const auto& name : pending_removals) j["pending_removals"].push_back(name);
    j["modified"] = json::array();
    for (const auto& name : modified) j["modified"].push_back(name);
    return j.dump(2) + "\n";
}

static Status read_name_set(const json& doc, const char* key, std::set<std::string>& out) {
    if (!doc.contains(key)) return ok_status();
    const auto& arr = doc.at(key);
    if (!arr.is_array()) {
        return StashError{StashError::Parse, std::string(key) + " must be an array"};
    }
    for (const auto& name : arr) {
        if (!name.is_string()) {
            return StashError{StashError::Parse, std::string(key) + " must hold strings"};
        }
        out.insert(name.get<std::string>());
    }
    return ok_status();
}

Result<MappingRecord> MappingRecord::from_local_json(const std::string& content) {
    auto j = parse_json(content);
    if (j.is_err()) return std::move(j).error();

    auto record = record_from_json(j.value());
    if (record.is_err()) return record;
    auto& r = record.value();
    const auto& doc = j.value();

    if (doc.contains("revision")) {
        const auto& rev = doc.at("revision");
        if (rev.is_string()) {
            r.revision = rev.get<std::string>();
        } else if (!rev.is_null()) {
            return StashError{StashError::Parse, "revision must be a string or null"};
        }
    }

    if (doc.contains("last_synced") && !doc.at("last_synced").is_null()) {
        const auto& ls = doc.at("last_synced");
        if (!ls.is_string()) {
            return StashError{StashError::Parse, "last_synced must be a string or null"};
        }
        auto ts = parse_utc(ls.get<std::string>());
        if (ts.is_err()) return std::move(ts).error();
        r.last_synced = ts.value();
    }

    STASH_TRY(read_name_set(doc, "pending_removals", r.pending_removals));
    STASH_TRY(read_name_set(doc, "modified", r.modified));

    return record;
}

} // namespace stash
