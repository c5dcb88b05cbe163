#include <stash/inventory.hpp>
#include <stash/lock.hpp>
#include <stash/log.hpp>
#include <stash/name.hpp>

#include <algorithm>

namespace stash {

Inventory::Inventory(LocalStore& local, DocumentStore& remote, InventoryOptions options)
    : local_(local), remote_(remote), options_(std::move(options)) {}

Result<MappingRecord> Inventory::load_existing(const std::string& name) const {
    STASH_TRY(ScriptName::parse(name));
    auto record = local_.load();
    if (record.is_err()) return record;
    if (!record.value().find(name)) {
        return StashError{StashError::NotFound,
            "no script named '" + name + "'",
            "see 'stash list' for the inventory"};
    }
    return record;
}

Result<ScriptEntry> Inventory::add(const std::string& name, const std::string& content,
                                   const std::set<std::string>& tags,
                                   const std::string& description) {
    STASH_TRY(ScriptName::parse(name));
    STASH_TRY(check_utf8(content, "body of '" + name + "'"));
    STASH_TRY(check_utf8(description, "description of '" + name + "'"));
    for (const auto& tag : tags) STASH_TRY(check_utf8(tag, "tag of '" + name + "'"));
    auto lock = SyncLock::acquire(local_.lock_path(), options_.lock_stale_seconds);
    if (lock.is_err()) return std::move(lock).error();

    auto loaded = local_.load();
    if (loaded.is_err()) return std::move(loaded).error();
    MappingRecord record = std::move(loaded).value();
    if (record.find(name)) {
        return StashError{StashError::InvalidArg,
            "script '" + name + "' already exists",
            "use 'stash add --force' to replace its body"};
    }

    HeaderDefaults defaults = options_.header_defaults;
    if (!description.empty()) defaults.description = description;
    defaults.tags.assign(tags.begin(), tags.end());
    std::string body = ensure_header(content, defaults);

    ScriptEntry entry;
    entry.script_name = name;
    entry.created_at = now_utc();
    entry.updated_at = entry.created_at;
    entry.tags = tags;
    entry.description = description;
    if (entry.description.empty()) {
        auto decoded = decode_header(body);
        if (decoded.header && decoded.header->description) {
            entry.description = *decoded.header->description;
        }
    }

    STASH_TRY(record.upsert(entry));
    record.pending_removals.erase(name);
    record.modified.erase(name);
    STASH_TRY(local_.cache_script(name, body));
    STASH_TRY(local_.save(record));
    log::info("added '%s'", name.c_str());
    return Result<ScriptEntry>::ok(std::move(entry));
}

Result<ScriptEntry> Inventory::update(const std::string& name, const std::string& content) {
    STASH_TRY(ScriptName::parse(name));
    STASH_TRY(check_utf8(content, "body of '" + name + "'"));
    auto lock = SyncLock::acquire(local_.lock_path(), options_.lock_stale_seconds);
    if (lock.is_err()) return std::move(lock).error();

    auto loaded = load_existing(name);
    if (loaded.is_err()) return std::move(loaded).error();
    MappingRecord record = std::move(loaded).value();
    ScriptEntry& entry = *record.find(name);

    HeaderDefaults defaults = options_.header_defaults;
    defaults.description = entry.description;
    defaults.tags.assign(entry.tags.begin(), entry.tags.end());
    std::string body = ensure_header(content, defaults);

    auto decoded = decode_header(body);
    if (decoded.header && decoded.header->description) {
        entry.description = *decoded.header->description;
    }
    entry.updated_at = std::max(now_utc(), entry.updated_at + 1);
    if (entry.is_published()) record.modified.insert(name);

    STASH_TRY(local_.cache_script(name, body));
    STASH_TRY(local_.save(record));
    log::info("updated '%s'", name.c_str());
    return Result<ScriptEntry>::ok(entry);
}

Status Inventory::remove(const std::string& name) {
    STASH_TRY(ScriptName::parse(name));
    auto lock = SyncLock::acquire(local_.lock_path(), options_.lock_stale_seconds);
    if (lock.is_err()) return std::move(lock).error();

    auto loaded = load_existing(name);
    if (loaded.is_err()) return std::move(loaded).error();
    MappingRecord record = std::move(loaded).value();

    std::string document_id = record.find(name)->document_id;
    record.erase(name);
    record.pending_removals.insert(name);
    record.modified.erase(name);
    STASH_TRY(local_.save(record));

    auto uncached = local_.remove_cached_script(name);
    if (uncached.is_err()) {
        log::warn("%s", uncached.error().message.c_str());
    }

    if (!document_id.empty()) {
        auto deleted = with_retry(options_.retry, "delete " + document_id,
                                  [&] { return remote_.delete_document(document_id); });
        if (deleted.is_err() && !deleted.is_err(StashError::RemoteNotFound)) {
            log::warn("could not delete document %s for '%s': %s",
                      document_id.c_str(), name.c_str(), deleted.error().message.c_str());
        }
    }
    log::info("removed '%s'", name.c_str());
    return ok_status();
}

Result<std::vector<ScriptEntry>> Inventory::list() const {
    auto record = local_.load();
    if (record.is_err()) return std::move(record).error();
    std::vector<ScriptEntry> out;
    out.reserve(record.value().entries.size());
    for (const auto& [name, entry] : record.value().entries) out.push_back(entry);
    return Result<std::vector<ScriptEntry>>::ok(std::move(out));
}

Result<ScriptEntry> Inventory::lookup(const std::string& name) const {
    auto record = load_existing(name);
    if (record.is_err()) return std::move(record).error();
    return Result<ScriptEntry>::ok(*record.value().find(name));
}

Result<std::string> Inventory::fetch_script(const std::string& name, bool refresh) {
    auto entry = lookup(name);
    if (entry.is_err()) return std::move(entry).error();

    bool cached = local_.has_cached_script(name);
    if (cached && (!refresh || !entry.value().is_published())) {
        return local_.read_cached_script(name);
    }
    if (!entry.value().is_published()) {
        return StashError{StashError::NotFound,
            "script '" + name + "' has no cached body and was never published"};
    }

    const std::string& id = entry.value().document_id;
    auto doc = with_retry(options_.retry, "download " + name,
                          [&] { return remote_.get_document(id); });
    if (doc.is_err()) return std::move(doc).error();

    STASH_TRY(local_.cache_script(name, doc.value().content));
    log::debug("downloaded '%s' from %s", name.c_str(), id.c_str());
    return Result<std::string>::ok(std::move(doc.value().content));
}

Result<ScriptEntry> Inventory::publish(const std::string& name) {
    STASH_TRY(ScriptName::parse(name));
    auto lock = SyncLock::acquire(local_.lock_path(), options_.lock_stale_seconds);
    if (lock.is_err()) return std::move(lock).error();

    auto loaded = load_existing(name);
    if (loaded.is_err()) return std::move(loaded).error();
    MappingRecord record = std::move(loaded).value();
    ScriptEntry& entry = *record.find(name);

    auto content = local_.read_cached_script(name);
    if (content.is_err()) return std::move(content).error();
    STASH_TRY(check_utf8(content.value(), "body of '" + name + "'"));

    bool needs_create = !entry.is_published();
    if (!needs_create) {
        auto updated = with_retry(options_.retry, "publish " + name, [&] {
            return remote_.update_document(entry.document_id, content.value(), std::nullopt);
        });
        if (updated.is_err(StashError::RemoteNotFound)) {
            log::warn("document %s for '%s' is gone, creating a new one",
                      entry.document_id.c_str(), name.c_str());
            needs_create = true;
        } else if (updated.is_err()) {
            return std::move(updated).error();
        }
    }

    if (needs_create) {
        NewDocument doc{script_file_name(name), content.value(),
                        script_document_description(name), options_.private_documents};
        auto created = remote_.create_document(doc);
        if (created.is_err()) return std::move(created).error();
        entry.document_id = created.value().document_id;
    }

    entry.updated_at = std::max(now_utc(), entry.updated_at + 1);
    record.modified.erase(name);
    STASH_TRY(local_.save(record));
    log::info("published '%s' to %s", name.c_str(), entry.document_id.c_str());
    return Result<ScriptEntry>::ok(entry);
}

} // namespace stash
