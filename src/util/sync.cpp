#include <stash/sync.hpp>
#include <stash/lock.hpp>
#include <stash/log.hpp>
#include <stash/name.hpp>

#include <algorithm>

namespace stash {

const char* state_name(SyncState s) {
    switch (s) {
        case SyncState::Idle:             return "IDLE";
        case SyncState::ResolvingPointer: return "RESOLVING_POINTER";
        case SyncState::Fetching:         return "FETCHING";
        case SyncState::Reconciling:      return "RECONCILING";
        case SyncState::Pushing:          return "PUSHING";
        case SyncState::Done:             return "DONE";
        case SyncState::Failed:           return "FAILED";
    }
    return "UNKNOWN";
}

const char* mode_name(SyncMode m) {
    return m == SyncMode::Pull ? "pull" : "push";
}

// ---------------------------------------------------------------------------
// reconcile
// ---------------------------------------------------------------------------

ReconcileResult reconcile(const MappingRecord& local, const MappingRecord& remote,
                          SyncMode mode) {
    ReconcileResult out;
    out.merged.revision = remote.revision;
    out.merged.last_synced = local.last_synced;
    out.merged.pending_removals = local.pending_removals;

    for (const auto& [name, theirs] : remote.entries) {
        const ScriptEntry* ours = local.find(name);
        if (!ours && local.pending_removals.count(name)) continue;

        if (!ours || theirs.updated_at >= ours->updated_at) {
            out.merged.entries.emplace(name, theirs);
            out.from_remote.push_back(name);
        } else {
            out.merged.entries.emplace(name, *ours);
            out.from_local.push_back(name);
            // A newer local entry of a published script carries a newer body
            if (ours->is_published()) out.merged.modified.insert(name);
        }
    }

    for (const auto& [name, ours] : local.entries) {
        if (remote.find(name)) continue;
        if (mode == SyncMode::Pull && ours.is_published()) continue;
        out.merged.entries.emplace(name, ours);
        out.from_local.push_back(name);
        if (ours.is_published() && local.modified.count(name)) {
            out.merged.modified.insert(name);
        }
    }

    out.differs_from_remote = out.merged.entries != remote.entries;
    return out;
}

// ---------------------------------------------------------------------------
// SyncEngine
// ---------------------------------------------------------------------------

SyncEngine::SyncEngine(LocalStore& local, DocumentStore& remote,
                       InventoryDiscovery& discovery, SyncEngineOptions options)
    : local_(local), remote_(remote), discovery_(discovery), options_(std::move(options)) {}

Status SyncEngine::enter(SyncState next, const CancelToken& cancel, SyncReport& report) {
    if (cancel.cancelled()) {
        return StashError{StashError::Cancelled,
            std::string("sync cancelled before ") + state_name(next)};
    }
    log::debug("sync: %s -> %s", state_name(report.final_state), state_name(next));
    report.visited.push_back(next);
    report.final_state = next;
    return ok_status();
}

SyncReport SyncEngine::run(SyncMode mode, const CancelToken& cancel) {
    SyncReport report;
    report.mode = mode;
    report.visited.push_back(SyncState::Idle);
    std::vector<std::string> created_ids;

    Status status = ok_status();
    {
        auto lock = SyncLock::acquire(local_.lock_path(), options_.lock_stale_seconds);
        if (lock.is_err()) {
            status = std::move(lock).error();
        } else {
            status = execute(mode, cancel, report, created_ids);
            // Documents the written mapping points at must stay
            if (status.is_err() && !report.mapping_written) {
                delete_orphans(created_ids);
            }
        }
    }

    if (status.is_ok()) {
        log::info("%s finished: %zu from remote, %zu from local, %zu published, %zu re-uploaded%s",
                  mode_name(mode), report.adopted_from_remote.size(),
                  report.kept_from_local.size(), report.created_documents.size(),
                  report.updated_documents.size(),
                  report.mapping_written ? ", mapping updated" : "");
        return report;
    }

    log::error("%s failed in %s: %s", mode_name(mode),
               state_name(report.final_state), status.error().message.c_str());
    report.visited.push_back(SyncState::Failed);
    report.final_state = SyncState::Failed;
    report.error = std::move(status).error();
    return report;
}

void SyncEngine::delete_orphans(const std::vector<std::string>& ids) {
    for (const auto& id : ids) {
        auto removed = remote_.delete_document(id);
        if (removed.is_err()) {
            log::warn("could not delete orphaned document %s: %s",
                      id.c_str(), removed.error().message.c_str());
        }
    }
}

Status SyncEngine::execute(SyncMode mode, const CancelToken& cancel, SyncReport& report,
                           std::vector<std::string>& created_ids) {
    STASH_TRY(enter(SyncState::ResolvingPointer, cancel, report));

    auto loaded = local_.load();
    if (loaded.is_err()) return std::move(loaded).error();
    MappingRecord local = std::move(loaded).value();

    auto pointer = local_.load_pointer();
    if (pointer.is_err()) return std::move(pointer).error();

    std::string document_id;
    bool save_pointer = true;
    if (pointer.value()) {
        document_id = pointer.value()->document_id;
        save_pointer = false;
    } else {
        auto found = discovery_.discover(false);
        if (found.is_err()) return std::move(found).error();
        if (found.value().kind == DiscoveryResult::Ambiguous) return found.value().to_error();
        if (found.value().kind == DiscoveryResult::Found) {
            document_id = found.value().document_id;
        }
    }

    if (document_id.empty()) {
        return create_mapping(mode, cancel, local, report, created_ids);
    }

    bool rediscovered = false;
    for (;;) {
        STASH_TRY(enter(SyncState::Fetching, cancel, report));
        auto doc = with_retry(options_.retry, "fetch mapping record",
                              [&] { return remote_.get_document(document_id); });

        if (doc.is_err(StashError::RemoteNotFound) && !rediscovered) {
            rediscovered = true;
            log::warn("mapping document %s no longer exists, rediscovering",
                      document_id.c_str());
            auto found = discovery_.discover(false);
            if (found.is_err()) return std::move(found).error();
            if (found.value().kind == DiscoveryResult::Ambiguous) {
                return found.value().to_error();
            }
            if (found.value().kind == DiscoveryResult::NoMapping) {
                return create_mapping(mode, cancel, local, report, created_ids);
            }
            document_id = found.value().document_id;
            save_pointer = true;
            continue;
        }
        if (doc.is_err()) return std::move(doc).error();

        auto remote = MappingRecord::from_document_json(doc.value().content);
        if (remote.is_err()) {
            return StashError{StashError::CorruptRemoteState,
                "mapping document " + document_id + " is unreadable: " +
                remote.error().message,
                "fix the document by hand or adopt another one"};
        }
        remote.value().revision = doc.value().revision;
        report.document_id = document_id;
        report.revision = doc.value().revision;

        STASH_TRY(enter(SyncState::Reconciling, cancel, report));
        auto result = reconcile(local, remote.value(), mode);
        report.adopted_from_remote = result.from_remote;
        report.kept_from_local = result.from_local;

        if (mode == SyncMode::Pull) {
            return commit(std::move(result.merged), document_id, false, save_pointer,
                          cancel, report);
        }

        STASH_TRY(enter(SyncState::Pushing, cancel, report));
        STASH_TRY(publish_pending(local, result.merged, report, created_ids));

        if (result.merged.entries != remote.value().entries) {
            auto revision = with_retry(options_.retry, "update mapping record", [&] {
                return remote_.update_document(document_id, result.merged.to_document_json(),
                                               remote.value().revision);
            });
            if (revision.is_err(StashError::RevisionMismatch)) {
                if (report.conflict_retries >= 1) {
                    return StashError{StashError::SyncConflict,
                        "mapping document " + document_id +
                        " changed again while retrying the push",
                        "another device is writing concurrently; run the sync again"};
                }
                ++report.conflict_retries;
                log::warn("mapping document moved since it was fetched, re-fetching");
                continue;
            }
            if (revision.is_err()) return std::move(revision).error();

            result.merged.revision = revision.value();
            report.revision = revision.value();
            report.mapping_written = true;
        }

        return commit(std::move(result.merged), document_id, true, save_pointer,
                      cancel, report);
    }
}

Status SyncEngine::create_mapping(SyncMode mode, const CancelToken& cancel, MappingRecord& local,
                                  SyncReport& report, std::vector<std::string>& created_ids) {
    if (mode == SyncMode::Pull) {
        log::info("no remote mapping record yet, nothing to pull");
        return enter(SyncState::Done, cancel, report);
    }

    STASH_TRY(enter(SyncState::Pushing, cancel, report));
    MappingRecord record = local;
    STASH_TRY(publish_pending(local, record, report, created_ids));

    // Creates are not retried; a lost response would leave a duplicate
    // sentinel document and make discovery ambiguous.
    NewDocument doc{kMappingFileName, record.to_document_json(), kMappingSentinel,
                    options_.private_documents};
    auto created = remote_.create_document(doc);
    if (created.is_err()) return std::move(created).error();

    log::info("created mapping record %s", created.value().document_id.c_str());
    record.revision = created.value().revision;
    report.document_id = created.value().document_id;
    report.revision = created.value().revision;
    report.mapping_written = true;
    for (const auto& [name, entry] : record.entries) report.kept_from_local.push_back(name);

    return commit(std::move(record), created.value().document_id, true, true, cancel, report);
}

Result<std::string> SyncEngine::create_script_document(const std::string& name,
                                                      const std::string& content,
                                                      SyncReport& report,
                                                      std::vector<std::string>& created_ids) {
    NewDocument doc{script_file_name(name), content,
                    script_document_description(name), options_.private_documents};
    auto created = remote_.create_document(doc);
    if (created.is_err()) return std::move(created).error();

    created_ids.push_back(created.value().document_id);
    report.created_documents.push_back(name);
    log::info("published '%s' as %s", name.c_str(), created.value().document_id.c_str());
    return Result<std::string>::ok(created.value().document_id);
}

Status SyncEngine::publish_pending(MappingRecord& local, MappingRecord& merged,
                                   SyncReport& report, std::vector<std::string>& created_ids) {
    for (const auto& name : local.modified) {
        if (!merged.modified.count(name) && merged.find(name)) {
            log::warn("'%s' changed on another device more recently, "
                      "its local edit is not uploaded", name.c_str());
        }
    }

    for (auto& [name, entry] : merged.entries) {
        bool edited = entry.is_published() && merged.modified.count(name) > 0;
        if (entry.is_published() && !edited) continue;

        if (edited) {
            auto& done = report.updated_documents;
            if (std::find(done.begin(), done.end(), name) != done.end()) continue;
        }

        auto content = local_.read_cached_script(name);
        if (content.is_err()) {
            log::warn("'%s' has no cached body, leaving it %s", name.c_str(),
                      edited ? "as published" : "unpublished");
            continue;
        }
        STASH_TRY(check_utf8(content.value(), "body of '" + name + "'"));

        if (edited) {
            auto updated = with_retry(options_.retry, "upload " + name, [&] {
                return remote_.update_document(entry.document_id, content.value(),
                                               std::nullopt);
            });
            if (updated.is_ok()) {
                report.updated_documents.push_back(name);
                log::info("uploaded the new body of '%s'", name.c_str());
                continue;
            }
            if (!updated.is_err(StashError::RemoteNotFound)) {
                return std::move(updated).error();
            }
            log::warn("document %s for '%s' is gone, creating a new one",
                      entry.document_id.c_str(), name.c_str());
        }

        auto id = create_script_document(name, content.value(), report, created_ids);
        if (id.is_err()) return std::move(id).error();
        entry.document_id = id.value();
        if (auto* ours = local.find(name)) ours->document_id = entry.document_id;
        if (edited) report.updated_documents.push_back(name);
    }
    return ok_status();
}

Status SyncEngine::commit(MappingRecord record, const std::string& document_id,
                          bool removals_applied, bool save_pointer,
                          const CancelToken& cancel, SyncReport& report) {
    STASH_TRY(enter(SyncState::Done, cancel, report));

    if (removals_applied) {
        record.pending_removals.clear();
        record.modified.clear();
    }
    record.last_synced = now_utc();
    STASH_TRY(local_.save(record));

    if (save_pointer) {
        RemoteDocumentPointer ptr{document_id, options_.owner, now_utc()};
        STASH_TRY(local_.save_pointer(ptr));
    }
    report.document_id = document_id;
    return ok_status();
}

} // namespace stash
