#pragma once

#include <stash/result.hpp>
#include <stash/discovery.hpp>
#include <stash/mapping.hpp>
#include <stash/remote.hpp>
#include <stash/retry.hpp>
#include <stash/store.hpp>
#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace stash {

enum class SyncState {
    Idle,
    ResolvingPointer,
    Fetching,
    Reconciling,
    Pushing,
    Done,
    Failed
};

enum class SyncMode { Pull, Push };

const char* state_name(SyncState s);
const char* mode_name(SyncMode m);

// Set from a signal handler or another thread; the engine checks it
// between state transitions and never interrupts a remote call.
class CancelToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }
    void reset() { cancelled_.store(false); }

private:
    std::atomic<bool> cancelled_{false};
};

struct SyncReport {
    SyncMode mode = SyncMode::Pull;
    SyncState final_state = SyncState::Idle;
    std::vector<SyncState> visited;

    std::string document_id;
    std::string revision;
    std::vector<std::string> adopted_from_remote;
    std::vector<std::string> kept_from_local;
    std::vector<std::string> created_documents;   // script names published
    std::vector<std::string> updated_documents;   // edited bodies re-uploaded
    bool mapping_written = false;
    int conflict_retries = 0;

    std::optional<StashError> error;

    bool ok() const { return final_state == SyncState::Done; }
};

struct ReconcileResult {
    MappingRecord merged;
    std::vector<std::string> from_remote;   // remote-only, or remote won
    std::vector<std::string> from_local;    // local-only, or local won
    bool differs_from_remote = false;
};

// Entry-level merge. Remote-only entries are adopted, both-sided entries
// go to the later updated_at with ties to remote, local-only unpublished
// entries are kept. Names in local.pending_removals are dropped from the
// remote side. Local-only published entries survive a push but not a
// pull, where the remote record is authoritative about removals.
// merged.modified names the published entries whose local body must be
// uploaded: those that won over an older remote entry, and local edits
// the remote side does not know about. The merged revision is the
// remote revision.
ReconcileResult reconcile(const MappingRecord& local, const MappingRecord& remote,
                          SyncMode mode);

struct SyncEngineOptions {
    RetryPolicy retry;
    bool private_documents = true;
    int lock_stale_seconds = 3600;
    std::string owner;
};

class SyncEngine {
public:
    SyncEngine(LocalStore& local, DocumentStore& remote,
               InventoryDiscovery& discovery, SyncEngineOptions options);

    // One complete run: resolve, fetch, reconcile, push (push mode only),
    // then persist. Local state is written only when the run reaches Done.
    SyncReport run(SyncMode mode, const CancelToken& cancel);

private:
    Status enter(SyncState next, const CancelToken& cancel, SyncReport& report);
    Status execute(SyncMode mode, const CancelToken& cancel, SyncReport& report,
                   std::vector<std::string>& created_ids);
    Status create_mapping(SyncMode mode, const CancelToken& cancel, MappingRecord& local,
                          SyncReport& report, std::vector<std::string>& created_ids);
    // Creates documents for unpublished entries and re-uploads the bodies
    // of published entries edited locally, unless the remote entry won
    Status publish_pending(MappingRecord& local, MappingRecord& merged, SyncReport& report,
                           std::vector<std::string>& created_ids);
    Result<std::string> create_script_document(const std::string& name,
                                               const std::string& content,
                                               SyncReport& report,
                                               std::vector<std::string>& created_ids);
    void delete_orphans(const std::vector<std::string>& ids);
    Status commit(MappingRecord record, const std::string& document_id,
                  bool removals_applied, bool save_pointer,
                  const CancelToken& cancel, SyncReport& report);

    LocalStore& local_;
    DocumentStore& remote_;
    InventoryDiscovery& discovery_;
    SyncEngineOptions options_;
};

} // namespace stash
