#pragma once

#include <stash/result.hpp>
#include <stash/mapping.hpp>
#include <stash/remote.hpp>
#include <stash/retry.hpp>
#include <stash/store.hpp>
#include <string>
#include <vector>

namespace stash {

struct MappingCandidate {
    std::string document_id;
    Timestamp updated_at = 0;
    size_t entry_count = 0;
};

struct DiscoveryResult {
    enum Kind { Found, NoMapping, Ambiguous };

    Kind kind = NoMapping;
    std::vector<MappingCandidate> candidates;   // newest first

    // Set when kind == Found
    std::string document_id;
    MappingRecord record;                       // revision = fetched revision

    // NoMappingFound or AmbiguousMapping with every candidate listed
    StashError to_error() const;
};

// Locates the mapping-record document among everything the owner can see.
// Only documents whose description is exactly the sentinel are considered;
// their content must also parse as a mapping record.
class InventoryDiscovery {
public:
    InventoryDiscovery(DocumentStore& remote, LocalStore& local,
                       RetryPolicy retry, std::string owner);

    // With persist_pointer, a single match is adopted immediately by
    // writing the pointer file. The sync engine defers that to its own
    // final commit.
    Result<DiscoveryResult> discover(bool persist_pointer = true);

    // Operator's choice among ambiguous candidates. Fails with
    // CorruptRemoteState when the document is not a mapping record.
    Result<DiscoveryResult> adopt(const std::string& document_id,
                                  bool persist_pointer = true);

    const std::string& owner() const { return owner_; }

private:
    Result<RemoteDocument> fetch(const std::string& document_id);
    Status persist(const std::string& document_id);

    DocumentStore& remote_;
    LocalStore& local_;
    RetryPolicy retry_;
    std::string owner_;
};

} // namespace stash
