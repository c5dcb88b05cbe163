#include <stash/discovery.hpp>
#include <stash/log.hpp>

#include <algorithm>

namespace stash {

StashError DiscoveryResult::to_error() const {
    if (kind == NoMapping) {
        return StashError{StashError::NoMappingFound,
            "no mapping record found among the owner's documents",
            "run 'stash push' to create one"};
    }
    std::string msg = std::to_string(candidates.size()) +
        " documents claim to be the mapping record:";
    for (const auto& c : candidates) {
        msg += "\n    " + c.document_id + "  updated " + format_utc(c.updated_at) +
               "  (" + std::to_string(c.entry_count) + " entries)";
    }
    std::string hint = "pick one with 'stash adopt <document-id>'";
    return StashError{StashError::AmbiguousMapping, msg, hint};
}

InventoryDiscovery::InventoryDiscovery(DocumentStore& remote, LocalStore& local,
                                       RetryPolicy retry, std::string owner)
    : remote_(remote), local_(local), retry_(std::move(retry)), owner_(std::move(owner)) {}

Result<RemoteDocument> InventoryDiscovery::fetch(const std::string& document_id) {
    return with_retry(retry_, "fetch " + document_id,
                      [&] { return remote_.get_document(document_id); });
}

Status InventoryDiscovery::persist(const std::string& document_id) {
    RemoteDocumentPointer ptr{document_id, owner_, now_utc()};
    STASH_TRY(local_.save_pointer(ptr));
    log::info("adopted mapping record %s", document_id.c_str());
    return ok_status();
}

Result<DiscoveryResult> InventoryDiscovery::discover(bool persist_pointer) {
    auto listed = with_retry(retry_, "list documents",
                             [&] { return remote_.list_owned_documents(); });
    if (listed.is_err()) return std::move(listed).error();

    DiscoveryResult result;
    std::vector<std::pair<MappingCandidate, MappingRecord>> valid;

    for (const auto& summary : listed.value()) {
        if (summary.description != kMappingSentinel) continue;

        auto doc = fetch(summary.document_id);
        if (doc.is_err()) {
            if (doc.is_err(StashError::RemoteNotFound)) {
                log::warn("candidate %s vanished during discovery", summary.document_id.c_str());
                continue;
            }
            return std::move(doc).error();
        }

        auto record = MappingRecord::from_document_json(doc.value().content);
        if (record.is_err()) {
            log::warn("ignoring candidate %s: %s", summary.document_id.c_str(),
                      record.error().message.c_str());
            continue;
        }
        record.value().revision = doc.value().revision;

        MappingCandidate c;
        c.document_id = summary.document_id;
        c.updated_at = doc.value().updated_at ? doc.value().updated_at : summary.updated_at;
        c.entry_count = record.value().entries.size();
        valid.emplace_back(c, std::move(record).value());
    }

    std::sort(valid.begin(), valid.end(), [](const auto& a, const auto& b) {
        if (a.first.updated_at != b.first.updated_at) {
            return a.first.updated_at > b.first.updated_at;
        }
        return a.first.document_id < b.first.document_id;
    });
    for (const auto& v : valid) result.candidates.push_back(v.first);

    if (valid.empty()) {
        result.kind = DiscoveryResult::NoMapping;
        log::debug("discovery found no mapping record");
    } else if (valid.size() > 1) {
        result.kind = DiscoveryResult::Ambiguous;
        log::warn("discovery found %zu mapping records", valid.size());
    } else {
        result.kind = DiscoveryResult::Found;
        result.document_id = valid.front().first.document_id;
        result.record = std::move(valid.front().second);
        if (persist_pointer) STASH_TRY(persist(result.document_id));
    }
    return Result<DiscoveryResult>::ok(std::move(result));
}

Result<DiscoveryResult> InventoryDiscovery::adopt(const std::string& document_id,
                                                  bool persist_pointer) {
    auto doc = fetch(document_id);
    if (doc.is_err()) return std::move(doc).error();

    auto record = MappingRecord::from_document_json(doc.value().content);
    if (record.is_err()) {
        return StashError{StashError::CorruptRemoteState,
            "document " + document_id + " is not a mapping record: " +
            record.error().message};
    }
    if (doc.value().description != kMappingSentinel) {
        log::warn("adopting %s although its description is '%s'",
                  document_id.c_str(), doc.value().description.c_str());
    }

    DiscoveryResult result;
    result.kind = DiscoveryResult::Found;
    result.document_id = document_id;
    result.record = std::move(record).value();
    result.record.revision = doc.value().revision;
    result.candidates.push_back(MappingCandidate{
        document_id, doc.value().updated_at, result.record.entries.size()});

    if (persist_pointer) STASH_TRY(persist(document_id));
    return Result<DiscoveryResult>::ok(std::move(result));
}

} // namespace stash
