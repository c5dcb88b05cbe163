#pragma once

#include <stash/result.hpp>
#include <stash/clock.hpp>
#include <stash/http.hpp>
#include <optional>
#include <string>
#include <vector>

namespace stash {

struct NewDocument {
    std::string filename;
    std::string content;
    std::string description;
    bool is_private = true;
};

struct CreatedDocument {
    std::string document_id;
    std::string revision;
};

struct RemoteDocument {
    std::string document_id;
    std::string filename;
    std::string content;
    std::string description;
    std::string revision;
    Timestamp updated_at = 0;
};

struct DocumentSummary {
    std::string document_id;
    std::string description;
    std::string revision;       // may be empty when the listing omits it
    std::string owner;
    Timestamp updated_at = 0;
};

// Remote store of versioned text documents. Each call is one logical
// remote operation; failures are AuthenticationFailed, RateLimited,
// Transport or RemoteNotFound.
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    virtual Result<CreatedDocument> create_document(const NewDocument& doc) = 0;

    // Replace the document's content. When expected_revision is set and the
    // remote has moved past it, fails with RevisionMismatch and changes
    // nothing. Returns the new revision.
    virtual Result<std::string> update_document(const std::string& document_id,
                                                const std::string& content,
                                                const std::optional<std::string>& expected_revision) = 0;

    virtual Result<RemoteDocument> get_document(const std::string& document_id) = 0;
    virtual Status delete_document(const std::string& document_id) = 0;

    // Every document visible to the caller, all pages materialized
    virtual Result<std::vector<DocumentSummary>> list_owned_documents() = 0;
};

struct GistClientOptions {
    std::string api_url = "https://api.github.com";
    std::string token;
    std::string owner;          // filter listings to this login when set
    int per_page = 100;
    int timeout_seconds = 20;
};

// DocumentStore over the GitHub gist REST API
class GistClient : public DocumentStore {
public:
    GistClient(HttpTransport& transport, GistClientOptions options);

    Result<CreatedDocument> create_document(const NewDocument& doc) override;
    // The gist API has no conditional PATCH, so the revision is compared
    // against a GET made just before the PATCH. A write that lands between
    // the two requests is overwritten.
    Result<std::string> update_document(const std::string& document_id,
                                        const std::string& content,
                                        const std::optional<std::string>& expected_revision) override;
    Result<RemoteDocument> get_document(const std::string& document_id) override;
    Status delete_document(const std::string& document_id) override;
    Result<std::vector<DocumentSummary>> list_owned_documents() override;

private:
    HttpRequest make_request(const std::string& method, const std::string& path,
                             const std::string& body = "") const;
    Result<HttpResponse> exchange(const HttpRequest& request, const std::string& what);
    Result<std::string> fetch_raw(const std::string& url);

    HttpTransport& transport_;
    GistClientOptions options_;
};

// Map an HTTP status to the remote failure taxonomy; ok for 2xx
Status classify_response(const HttpResponse& response, const std::string& what);

} // namespace stash
