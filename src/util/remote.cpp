#include <stash/remote.hpp>
#include <stash/log.hpp>
#include <nlohmann/json.hpp>

namespace stash {

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Status mapping
// ---------------------------------------------------------------------------

static std::string api_message(const HttpResponse& response) {
    try {
        json j = json::parse(response.body);
        if (j.is_object() && j.contains("message") && j.at("message").is_string()) {
            return j.at("message").get<std::string>();
        }
    } catch (const json::exception&) {
        // body is not JSON; fall through to the status line
    }
    return "HTTP " + std::to_string(response.status);
}

Status classify_response(const HttpResponse& response, const std::string& what) {
    long s = response.status;
    if (s >= 200 && s < 300) return ok_status();

    std::string msg = what + ": " + api_message(response);
    if (s == 429 || (s == 403 && response.header("x-ratelimit-remaining") == "0")) {
        return StashError{StashError::RateLimited, msg,
            "the API rate limit is exhausted; wait before retrying"};
    }
    if (s == 401 || s == 403) {
        return StashError{StashError::AuthenticationFailed, msg,
            "check that the token has the 'gist' scope"};
    }
    if (s == 404) {
        return StashError{StashError::RemoteNotFound, msg};
    }
    return StashError{StashError::Transport, msg};
}

// ---------------------------------------------------------------------------
// JSON helpers
// ---------------------------------------------------------------------------

static std::string string_or_empty(const json& j, const char* key) {
    if (j.contains(key) && j.at(key).is_string()) return j.at(key).get<std::string>();
    return "";
}

static std::string first_revision(const json& gist) {
    if (gist.contains("history") && gist.at("history").is_array() &&
        !gist.at("history").empty()) {
        return string_or_empty(gist.at("history").at(0), "version");
    }
    return "";
}

static Timestamp updated_at_of(const json& gist) {
    auto s = string_or_empty(gist, "updated_at");
    if (s.empty()) return 0;
    auto ts = parse_utc(s);
    return ts.is_ok() ? ts.value() : 0;
}

static std::string owner_of(const json& gist) {
    if (gist.contains("owner") && gist.at("owner").is_object()) {
        return string_or_empty(gist.at("owner"), "login");
    }
    return "";
}

static Result<std::string> encode_body(const json& body, const std::string& what) {
    try {
        return Result<std::string>::ok(body.dump());
    } catch (const json::exception& e) {
        return StashError{StashError::InvalidArg,
            what + ": content is not valid UTF-8 (" + e.what() + ")"};
    }
}

static Result<json> parse_body(const HttpResponse& response, const std::string& what) {
    try {
        return Result<json>::ok(json::parse(response.body));
    } catch (const json::exception& e) {
        return StashError{StashError::Transport,
            what + ": unexpected response body: " + e.what()};
    }
}

// ---------------------------------------------------------------------------
// GistClient
// ---------------------------------------------------------------------------

GistClient::GistClient(HttpTransport& transport, GistClientOptions options)
    : transport_(transport), options_(std::move(options)) {
    while (!options_.api_url.empty() && options_.api_url.back() == '/') {
        options_.api_url.pop_back();
    }
}

HttpRequest GistClient::make_request(const std::string& method, const std::string& path,
                                     const std::string& body) const {
    HttpRequest req;
    req.method = method;
    req.url = options_.api_url + path;
    req.body = body;
    req.timeout_seconds = options_.timeout_seconds;
    req.headers.push_back("Accept: application/vnd.github+json");
    req.headers.push_back("X-GitHub-Api-Version: 2022-11-28");
    if (!options_.token.empty()) {
        req.headers.push_back("Authorization: Bearer " + options_.token);
    }
    if (!body.empty()) {
        req.headers.push_back("Content-Type: application/json");
    }
    return req;
}

Result<HttpResponse> GistClient::exchange(const HttpRequest& request, const std::string& what) {
    auto response = transport_.send(request);
    if (response.is_err()) return response;
    STASH_TRY(classify_response(response.value(), what));
    return response;
}

Result<std::string> GistClient::fetch_raw(const std::string& url) {
    HttpRequest req;
    req.url = url;
    req.timeout_seconds = options_.timeout_seconds;
    if (!options_.token.empty()) {
        req.headers.push_back("Authorization: Bearer " + options_.token);
    }
    auto response = exchange(req, "download " + url);
    if (response.is_err()) return std::move(response).error();
    return Result<std::string>::ok(std::move(response.value().body));
}

Result<CreatedDocument> GistClient::create_document(const NewDocument& doc) {
    json body;
    body["description"] = doc.description;
    body["public"] = !doc.is_private;
    body["files"][doc.filename]["content"] = doc.content;

    auto encoded = encode_body(body, "create document '" + doc.filename + "'");
    if (encoded.is_err()) return std::move(encoded).error();
    auto response = exchange(make_request("POST", "/gists", encoded.value()),
                             "create document '" + doc.filename + "'");
    if (response.is_err()) return std::move(response).error();

    auto j = parse_body(response.value(), "create document");
    if (j.is_err()) return std::move(j).error();

    CreatedDocument created;
    created.document_id = string_or_empty(j.value(), "id");
    created.revision = first_revision(j.value());
    if (created.document_id.empty()) {
        return StashError{StashError::Transport, "create document: response has no id"};
    }
    log::debug("created document %s (%s)", created.document_id.c_str(), doc.filename.c_str());
    return Result<CreatedDocument>::ok(std::move(created));
}

Result<std::string> GistClient::update_document(const std::string& document_id,
                                                const std::string& content,
                                                const std::optional<std::string>& expected_revision) {
    // The file name is needed for the patch and the revision for the
    // precondition, so read the current state first. The check is only
    // as fresh as this read.
    auto current = get_document(document_id);
    if (current.is_err()) return std::move(current).error();

    if (expected_revision && current.value().revision != *expected_revision) {
        return StashError{StashError::RevisionMismatch,
            "document " + document_id + " is at revision " + current.value().revision +
            ", expected " + *expected_revision};
    }

    json body;
    body["files"][current.value().filename]["content"] = content;
    auto encoded = encode_body(body, "update document " + document_id);
    if (encoded.is_err()) return std::move(encoded).error();
    auto response = exchange(make_request("PATCH", "/gists/" + document_id, encoded.value()),
                             "update document " + document_id);
    if (response.is_err()) return std::move(response).error();

    auto j = parse_body(response.value(), "update document");
    if (j.is_err()) return std::move(j).error();
    return Result<std::string>::ok(first_revision(j.value()));
}

Result<RemoteDocument> GistClient::get_document(const std::string& document_id) {
    auto response = exchange(make_request("GET", "/gists/" + document_id),
                             "get document " + document_id);
    if (response.is_err()) return std::move(response).error();

    auto parsed = parse_body(response.value(), "get document");
    if (parsed.is_err()) return std::move(parsed).error();
    const json& j = parsed.value();

    RemoteDocument doc;
    doc.document_id = string_or_empty(j, "id");
    doc.description = string_or_empty(j, "description");
    doc.revision = first_revision(j);
    doc.updated_at = updated_at_of(j);

    if (!j.contains("files") || !j.at("files").is_object() || j.at("files").empty()) {
        return StashError{StashError::Transport,
            "document " + document_id + " has no files"};
    }
    // Documents written by this tool hold exactly one file
    const auto& file = j.at("files").begin().value();
    doc.filename = string_or_empty(file, "filename");
    if (doc.filename.empty()) doc.filename = j.at("files").begin().key();
    doc.content = string_or_empty(file, "content");

    if (file.contains("truncated") && file.at("truncated").is_boolean() &&
        file.at("truncated").get<bool>()) {
        auto raw = fetch_raw(string_or_empty(file, "raw_url"));
        if (raw.is_err()) return std::move(raw).error();
        doc.content = std::move(raw).value();
    }
    return Result<RemoteDocument>::ok(std::move(doc));
}

Status GistClient::delete_document(const std::string& document_id) {
    auto response = exchange(make_request("DELETE", "/gists/" + document_id),
                             "delete document " + document_id);
    if (response.is_err()) return std::move(response).error();
    log::debug("deleted document %s", document_id.c_str());
    return ok_status();
}

Result<std::vector<DocumentSummary>> GistClient::list_owned_documents() {
    std::vector<DocumentSummary> out;
    for (int page = 1;; ++page) {
        std::string path = "/gists?per_page=" + std::to_string(options_.per_page) +
                           "&page=" + std::to_string(page);
        auto response = exchange(make_request("GET", path), "list documents");
        if (response.is_err()) return std::move(response).error();

        auto parsed = parse_body(response.value(), "list documents");
        if (parsed.is_err()) return std::move(parsed).error();
        const json& items = parsed.value();
        if (!items.is_array()) {
            return StashError{StashError::Transport, "list documents: expected an array"};
        }

        for (const auto& gist : items) {
            DocumentSummary s;
            s.document_id = string_or_empty(gist, "id");
            s.description = string_or_empty(gist, "description");
            s.revision = first_revision(gist);
            s.owner = owner_of(gist);
            s.updated_at = updated_at_of(gist);
            if (s.document_id.empty()) continue;
            if (!options_.owner.empty() && s.owner != options_.owner) continue;
            out.push_back(std::move(s));
        }

        if (static_cast<int>(items.size()) < options_.per_page) break;
    }
    log::debug("listed %zu documents", out.size());
    return Result<std::vector<DocumentSummary>>::ok(std::move(out));
}

} // namespace stash
