#include <stash/http.hpp>
#include <stash/log.hpp>

#include <curl/curl.h>

#include <algorithm>
#include <cctype>

namespace stash {

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(lowercase(name));
    return it == headers.end() ? "" : it->second;
}

static size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

// Called once per header line, including the status line and the blank
// terminator. A redirect or 100-continue starts a new header set.
static size_t write_header(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    std::string line(ptr, size * nmemb);
    if (line.compare(0, 5, "HTTP/") == 0) {
        headers->clear();
    } else {
        auto colon = line.find(':');
        if (colon != std::string::npos) {
            (*headers)[lowercase(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
        }
    }
    return size * nmemb;
}

CurlTransport::CurlTransport() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlTransport::~CurlTransport() {
    curl_global_cleanup();
}

Result<HttpResponse> CurlTransport::send(const HttpRequest& request) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return StashError{StashError::Transport, "curl init failed"};
    }

    struct curl_slist* headers = nullptr;
    for (const auto& h : request.headers) {
        headers = curl_slist_append(headers, h.c_str());
    }

    HttpResponse response;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "stash");
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (request.method != "GET" && request.method != "DELETE") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }
    if (request.timeout_seconds > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(request.timeout_seconds));
    }
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, write_header);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

    log::trace("%s %s", request.method.c_str(), request.url.c_str());
    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return StashError{StashError::Transport,
            request.method + " " + request.url + ": " + curl_easy_strerror(res)};
    }
    response.status = status;
    log::trace("-> %ld (%zu bytes)", status, response.body.size());
    return Result<HttpResponse>::ok(std::move(response));
}

} // namespace stash
