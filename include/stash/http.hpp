#pragma once

#include <stash/result.hpp>
#include <map>
#include <string>
#include <vector>

namespace stash {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;    // "Name: value"
    std::string body;
    int timeout_seconds = 20;
};

struct HttpResponse {
    long status = 0;
    std::string body;
    std::map<std::string, std::string> headers;   // names lowercased

    std::string header(const std::string& name) const;
};

// One HTTP exchange. Implementations return a response for every status
// code the server sends; only failures to exchange at all (DNS, connect,
// TLS, timeout) are errors, reported as Transport.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

// libcurl easy-handle transport
class CurlTransport : public HttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;
    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    Result<HttpResponse> send(const HttpRequest& request) override;
};

} // namespace stash
