#pragma once

#include "unitpulse/types.hpp"
#include <chrono>
#include <expected>
#include <optional>
#include <string>

namespace unitpulse {

struct HttpRequest {
    std::string path;
    QueryParams params;
    QueryParams headers;
    std::string body;
    std::string content_type;
    std::chrono::seconds timeout{30};
};

struct HttpResponse {
    int status = 0;
    std::string body;
};

struct TransportError {
    std::string message;
};

using HttpResult = std::expected<HttpResponse, TransportError>;

// Seam between the API logic and the wire. Implementations must tolerate
// concurrent calls.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResult get(const HttpRequest& request) = 0;
    virtual HttpResult post(const HttpRequest& request) = 0;
};

// One cpp-httplib client per call against a fixed scheme://host[:port].
class HttplibTransport : public HttpTransport {
public:
    explicit HttplibTransport(std::string origin);

    HttpResult get(const HttpRequest& request) override;
    HttpResult post(const HttpRequest& request) override;

private:
    std::string origin_;
};

struct UrlParts {
    std::string origin; // scheme://host[:port]
    std::string path;   // always starts with '/'
};

std::optional<UrlParts> split_url(const std::string& url);

} // namespace unitpulse
