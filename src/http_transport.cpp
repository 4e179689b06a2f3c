#include "unitpulse/http_transport.hpp"
#include <httplib.h>
#include <algorithm>

namespace unitpulse {

namespace {

void apply_timeouts(httplib::Client& client, std::chrono::seconds timeout) {
    client.set_connection_timeout(std::min(timeout, std::chrono::seconds(10)));
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);
}

httplib::Headers to_headers(const QueryParams& pairs) {
    httplib::Headers headers;
    for (auto& [key, value] : pairs) {
        headers.emplace(key, value);
    }
    return headers;
}

} // namespace

HttplibTransport::HttplibTransport(std::string origin) : origin_(std::move(origin)) {}

HttpResult HttplibTransport::get(const HttpRequest& request) {
    httplib::Client client(origin_);
    if (!client.is_valid()) {
        return std::unexpected(TransportError{"Invalid origin: " + origin_});
    }
    apply_timeouts(client, request.timeout);

    httplib::Params params;
    for (auto& [key, value] : request.params) {
        params.emplace(key, value);
    }

    auto res = client.Get(request.path, params, to_headers(request.headers));
    if (!res) {
        return std::unexpected(TransportError{"Connection failed: " + httplib::to_string(res.error())});
    }
    return HttpResponse{res->status, res->body};
}

HttpResult HttplibTransport::post(const HttpRequest& request) {
    httplib::Client client(origin_);
    if (!client.is_valid()) {
        return std::unexpected(TransportError{"Invalid origin: " + origin_});
    }
    apply_timeouts(client, request.timeout);

    auto res = client.Post(request.path, to_headers(request.headers),
                           request.body, request.content_type);
    if (!res) {
        return std::unexpected(TransportError{"Connection failed: " + httplib::to_string(res.error())});
    }
    return HttpResponse{res->status, res->body};
}

std::optional<UrlParts> split_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;

    auto scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") return std::nullopt;

    auto host_start = scheme_end + 3;
    auto path_start = url.find('/', host_start);
    auto host = url.substr(host_start, path_start == std::string::npos
                                           ? std::string::npos
                                           : path_start - host_start);
    if (host.empty()) return std::nullopt;

    return UrlParts{
        .origin = scheme + "://" + host,
        .path = path_start == std::string::npos ? "/" : url.substr(path_start),
    };
}

} // namespace unitpulse
