#pragma once

#include "unitpulse/http_transport.hpp"
#include "unitpulse/rate_limiter.hpp"
#include "unitpulse/token_signer.hpp"
#include "unitpulse/types.hpp"
#include <expected>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace unitpulse {

inline constexpr std::string_view kSalesReportsPath = "/v1/salesReports";
inline constexpr std::string_view kVendorsPath = "/v1/vendors";

// Everything one authenticated App Store Connect call needs.
struct ApiContext {
    const ClientConfig& config;
    const TokenSigner& signer;
    HttpTransport& transport;
    RateLimiter& limiter;
};

// Signed GET returning the parsed JSON body. 429 responses are retried
// with backoff; every other non-2xx status is an ApiError::Kind::Http.
std::expected<nlohmann::json, ApiError> fetch_endpoint(
    const ApiContext& ctx, const std::string& path, const QueryParams& params = {});

struct VendorCheckError {
    enum class Kind { Forbidden, NotListed, RequestFailed };

    Kind kind = Kind::RequestFailed;
    int status_code = 0;
    std::string message;
};

// Confirms the configured vendor number is visible to this API key.
std::expected<void, VendorCheckError> verify_vendor(const ApiContext& ctx);

std::vector<std::string> parse_vendor_numbers(const nlohmann::json& body);

} // namespace unitpulse
