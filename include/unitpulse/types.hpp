#pragma once

#include "unitpulse/date.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace unitpulse {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Short-lived bearer credential; a new one is minted for every request.
struct Credential {
    std::string token;
    TimePoint issued_at;
    TimePoint expires_at;
};

// Identifies one daily sales summary report resource.
struct ReportRequest {
    Date date;
    std::string frequency = "DAILY";
    std::string report_sub_type = "SUMMARY";
    std::string report_type = "SALES";
    std::string vendor_number;
    std::string version = "1_0";

    QueryParams query_params() const;
};

enum class UnavailableReason {
    NotPublished,   // 404: no report for that date yet
    EmptyPayload,   // envelope has no items
    MissingPayload, // first item carries no reportContent
    HttpError,
    TransportError,
    SigningFailed,
    Malformed,      // body or payload could not be decoded
    NoUnitsColumn,
};

std::string_view to_string(UnavailableReason reason);

struct Unavailable {
    UnavailableReason reason = UnavailableReason::NotPublished;
    int status_code = 0;
    std::string message;

    // True for faults on our side of the wire or the server's, as opposed
    // to the report simply not existing.
    bool is_fault() const {
        return reason == UnavailableReason::HttpError ||
               reason == UnavailableReason::TransportError ||
               reason == UnavailableReason::SigningFailed;
    }
};

// Parsed total units for one date, or why there is none.
using ReportResult = std::expected<std::int64_t, Unavailable>;

struct AnchorError {
    enum class Kind {
        NoData,        // every candidate answered "not published"
        FetchFailures, // at least one candidate failed on the wire
    };

    Kind kind = Kind::NoData;
    std::string message;
};

struct ApiError {
    enum class Kind { Transport, Http, Parse, Auth };

    Kind kind = Kind::Transport;
    int status_code = 0;
    std::string message;
};

struct ClientConfig {
    std::string issuer_id;
    std::string key_id;
    std::string private_key_pem;
    std::string vendor_number;
    std::string base_url = "https://api.appstoreconnect.apple.com";
    std::chrono::seconds timeout{30};
};

struct AnchorConfig {
    int lag_days = 1;
    bool auto_probe = true;
    int max_probe_days = 5;
};

} // namespace unitpulse
