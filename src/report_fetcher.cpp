#include "unitpulse/report_fetcher.hpp"
#include "unitpulse/codec.hpp"
#include "unitpulse/report_parser.hpp"

namespace unitpulse {

namespace {

constexpr std::string_view kComponent = "report_fetcher";

Unavailable unavailable(UnavailableReason reason, std::string message, int status = 0) {
    return Unavailable{.reason = reason, .status_code = status, .message = std::move(message)};
}

Unavailable from_api_error(const ApiError& err) {
    switch (err.kind) {
        case ApiError::Kind::Http:
            if (err.status_code == 404) {
                return unavailable(UnavailableReason::NotPublished, err.message, 404);
            }
            return unavailable(UnavailableReason::HttpError, err.message, err.status_code);
        case ApiError::Kind::Transport:
            return unavailable(UnavailableReason::TransportError, err.message);
        case ApiError::Kind::Parse:
            return unavailable(UnavailableReason::Malformed, err.message, err.status_code);
        case ApiError::Kind::Auth:
            return unavailable(UnavailableReason::SigningFailed, err.message);
    }
    return unavailable(UnavailableReason::TransportError, err.message);
}

} // namespace

ReportRequest build_report_request(Date date, const std::string& vendor_number) {
    ReportRequest request;
    request.date = date;
    request.vendor_number = vendor_number;
    return request;
}

ReportResult units_from_envelope(const nlohmann::json& body, LogSink& log,
                                 const std::string& date_str) {
    if (!body.is_object() || !body.contains("data") || !body["data"].is_array() ||
        body["data"].empty()) {
        log.write(LogLevel::Info, kComponent, "Empty data array for date " + date_str);
        return std::unexpected(unavailable(UnavailableReason::EmptyPayload, "empty data array"));
    }

    auto& first = body["data"][0];
    if (!first.is_object() || !first.contains("attributes") || !first["attributes"].is_object()) {
        log.write(LogLevel::Info, kComponent, "Missing attributes for date " + date_str);
        return std::unexpected(unavailable(UnavailableReason::MissingPayload, "missing attributes"));
    }

    auto& attrs = first["attributes"];
    if (!attrs.contains("reportContent") || !attrs["reportContent"].is_string() ||
        attrs["reportContent"].get_ref<const std::string&>().empty()) {
        log.write(LogLevel::Info, kComponent, "Missing reportContent for date " + date_str);
        return std::unexpected(unavailable(UnavailableReason::MissingPayload, "missing reportContent"));
    }

    auto decoded = decode_report_content(attrs["reportContent"].get_ref<const std::string&>());
    if (!decoded) {
        log.write(LogLevel::Warning, kComponent, decoded.error() + " for date " + date_str);
        return std::unexpected(unavailable(UnavailableReason::Malformed, decoded.error()));
    }
    if (decoded->inflate_failed) {
        log.write(LogLevel::Warning, kComponent,
                  "gzip payload for " + date_str + " failed to inflate; parsing raw bytes");
    }

    auto units = parse_units(decoded->text);
    if (!units) {
        log.write(LogLevel::Info, kComponent, "No Units column in report for " + date_str);
        return std::unexpected(unavailable(UnavailableReason::NoUnitsColumn, "no Units column"));
    }
    return *units;
}

ReportFetcher::ReportFetcher(const ApiContext& ctx, LogSink& log) : ctx_(ctx), log_(log) {}

ReportResult ReportFetcher::fetch(Date date) {
    auto date_str = format_iso_date(date);
    auto request = build_report_request(date, ctx_.config.vendor_number);

    try {
        auto body = fetch_endpoint(ctx_, std::string(kSalesReportsPath), request.query_params());
        if (!body) {
            auto reason = from_api_error(body.error());
            if (reason.reason == UnavailableReason::NotPublished) {
                log_.write(LogLevel::Info, kComponent, "Report not found for date " + date_str);
            } else {
                log_.write(LogLevel::Warning, kComponent,
                           "Error fetching report " + date_str + ": " + reason.message);
            }
            return std::unexpected(std::move(reason));
        }

        auto units = units_from_envelope(*body, log_, date_str);
        if (units) {
            log_.write(LogLevel::Debug, kComponent,
                       date_str + ": " + std::to_string(*units) + " units");
        }
        return units;
    } catch (const std::exception& e) {
        log_.write(LogLevel::Warning, kComponent,
                   "Unexpected error fetching report " + date_str + ": " + e.what());
        return std::unexpected(unavailable(UnavailableReason::TransportError, e.what()));
    }
}

} // namespace unitpulse
