#include "unitpulse/types.hpp"

namespace unitpulse {

QueryParams ReportRequest::query_params() const {
    return {
        {"filter[frequency]", frequency},
        {"filter[reportDate]", format_iso_date(date)},
        {"filter[reportSubType]", report_sub_type},
        {"filter[reportType]", report_type},
        {"filter[vendorNumber]", vendor_number},
        {"filter[version]", version},
    };
}

std::string_view to_string(UnavailableReason reason) {
    switch (reason) {
        case UnavailableReason::NotPublished: return "not published";
        case UnavailableReason::EmptyPayload: return "empty payload";
        case UnavailableReason::MissingPayload: return "missing reportContent";
        case UnavailableReason::HttpError: return "http error";
        case UnavailableReason::TransportError: return "transport error";
        case UnavailableReason::SigningFailed: return "signing failed";
        case UnavailableReason::Malformed: return "malformed payload";
        case UnavailableReason::NoUnitsColumn: return "no Units column";
    }
    return "unknown";
}

} // namespace unitpulse
