#pragma once

#include "unitpulse/api_client.hpp"
#include "unitpulse/log.hpp"
#include "unitpulse/types.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace unitpulse {

// Anything that can answer "how many units on this date".
// Implementations must tolerate concurrent fetch() calls.
class ReportSource {
public:
    virtual ~ReportSource() = default;
    virtual ReportResult fetch(Date date) = 0;
};

ReportRequest build_report_request(Date date, const std::string& vendor_number);

// Envelope {data: [{attributes: {reportContent: <base64>}}]} -> units.
ReportResult units_from_envelope(const nlohmann::json& body, LogSink& log,
                                 const std::string& date_str);

// One signed GET per calendar date against the sales report endpoint.
// Never throws: every failure is folded into Unavailable.
class ReportFetcher : public ReportSource {
public:
    ReportFetcher(const ApiContext& ctx, LogSink& log);

    ReportResult fetch(Date date) override;

private:
    ApiContext ctx_;
    LogSink& log_;
};

} // namespace unitpulse
