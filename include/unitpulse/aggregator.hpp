#pragma once

#include "unitpulse/log.hpp"
#include "unitpulse/report_fetcher.hpp"
#include "unitpulse/types.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace unitpulse {

// anchor, anchor - 1, ..., anchor - (days - 1). Empty for days <= 0.
std::vector<Date> window_dates(Date anchor, int days);

struct WindowTotal {
    std::optional<std::int64_t> units;
    int requested_days = 0;
    int available_days = 0;

    bool partial() const { return units && available_days < requested_days; }
};

// Sums per-date units over a window ending at an anchor the caller resolved
// once for the whole run. Missing dates are skipped, so a partial window
// still yields a (best-effort) total.
class Aggregator {
public:
    Aggregator(ReportSource& source, LogSink& log, int max_parallel = 1);

    std::optional<std::int64_t> aggregate(int days, Date anchor);
    WindowTotal aggregate_window(int days, Date anchor);

private:
    std::vector<ReportResult> fetch_all(const std::vector<Date>& dates);

    ReportSource& source_;
    LogSink& log_;
    int max_parallel_;
};

} // namespace unitpulse
