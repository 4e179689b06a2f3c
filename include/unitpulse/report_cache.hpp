#pragma once

#include "unitpulse/report_fetcher.hpp"
#include "unitpulse/types.hpp"
#include <map>
#include <mutex>
#include <optional>

namespace unitpulse {

// Per-run memo of fetch outcomes, so a date fetched while probing for the
// anchor is not fetched again by the aggregator. Create one per run.
class ReportCache {
public:
    std::optional<ReportResult> get(Date date) const;
    void store(Date date, const ReportResult& result);

    size_t size() const;

    // Parsed totals and "not published" answers are stable for a run;
    // wire faults are not and must be retried.
    static bool is_cacheable(const ReportResult& result);

private:
    mutable std::mutex mutex_;
    std::map<Date, ReportResult> entries_;
};

class CachingReportSource : public ReportSource {
public:
    CachingReportSource(ReportSource& inner, ReportCache& cache);

    ReportResult fetch(Date date) override;

private:
    ReportSource& inner_;
    ReportCache& cache_;
};

} // namespace unitpulse
