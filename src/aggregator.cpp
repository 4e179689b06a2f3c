#include "unitpulse/aggregator.hpp"
#include <algorithm>
#include <future>

namespace unitpulse {

namespace {

constexpr std::string_view kComponent = "aggregator";

} // namespace

std::vector<Date> window_dates(Date anchor, int days) {
    std::vector<Date> dates;
    if (days <= 0) return dates;

    dates.reserve(static_cast<size_t>(days));
    for (int i = 0; i < days; ++i) {
        dates.push_back(add_days(anchor, -i));
    }
    return dates;
}

Aggregator::Aggregator(ReportSource& source, LogSink& log, int max_parallel)
    : source_(source), log_(log), max_parallel_(std::max(1, max_parallel)) {}

std::vector<ReportResult> Aggregator::fetch_all(const std::vector<Date>& dates) {
    std::vector<ReportResult> results;
    results.reserve(dates.size());

    if (max_parallel_ == 1) {
        for (auto& d : dates) {
            results.push_back(source_.fetch(d));
        }
        return results;
    }

    // Batches of at most max_parallel_ in-flight requests, results kept in
    // date order.
    for (size_t start = 0; start < dates.size(); start += static_cast<size_t>(max_parallel_)) {
        auto end = std::min(dates.size(), start + static_cast<size_t>(max_parallel_));

        std::vector<std::future<ReportResult>> batch;
        for (size_t i = start; i < end; ++i) {
            batch.push_back(std::async(std::launch::async,
                                       [this, d = dates[i]] { return source_.fetch(d); }));
        }
        for (auto& f : batch) {
            results.push_back(f.get());
        }
    }
    return results;
}

WindowTotal Aggregator::aggregate_window(int days, Date anchor) {
    WindowTotal window{.requested_days = std::max(days, 0)};

    auto dates = window_dates(anchor, days);
    auto results = fetch_all(dates);

    std::int64_t total = 0;
    for (auto& r : results) {
        if (!r) continue;
        total += *r;
        ++window.available_days;
    }

    if (window.available_days == 0) {
        log_.write(LogLevel::Warning, kComponent,
                   "No data for " + std::to_string(days) + "-day window ending " +
                       format_iso_date(anchor));
        return window;
    }

    window.units = total;
    if (window.partial()) {
        log_.write(LogLevel::Warning, kComponent,
                   std::to_string(days) + "-day window ending " + format_iso_date(anchor) +
                       " has data for only " + std::to_string(window.available_days) +
                       " day(s)");
    }
    return window;
}

std::optional<std::int64_t> Aggregator::aggregate(int days, Date anchor) {
    return aggregate_window(days, anchor).units;
}

} // namespace unitpulse
