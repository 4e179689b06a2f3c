#include "unitpulse/summary.hpp"
#include <sstream>

namespace unitpulse {

namespace {

constexpr std::string_view kComponent = "summary";

} // namespace

std::string period_label(int days) {
    if (days == 1) return "24h";
    return std::to_string(days) + "d";
}

std::vector<Period> default_periods() {
    return periods_from_days({1, 7, 30});
}

std::vector<Period> periods_from_days(const std::vector<int>& days) {
    std::vector<Period> periods;
    for (int d : days) {
        periods.push_back({.label = period_label(d), .days = d});
    }
    return periods;
}

std::string format_summary(const Summary& summary, TimePoint now) {
    std::ostringstream oss;
    oss << kSummaryTitle << "\n";

    if (summary.anchor) {
        oss << "Data through: " << format_iso_date(*summary.anchor) << " (UTC)\n";
    } else {
        oss << "Data through: UNKNOWN (anchor date not found)\n";
    }

    for (auto& p : summary.periods) {
        oss << "• Period " << p.label << ": ";
        if (p.units) {
            oss << *p.units;
        } else {
            oss << kMissingValue;
        }
        oss << "\n";
    }

    oss << "Timestamp: " << format_utc_minute(now);
    return oss.str();
}

SummaryRunner::SummaryRunner(AnchorResolver& resolver, Aggregator& aggregator, LogSink& log)
    : resolver_(resolver), aggregator_(aggregator), log_(log) {}

Summary SummaryRunner::run(const std::vector<Period>& periods) {
    Summary summary;

    auto anchor = resolver_.resolve();
    if (anchor) {
        summary.anchor = *anchor;
    } else {
        log_.write(LogLevel::Error, kComponent,
                   "Anchor date unavailable: " + anchor.error().message);
    }

    for (auto& p : periods) {
        PeriodTotal total{.label = p.label, .days = p.days};
        if (summary.anchor) {
            auto window = aggregator_.aggregate_window(p.days, *summary.anchor);
            total.units = window.units;
            total.available_days = window.available_days;
        }
        summary.periods.push_back(std::move(total));
    }

    return summary;
}

} // namespace unitpulse
