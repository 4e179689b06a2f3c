#pragma once

#include "unitpulse/aggregator.hpp"
#include "unitpulse/anchor_resolver.hpp"
#include "unitpulse/log.hpp"
#include "unitpulse/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace unitpulse {

struct Period {
    std::string label;
    int days = 0;
};

struct PeriodTotal {
    std::string label;
    int days = 0;
    std::optional<std::int64_t> units;
    int available_days = 0;
};

struct Summary {
    std::optional<Date> anchor;
    std::vector<PeriodTotal> periods;
};

inline constexpr std::string_view kSummaryTitle = ":iphone: App Store Download Units Summary";
inline constexpr std::string_view kMissingValue = "N/A";

// 1 -> "24h", n -> "<n>d".
std::string period_label(int days);
std::vector<Period> default_periods();
std::vector<Period> periods_from_days(const std::vector<int>& days);

std::string format_summary(const Summary& summary, TimePoint now);

// Resolves the anchor once and aggregates every period against it.
class SummaryRunner {
public:
    SummaryRunner(AnchorResolver& resolver, Aggregator& aggregator, LogSink& log);

    Summary run(const std::vector<Period>& periods);

private:
    AnchorResolver& resolver_;
    Aggregator& aggregator_;
    LogSink& log_;
};

} // namespace unitpulse
