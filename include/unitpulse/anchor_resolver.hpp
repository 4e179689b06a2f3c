#pragma once

#include "unitpulse/log.hpp"
#include "unitpulse/report_fetcher.hpp"
#include "unitpulse/types.hpp"
#include <expected>
#include <functional>
#include <memory>

namespace unitpulse {

using TodayFn = std::function<Date()>;

// Decides the most recent date treated as having report data.
class AnchorResolver {
public:
    virtual ~AnchorResolver() = default;
    virtual std::expected<Date, AnchorError> resolve() = 0;
};

// today - lag, no existence check.
class FixedLagResolver : public AnchorResolver {
public:
    FixedLagResolver(int lag_days, TodayFn today);

    std::expected<Date, AnchorError> resolve() override;

private:
    int lag_days_;
    TodayFn today_;
};

// Walks back from today - lag, one date at a time, and stops at the first
// date whose report parses. Sequential on purpose: the nearest date wins.
class ProbingResolver : public AnchorResolver {
public:
    ProbingResolver(ReportSource& source, int lag_days, int max_probe_days,
                    TodayFn today, LogSink& log);

    std::expected<Date, AnchorError> resolve() override;

private:
    ReportSource& source_;
    int lag_days_;
    int max_probe_days_;
    TodayFn today_;
    LogSink& log_;
};

std::unique_ptr<AnchorResolver> make_anchor_resolver(
    const AnchorConfig& config, ReportSource& source, TodayFn today, LogSink& log);

} // namespace unitpulse
