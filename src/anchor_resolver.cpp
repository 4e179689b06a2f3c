#include "unitpulse/anchor_resolver.hpp"

namespace unitpulse {

namespace {

constexpr std::string_view kComponent = "anchor_resolver";

} // namespace

FixedLagResolver::FixedLagResolver(int lag_days, TodayFn today)
    : lag_days_(lag_days), today_(std::move(today)) {}

std::expected<Date, AnchorError> FixedLagResolver::resolve() {
    return add_days(today_(), -lag_days_);
}

ProbingResolver::ProbingResolver(ReportSource& source, int lag_days, int max_probe_days,
                                 TodayFn today, LogSink& log)
    : source_(source),
      lag_days_(lag_days),
      max_probe_days_(max_probe_days),
      today_(std::move(today)),
      log_(log) {}

std::expected<Date, AnchorError> ProbingResolver::resolve() {
    auto base = add_days(today_(), -lag_days_);
    int faults = 0;

    for (int offset = 0; offset <= max_probe_days_; ++offset) {
        auto candidate = add_days(base, -offset);
        auto result = source_.fetch(candidate);
        if (result) {
            log_.write(LogLevel::Info, kComponent,
                       "Anchor date " + format_iso_date(candidate) +
                           " (offset " + std::to_string(offset) + " from " +
                           format_iso_date(base) + ")");
            return candidate;
        }

        if (result.error().is_fault()) ++faults;
        log_.write(LogLevel::Debug, kComponent,
                   "Probe " + format_iso_date(candidate) + ": " +
                       std::string(to_string(result.error().reason)));
    }

    auto span = format_iso_date(add_days(base, -max_probe_days_)) + ".." + format_iso_date(base);
    if (faults > 0) {
        auto msg = "No report found in " + span + "; " + std::to_string(faults) +
                   " probe(s) failed on the wire";
        log_.write(LogLevel::Error, kComponent, msg);
        return std::unexpected(AnchorError{AnchorError::Kind::FetchFailures, msg});
    }

    auto msg = "No report published in " + span;
    log_.write(LogLevel::Error, kComponent, msg);
    return std::unexpected(AnchorError{AnchorError::Kind::NoData, msg});
}

std::unique_ptr<AnchorResolver> make_anchor_resolver(
    const AnchorConfig& config, ReportSource& source, TodayFn today, LogSink& log) {

    if (!config.auto_probe) {
        return std::make_unique<FixedLagResolver>(config.lag_days, std::move(today));
    }
    return std::make_unique<ProbingResolver>(source, config.lag_days, config.max_probe_days,
                                             std::move(today), log);
}

} // namespace unitpulse
