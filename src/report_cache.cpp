#include "unitpulse/report_cache.hpp"

namespace unitpulse {

std::optional<ReportResult> ReportCache::get(Date date) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(date);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void ReportCache::store(Date date, const ReportResult& result) {
    if (!is_cacheable(result)) return;
    std::lock_guard lock(mutex_);
    entries_.insert_or_assign(date, result);
}

size_t ReportCache::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

bool ReportCache::is_cacheable(const ReportResult& result) {
    return result.has_value() || result.error().reason == UnavailableReason::NotPublished;
}

CachingReportSource::CachingReportSource(ReportSource& inner, ReportCache& cache)
    : inner_(inner), cache_(cache) {}

ReportResult CachingReportSource::fetch(Date date) {
    if (auto cached = cache_.get(date)) return *cached;

    auto result = inner_.fetch(date);
    cache_.store(date, result);
    return result;
}

} // namespace unitpulse
