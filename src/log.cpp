#include "unitpulse/log.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <iostream>

namespace unitpulse {

namespace {

std::string utc_timestamp() {
    auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    auto day = std::chrono::floor<std::chrono::days>(now);
    std::chrono::year_month_day ymd{day};
    std::chrono::hh_mm_ss hms{now - day};

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02dZ",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<int>(hms.hours().count()),
                  static_cast<int>(hms.minutes().count()),
                  static_cast<int>(hms.seconds().count()));
    return buf;
}

} // namespace

std::string_view to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> parse_log_level(std::string_view s) {
    std::string upper(s);
    std::ranges::transform(upper, upper.begin(),
                           [](unsigned char c) { return std::toupper(c); });

    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO") return LogLevel::Info;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::Warning;
    if (upper == "ERROR") return LogLevel::Error;
    return std::nullopt;
}

StderrLogSink::StderrLogSink(LogLevel min_level) : min_level_(min_level) {}

void StderrLogSink::write(LogLevel level, std::string_view component,
                          std::string_view message) {
    if (level < min_level_) return;

    auto stamp = utc_timestamp();
    std::lock_guard lock(mutex_);
    std::cerr << stamp << ' ' << to_string(level) << ' '
              << component << ": " << message << '\n';
}

void MemoryLogSink::write(LogLevel level, std::string_view component,
                          std::string_view message) {
    std::lock_guard lock(mutex_);
    entries_.push_back({
        .level = level,
        .component = std::string(component),
        .message = std::string(message),
    });
}

std::vector<LogEntry> MemoryLogSink::entries() const {
    std::lock_guard lock(mutex_);
    return entries_;
}

int MemoryLogSink::count(LogLevel level) const {
    std::lock_guard lock(mutex_);
    return static_cast<int>(std::ranges::count(entries_, level, &LogEntry::level));
}

bool MemoryLogSink::contains(std::string_view needle) const {
    std::lock_guard lock(mutex_);
    return std::ranges::any_of(entries_, [&](const LogEntry& e) {
        return e.message.find(needle) != std::string::npos;
    });
}

} // namespace unitpulse
