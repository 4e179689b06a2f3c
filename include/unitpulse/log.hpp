#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace unitpulse {

enum class LogLevel { Debug, Info, Warning, Error };

std::string_view to_string(LogLevel level);
std::optional<LogLevel> parse_log_level(std::string_view s);

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

class StderrLogSink : public LogSink {
public:
    explicit StderrLogSink(LogLevel min_level = LogLevel::Info);

    void write(LogLevel level, std::string_view component,
               std::string_view message) override;

private:
    LogLevel min_level_;
    std::mutex mutex_;
};

struct LogEntry {
    LogLevel level = LogLevel::Info;
    std::string component;
    std::string message;
};

// Keeps everything it is given; used by tests and --dry-run diagnostics.
class MemoryLogSink : public LogSink {
public:
    void write(LogLevel level, std::string_view component,
               std::string_view message) override;

    std::vector<LogEntry> entries() const;
    int count(LogLevel level) const;
    bool contains(std::string_view needle) const;

private:
    mutable std::mutex mutex_;
    std::vector<LogEntry> entries_;
};

} // namespace unitpulse
