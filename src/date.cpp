#include "unitpulse/date.hpp"
#include <charconv>
#include <cstdio>

namespace unitpulse {

namespace {

bool parse_fixed(std::string_view s, int& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

} // namespace

Date to_date(TimePoint tp) {
    return Date{std::chrono::floor<std::chrono::days>(tp)};
}

Date today_utc() {
    return to_date(std::chrono::system_clock::now());
}

Date add_days(Date date, int days) {
    return Date{std::chrono::sys_days{date} + std::chrono::days{days}};
}

std::string format_iso_date(Date date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                  static_cast<int>(date.year()),
                  static_cast<unsigned>(date.month()),
                  static_cast<unsigned>(date.day()));
    return buf;
}

std::optional<Date> parse_iso_date(std::string_view s) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return std::nullopt;

    int y = 0;
    int m = 0;
    int d = 0;
    if (!parse_fixed(s.substr(0, 4), y) || !parse_fixed(s.substr(5, 2), m) ||
        !parse_fixed(s.substr(8, 2), d)) {
        return std::nullopt;
    }

    Date date{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)},
              std::chrono::day{static_cast<unsigned>(d)}};
    if (!date.ok()) return std::nullopt;
    return date;
}

std::string format_utc_minute(TimePoint tp) {
    auto day = std::chrono::floor<std::chrono::days>(tp);
    std::chrono::hh_mm_ss hms{std::chrono::floor<std::chrono::minutes>(tp - day)};
    char buf[16];
    std::snprintf(buf, sizeof(buf), " %02d:%02d UTC",
                  static_cast<int>(hms.hours().count()),
                  static_cast<int>(hms.minutes().count()));
    return format_iso_date(Date{day}) + buf;
}

} // namespace unitpulse
