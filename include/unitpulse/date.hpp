#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace unitpulse {

using Date = std::chrono::year_month_day;
using TimePoint = std::chrono::system_clock::time_point;

Date today_utc();
Date to_date(TimePoint tp);
Date add_days(Date date, int days);

// YYYY-MM-DD
std::string format_iso_date(Date date);
std::optional<Date> parse_iso_date(std::string_view s);

// YYYY-MM-DD HH:MM UTC
std::string format_utc_minute(TimePoint tp);

} // namespace unitpulse
