#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace katafetch {

using Date = std::chrono::year_month_day;

/// Parse a strict "YYYY-MM-DD" calendar date. Rejects impossible dates (2021-02-30).
std::optional<Date> parse_date(const std::string& text);

std::string format_date(const Date& date);

/// Current calendar date in the local time zone.
Date today_local();

/// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
std::string utc_timestamp_now();

}  // namespace katafetch
