#include "katafetch/calendar.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace katafetch {

std::optional<Date> parse_date(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;
    // sscanf would let a sign or blanks through
    for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
    }

    int y = 0;
    unsigned m = 0, d = 0;
    int consumed = 0;
    if (sscanf(text.c_str(), "%4d-%2u-%2u%n", &y, &m, &d, &consumed) != 3 ||
        consumed != static_cast<int>(text.size())) {
        return std::nullopt;
    }

    Date date{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
    if (!date.ok()) return std::nullopt;
    return date;
}

std::string format_date(const Date& date) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
             static_cast<int>(date.year()),
             static_cast<unsigned>(date.month()),
             static_cast<unsigned>(date.day()));
    return buf;
}

Date today_local() {
    time_t now = time(nullptr);
    struct tm tm_val;
    localtime_r(&now, &tm_val);
    return Date{std::chrono::year{tm_val.tm_year + 1900},
                std::chrono::month{static_cast<unsigned>(tm_val.tm_mon + 1)},
                std::chrono::day{static_cast<unsigned>(tm_val.tm_mday)}};
}

std::string utc_timestamp_now() {
    time_t now = time(nullptr);
    struct tm tm_val;
    gmtime_r(&now, &tm_val);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_val);
    return buf;
}

}  // namespace katafetch
