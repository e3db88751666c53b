#include "usage/period_filter.hpp"

#include <algorithm>
#include <ctime>
#include <format>
#include <iterator>

namespace tokenmeter {

bool Period::contains(Timestamp ts) const {
    if (start && ts < *start) return false;
    if (end && ts > *end) return false;
    return true;
}

Period Period::all() {
    Period p;
    p.label = "all time";
    return p;
}

Period Period::last_days(int days, Timestamp now) {
    Period p;
    p.start = now - std::chrono::days(days);
    p.end = now;
    p.label = days == 1 ? "last 1 day" : std::format("last {} days", days);
    return p;
}

Period Period::today(Timestamp now) {
    Period p;
    p.start = start_of_local_day(now);
    p.end = end_of_local_day(now);
    p.label = "today";
    return p;
}

Period Period::this_week(Timestamp now) {
    const auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    ::localtime_r(&time, &tm_buf);

    // tm_wday: 0 = Sunday; weeks start on Monday
    const int days_since_monday = (tm_buf.tm_wday + 6) % 7;
    tm_buf.tm_mday -= days_since_monday;
    tm_buf.tm_hour = 12;    // mid-day keeps DST shifts from crossing midnight
    tm_buf.tm_min = 0;
    tm_buf.tm_sec = 0;
    tm_buf.tm_isdst = -1;
    const auto monday = std::chrono::system_clock::from_time_t(std::mktime(&tm_buf));

    Period p;
    p.start = start_of_local_day(monday);
    p.end = end_of_local_day(now);
    p.label = "this week";
    return p;
}

Period Period::this_month(Timestamp now) {
    const auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    ::localtime_r(&time, &tm_buf);

    tm_buf.tm_mday = 1;
    tm_buf.tm_hour = 12;
    tm_buf.tm_min = 0;
    tm_buf.tm_sec = 0;
    tm_buf.tm_isdst = -1;
    const auto first = std::chrono::system_clock::from_time_t(std::mktime(&tm_buf));

    Period p;
    p.start = start_of_local_day(first);
    p.end = end_of_local_day(now);
    p.label = "this month";
    return p;
}

Period Period::between(std::optional<Timestamp> start, std::optional<Timestamp> end) {
    Period p;
    p.start = start;
    p.end = end;
    if (start && end) {
        p.label = std::format("{} to {}", format_iso8601_utc(*start), format_iso8601_utc(*end));
    } else if (start) {
        p.label = std::format("since {}", format_iso8601_utc(*start));
    } else if (end) {
        p.label = std::format("until {}", format_iso8601_utc(*end));
    } else {
        p.label = "all time";
    }
    return p;
}

std::vector<UsageRecord> filter_by_period(const std::vector<UsageRecord>& records,
                                          const Period& period) {
    if (period.unbounded()) return records;

    std::vector<UsageRecord> filtered;
    std::copy_if(records.begin(), records.end(), std::back_inserter(filtered),
                 [&period](const UsageRecord& r) { return period.contains(r.timestamp); });
    return filtered;
}

} // namespace tokenmeter
