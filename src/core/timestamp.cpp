#include "core/timestamp.hpp"

#include <cctype>
#include <ctime>
#include <format>

namespace tokenmeter {

namespace {

using namespace std::chrono;

// Cursor over the input; every reader returns false without consuming on mismatch
struct Cursor {
    std::string_view s;
    size_t pos = 0;

    [[nodiscard]] bool at_end() const { return pos >= s.size(); }
    [[nodiscard]] char peek() const { return at_end() ? '\0' : s[pos]; }

    bool consume(char c) {
        if (peek() != c) return false;
        ++pos;
        return true;
    }

    // Exactly n decimal digits
    bool digits(size_t n, int& out) {
        if (pos + n > s.size()) return false;
        int v = 0;
        for (size_t i = 0; i < n; ++i) {
            const char c = s[pos + i];
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
            v = v * 10 + (c - '0');
        }
        pos += n;
        out = v;
        return true;
    }
};

bool parse_date(Cursor& cur, year_month_day& out) {
    int y = 0, m = 0, d = 0;
    if (!cur.digits(4, y) || !cur.consume('-') ||
        !cur.digits(2, m) || !cur.consume('-') ||
        !cur.digits(2, d)) {
        return false;
    }
    out = year{y} / month{static_cast<unsigned>(m)} / day{static_cast<unsigned>(d)};
    return out.ok();
}

// Fraction of a second, up to nanosecond precision (extra digits are dropped)
bool parse_fraction(Cursor& cur, nanoseconds& out) {
    int64_t ns = 0;
    int count = 0;
    while (!cur.at_end() && std::isdigit(static_cast<unsigned char>(cur.peek()))) {
        if (count < 9) {
            ns = ns * 10 + (cur.peek() - '0');
            ++count;
        }
        ++cur.pos;
    }
    if (count == 0) return false;
    for (int i = count; i < 9; ++i) ns *= 10;
    out = nanoseconds(ns);
    return true;
}

bool parse_offset(Cursor& cur, minutes& out) {
    if (cur.consume('Z') || cur.consume('z')) {
        out = minutes(0);
        return true;
    }

    int sign = 0;
    if (cur.consume('+')) sign = 1;
    else if (cur.consume('-')) sign = -1;
    else return false;

    int hh = 0, mm = 0;
    if (!cur.digits(2, hh)) return false;
    if (cur.consume(':')) {
        if (!cur.digits(2, mm)) return false;
    } else if (!cur.at_end()) {
        if (!cur.digits(2, mm)) return false;
    }
    if (hh > 23 || mm > 59) return false;

    out = minutes(sign * (hh * 60 + mm));
    return true;
}

Timestamp local_midnight(std::tm tm_buf) {
    tm_buf.tm_hour = 0;
    tm_buf.tm_min = 0;
    tm_buf.tm_sec = 0;
    tm_buf.tm_isdst = -1;
    return system_clock::from_time_t(std::mktime(&tm_buf));
}

std::tm to_local_tm(Timestamp tp) {
    const auto time = system_clock::to_time_t(floor<seconds>(tp));
    std::tm tm_buf{};
    ::localtime_r(&time, &tm_buf);
    return tm_buf;
}

} // anonymous namespace

std::optional<Timestamp> parse_iso8601(std::string_view text) {
    Cursor cur{text};

    year_month_day ymd;
    if (!parse_date(cur, ymd)) return std::nullopt;

    nanoseconds time_of_day{0};
    if (cur.consume('T') || cur.consume('t') || cur.consume(' ')) {
        int hh = 0, mm = 0, ss = 0;
        if (!cur.digits(2, hh) || !cur.consume(':') || !cur.digits(2, mm)) {
            return std::nullopt;
        }
        if (cur.consume(':')) {
            if (!cur.digits(2, ss)) return std::nullopt;
            if (cur.consume('.') || cur.consume(',')) {
                nanoseconds frac{0};
                if (!parse_fraction(cur, frac)) return std::nullopt;
                time_of_day += frac;
            }
        }
        if (hh > 23 || mm > 59 || ss > 59) return std::nullopt;
        time_of_day += hours(hh) + minutes(mm) + seconds(ss);
    }

    minutes offset{0};
    if (!cur.at_end() && !parse_offset(cur, offset)) return std::nullopt;
    if (!cur.at_end()) return std::nullopt;

    const auto utc = sys_days(ymd) + time_of_day - offset;
    return time_point_cast<system_clock::duration>(utc);
}

std::optional<Timestamp> parse_local_date(std::string_view text) {
    Cursor cur{text};
    year_month_day ymd;
    if (!parse_date(cur, ymd) || !cur.at_end()) return std::nullopt;

    std::tm tm_buf{};
    tm_buf.tm_year = static_cast<int>(ymd.year()) - 1900;
    tm_buf.tm_mon = static_cast<int>(static_cast<unsigned>(ymd.month())) - 1;
    tm_buf.tm_mday = static_cast<int>(static_cast<unsigned>(ymd.day()));
    return local_midnight(tm_buf);
}

Timestamp start_of_local_day(Timestamp tp) {
    return local_midnight(to_local_tm(tp));
}

Timestamp end_of_local_day(Timestamp tp) {
    auto tm_buf = to_local_tm(tp);
    tm_buf.tm_mday += 1;
    return local_midnight(tm_buf) - system_clock::duration(1);
}

std::string format_iso8601_utc(Timestamp tp) {
    const auto ms_tp = floor<milliseconds>(tp);
    const auto day_tp = floor<days>(ms_tp);
    const year_month_day ymd{day_tp};
    const hh_mm_ss hms{ms_tp - day_tp};

    return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
        static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()),
        hms.hours().count(),
        hms.minutes().count(),
        hms.seconds().count(),
        hms.subseconds().count());
}

} // namespace tokenmeter
