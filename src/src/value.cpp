#include <cf/value.h>

#include <cctype>
#include <cstdio>

namespace cf {

namespace {

bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int days_in_month(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y)) return 29;
    return days[m - 1];
}

// Reads exactly `n` decimal digits at `pos`; advances pos on success.
bool read_digits(const std::string& s, size_t& pos, size_t n, int& out) {
    if (pos + n > s.size()) return false;
    int v = 0;
    for (size_t k = 0; k < n; ++k) {
        unsigned char c = static_cast<unsigned char>(s[pos + k]);
        if (!std::isdigit(c)) return false;
        v = v * 10 + (c - '0');
    }
    pos += n;
    out = v;
    return true;
}

bool expect(const std::string& s, size_t& pos, char c) {
    if (pos < s.size() && s[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

bool read_date(const std::string& s, size_t& pos, CalendarDate& out) {
    int y = 0, m = 0, d = 0;
    if (!read_digits(s, pos, 4, y)) return false;
    if (!expect(s, pos, '-')) return false;
    if (!read_digits(s, pos, 2, m)) return false;
    if (!expect(s, pos, '-')) return false;
    if (!read_digits(s, pos, 2, d)) return false;
    if (m < 1 || m > 12) return false;
    if (d < 1 || d > days_in_month(y, m)) return false;
    out = CalendarDate{y, m, d};
    return true;
}

bool read_time(const std::string& s, size_t& pos, ClockTime& out) {
    ClockTime t;
    if (!read_digits(s, pos, 2, t.hour)) return false;
    if (!expect(s, pos, ':')) return false;
    if (!read_digits(s, pos, 2, t.minute)) return false;
    if (expect(s, pos, ':')) {
        if (!read_digits(s, pos, 2, t.second)) return false;
        if (expect(s, pos, '.')) {
            // 1 to 6 fractional digits, right padded to microseconds
            size_t start = pos;
            int frac = 0;
            while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos])) && pos - start < 6) {
                frac = frac * 10 + (s[pos] - '0');
                ++pos;
            }
            size_t digits = pos - start;
            if (digits == 0) return false;
            for (size_t k = digits; k < 6; ++k) frac *= 10;
            t.microsecond = frac;
        }
    }
    if (t.hour > 23 || t.minute > 59 || t.second > 59) return false;

    if (expect(s, pos, 'Z') || expect(s, pos, 'z')) {
        t.has_offset = true;
        t.offset_minutes = 0;
    } else if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
        int sign = s[pos] == '-' ? -1 : 1;
        ++pos;
        int oh = 0, om = 0;
        if (!read_digits(s, pos, 2, oh)) return false;
        if (!expect(s, pos, ':')) return false;
        if (!read_digits(s, pos, 2, om)) return false;
        if (oh > 23 || om > 59) return false;
        t.has_offset = true;
        t.offset_minutes = sign * (oh * 60 + om);
    }
    out = t;
    return true;
}

}  // namespace

// Howard Hinnant's days_from_civil
int64_t CalendarDate::days_since_epoch() const {
    int64_t y = year;
    const int64_t m = month;
    const int64_t d = day;
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

std::string CalendarDate::to_string() const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

int64_t ClockTime::microseconds_since_midnight() const {
    int64_t us = ((int64_t(hour) * 60 + minute) * 60 + second) * 1000000 + microsecond;
    if (has_offset) us -= int64_t(offset_minutes) * 60 * 1000000;
    return us;
}

std::string ClockTime::to_string() const {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", hour, minute, second);
    std::string out = buf;
    if (microsecond != 0) {
        std::snprintf(buf, sizeof(buf), ".%06d", microsecond);
        out += buf;
    }
    if (has_offset) {
        if (offset_minutes == 0) {
            out += "Z";
        } else {
            int a = offset_minutes < 0 ? -offset_minutes : offset_minutes;
            std::snprintf(buf, sizeof(buf), "%c%02d:%02d", offset_minutes < 0 ? '-' : '+', a / 60, a % 60);
            out += buf;
        }
    }
    return out;
}

int64_t Timestamp::epoch_microseconds() const {
    return date.days_since_epoch() * 86400LL * 1000000LL + time.microseconds_since_midnight();
}

std::string Timestamp::to_string() const { return date.to_string() + "T" + time.to_string(); }

std::optional<CalendarDate> parse_iso_date(const std::string& text) {
    size_t pos = 0;
    CalendarDate d;
    if (!read_date(text, pos, d) || pos != text.size()) return std::nullopt;
    return d;
}

std::optional<ClockTime> parse_iso_time(const std::string& text) {
    size_t pos = 0;
    ClockTime t;
    if (!read_time(text, pos, t) || pos != text.size()) return std::nullopt;
    return t;
}

std::optional<Timestamp> parse_iso_datetime(const std::string& text) {
    size_t pos = 0;
    Timestamp ts;
    if (!read_date(text, pos, ts.date)) return std::nullopt;
    if (!(expect(text, pos, 'T') || expect(text, pos, 't') || expect(text, pos, ' '))) return std::nullopt;
    if (!read_time(text, pos, ts.time) || pos != text.size()) return std::nullopt;
    return ts;
}

}  // namespace cf
