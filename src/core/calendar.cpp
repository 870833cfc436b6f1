#include "shift_roster/calendar.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace shift_roster {

namespace {

// H. Hinnant の days_from_civil / civil_from_days
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int& y, int& m, int& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = static_cast<int>(static_cast<int64_t>(yoe) + era * 400 + (m <= 2));
}

bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int days_in_month(int y, int m) {
    static const int table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y)) return 29;
    return table[m - 1];
}

bool parse_digits(const std::string& text, size_t pos, size_t len, int& out) {
    if (pos + len > text.size()) return false;
    int value = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

const char* const kWeekdayNames[] = {
    "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"
};

} // namespace

Date::Date(int year, int month, int day)
    : days_(days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day))) {}

std::optional<Date> Date::parse(const std::string& text) {
    std::string s = trim(text);
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') {
        return std::nullopt;
    }
    int y, m, d;
    if (!parse_digits(s, 0, 4, y) || !parse_digits(s, 5, 2, m) || !parse_digits(s, 8, 2, d)) {
        return std::nullopt;
    }
    if (m < 1 || m > 12 || d < 1 || d > days_in_month(y, m)) {
        return std::nullopt;
    }
    return Date(y, m, d);
}

Date Date::from_days(int64_t days) {
    Date date;
    date.days_ = days;
    return date;
}

Date Date::today() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    if (localtime_r(&now, &local) == nullptr) {
        throw std::runtime_error("Cannot determine the local date");
    }
    return Date(local.tm_year + 1900, local.tm_mon + 1, local.tm_mday);
}

int Date::year() const {
    int y, m, d;
    civil_from_days(days_, y, m, d);
    return y;
}

int Date::month() const {
    int y, m, d;
    civil_from_days(days_, y, m, d);
    return m;
}

int Date::day() const {
    int y, m, d;
    civil_from_days(days_, y, m, d);
    return d;
}

int Date::weekday() const {
    // 1970-01-01 は木曜日
    int64_t w = (days_ + 3) % 7;
    if (w < 0) w += 7;
    return static_cast<int>(w);
}

std::string Date::weekday_name() const {
    return shift_roster::weekday_name(weekday());
}

std::string Date::to_string() const {
    int y, m, d;
    civil_from_days(days_, y, m, d);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", y, m, d);
    return buf;
}

std::string weekday_name(int weekday) {
    if (weekday < 0 || weekday > 6) return "";
    return kWeekdayNames[weekday];
}

std::optional<int> parse_weekday(const std::string& name) {
    std::string lower;
    for (char c : trim(name)) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower.size() < 3) return std::nullopt;
    for (int i = 0; i < 7; ++i) {
        std::string full = kWeekdayNames[i];
        std::transform(full.begin(), full.end(), full.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == full || lower == full.substr(0, 3)) {
            return i;
        }
    }
    return std::nullopt;
}

bool TimeRange::overlaps(const TimeRange& other) const {
    auto intersects = [](int s1, int e1, int s2, int e2) {
        return std::max(s1, s2) < std::min(e1, e2);
    };
    int s1 = start, e1 = end_offset();
    int s2 = other.start, e2 = other.end_offset();
    return intersects(s1, e1, s2, e2)
        || intersects(s1, e1, s2 + kMinutesPerDay, e2 + kMinutesPerDay)
        || intersects(s1 + kMinutesPerDay, e1 + kMinutesPerDay, s2, e2);
}

std::optional<int> parse_clock(const std::string& text) {
    std::string s = trim(text);
    size_t colon = s.find(':');
    if (colon == std::string::npos || colon == 0 || colon > 2 || s.size() != colon + 3) {
        return std::nullopt;
    }
    int h, m;
    if (!parse_digits(s, 0, colon, h) || !parse_digits(s, colon + 1, 2, m)) {
        return std::nullopt;
    }
    if (h > 24 || m > 59 || (h == 24 && m != 0)) {
        return std::nullopt;
    }
    return (h % 24) * 60 + m;
}

std::optional<TimeRange> parse_time_range(const std::string& text) {
    size_t dash = text.find('-');
    if (dash == std::string::npos) {
        return std::nullopt;
    }
    auto start = parse_clock(text.substr(0, dash));
    auto end = parse_clock(text.substr(dash + 1));
    if (!start || !end) {
        return std::nullopt;
    }
    return TimeRange{*start, *end};
}

std::optional<double> rest_hours_between(const Date& prev_date, const std::string& prev_time,
                                         const Date& next_date, const std::string& next_time) {
    auto prev = parse_time_range(prev_time);
    auto next = parse_time_range(next_time);
    if (!prev || !next) {
        return std::nullopt;
    }
    int64_t prev_end = prev_date.days() * kMinutesPerDay + prev->end_offset();
    int64_t next_start = next_date.days() * kMinutesPerDay + next->start;
    return static_cast<double>(next_start - prev_end) / 60.0;
}

std::string format_hours(double hours) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", hours);
    std::string s = buf;
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    return s;
}

} // namespace shift_roster
