#include "Dates.h"
#include <ctime>
#include <cctype>
#include <cstdio>

namespace milestones {

static constexpr int64_t SECONDS_PER_DAY = 24 * 60 * 60;

static bool all_digits(const std::string& s, size_t pos, size_t len) {
    if (pos + len > s.size()) return false;
    for (size_t i = pos; i < pos + len; ++i) if (!isdigit((unsigned char)s[i])) return false;
    return true;
}

// Only UTC time-of-day suffixes are accepted.
static bool time_suffix_is_utc(const std::string& s) {
    if (s.size() == 10) return true;
    if (s[10] != 'T' && s[10] != ' ') return false;
    if (s.size() < 19) return false;
    if (!all_digits(s, 11, 2) || s[13] != ':' || !all_digits(s, 14, 2) || s[16] != ':' || !all_digits(s, 17, 2)) return false;
    size_t pos = 19;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        size_t frac = pos;
        while (pos < s.size() && isdigit((unsigned char)s[pos])) ++pos;
        if (pos == frac) return false;
    }
    std::string zone = s.substr(pos);
    if (s[10] == 'T') return zone == "Z" || zone == "+00:00";
    return zone.empty() || zone == "+00" || zone == "+00:00" || zone == "+0000";
}

std::optional<day_t> parse_day(const std::string& s) {
    if (s.size() < 10) return std::nullopt;
    if (!all_digits(s, 0, 4) || s[4] != '-' || !all_digits(s, 5, 2) || s[7] != '-' || !all_digits(s, 8, 2)) return std::nullopt;
    if (!time_suffix_is_utc(s)) return std::nullopt;

    std::tm tm{};
    tm.tm_year = std::stoi(s.substr(0, 4)) - 1900;
    tm.tm_mon = std::stoi(s.substr(5, 2)) - 1;
    tm.tm_mday = std::stoi(s.substr(8, 2));
    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31) return std::nullopt;
    const int want_mon = tm.tm_mon, want_mday = tm.tm_mday;

    time_t t = timegm(&tm);
    // timegm normalizes 2024-02-30 into March; reject anything it had to move
    if (tm.tm_mon != want_mon || tm.tm_mday != want_mday) return std::nullopt;

    int64_t secs = static_cast<int64_t>(t);
    int64_t days = secs / SECONDS_PER_DAY;
    if (secs % SECONDS_PER_DAY < 0) --days;
    return days;
}

static std::tm to_tm(day_t d) {
    time_t t = static_cast<time_t>(d * SECONDS_PER_DAY);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

std::string format_day(day_t d) {
    std::tm tm = to_tm(d);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
    return std::string(buf);
}

std::string format_day_iso(day_t d) {
    return format_day(d) + "T00:00:00.000Z";
}

}
