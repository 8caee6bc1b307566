#include "core/session.hpp"
#include <fmt/format.h>

namespace core {

std::int64_t days_from_civil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

static void civil_from_days(std::int64_t z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe/1460 + doe/36524 - doe/146096) / 365;
    const unsigned doy = doe - (365*yoe + yoe/4 - yoe/100);
    const unsigned mp = (5*doy + 2) / 153;
    d = doy - (153*mp + 2)/5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(yoe) + static_cast<int>(era) * 400 + (m <= 2);
}

// day index of the n-th Sunday (1-based) of a month
static std::int64_t nth_sunday(int y, unsigned m, int n) {
    const std::int64_t first = days_from_civil(y, m, 1);
    // 1970-01-01 was a Thursday (weekday 4, Sunday = 0)
    const int wd = static_cast<int>(((first % 7) + 7 + 4) % 7);
    const int to_sunday = (7 - wd) % 7;
    return first + to_sunday + 7 * (n - 1);
}

int new_york_offset(std::int64_t unix_s) {
    int y; unsigned m, d;
    civil_from_days(utc_day(unix_s), y, m, d);
    // 02:00 local: 07:00 UTC in March (EST), 06:00 UTC in November (EDT)
    const std::int64_t dst_start = nth_sunday(y, 3, 2) * 86400 + 7 * 3600;
    const std::int64_t dst_end   = nth_sunday(y, 11, 1) * 86400 + 6 * 3600;
    return (unix_s >= dst_start && unix_s < dst_end) ? -4 * 3600 : -5 * 3600;
}

Session session_at(std::int64_t unix_s) {
    const std::int64_t local = unix_s + new_york_offset(unix_s);
    const std::int64_t hour = (local - utc_day(local) * 86400) / 3600;
    if (hour < 8)  return Session::Asian;
    if (hour < 16) return Session::London;
    return Session::NewYork;
}

std::string format_utc(std::int64_t unix_s) {
    int y; unsigned m, d;
    const std::int64_t day = utc_day(unix_s);
    civil_from_days(day, y, m, d);
    const std::int64_t sec = unix_s - day * 86400;
    return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d} UTC", y, m, d, sec / 3600, (sec % 3600) / 60);
}

} // namespace core
