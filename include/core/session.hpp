#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace core {

// UNIX seconds; injectable for tests
using Clock = std::function<std::int64_t()>;

inline std::int64_t unix_now() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

enum class Session { Asian, London, NewYork };

inline const char* to_string(Session s) {
    switch (s) {
        case Session::Asian:  return "Asian";
        case Session::London: return "London";
        default:              return "NewYork";
    }
}

// days since 1970-01-01 for a proleptic Gregorian date
std::int64_t days_from_civil(int y, unsigned m, unsigned d);

// UTC calendar day index of a UNIX timestamp
inline std::int64_t utc_day(std::int64_t unix_s) {
    return unix_s >= 0 ? unix_s / 86400 : (unix_s - 86399) / 86400;
}

// New York UTC offset in seconds (US DST rules since 2007)
int new_york_offset(std::int64_t unix_s);

// Asian 00-08, London 08-16, NewYork 16-24, New York local time
Session session_at(std::int64_t unix_s);

// "2025-01-02 13:45 UTC"
std::string format_utc(std::int64_t unix_s);

} // namespace core
