#pragma once

#include <chrono>
#include <string>
#include <string_view>

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

using SysClock = std::chrono::system_clock;
using SysTimePoint = std::chrono::sys_time<std::chrono::seconds>;

using LocalTimePoint = std::chrono::local_time<std::chrono::seconds>;

inline constexpr std::string_view jp_tz = "Asia/Tokyo";

using milliseconds = std::chrono::milliseconds;
using seconds = std::chrono::seconds;
using minutes = std::chrono::minutes;
using hours = std::chrono::hours;
using days = std::chrono::days;
using months = std::chrono::months;
using years = std::chrono::years;

// Throws std::runtime_error on malformed input
LocalTimePoint datetime_to_local(std::string_view datetime,
                                 std::string_view fmt = "%F %T",
                                 std::string_view timezone = jp_tz);

inline LocalTimePoint date_to_local(std::string_view datetime,
                                    std::string_view timezone = jp_tz) {
  return datetime_to_local(datetime, "%F", timezone);
}

std::string datetime_to_string(LocalTimePoint tp);
std::string date_to_string(LocalTimePoint tp);

LocalTimePoint now_jp_time();

// Whole calendar days from `from` to `to`, negative when `to` is earlier
int days_between(LocalTimePoint from, LocalTimePoint to);
double years_between(LocalTimePoint from, LocalTimePoint to);

inline bool same_day(LocalTimePoint a, LocalTimePoint b) {
  return days_between(a, b) == 0;
}

struct Timer {
  TimePoint start;
  Timer() : start{Clock::now()} {}
  double diff_ms() const {
    return std::chrono::duration<double, std::milli>(Clock::now() - start)
        .count();
  }
};
