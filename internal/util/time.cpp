#include "time.hpp"

#include <cstdio>

namespace retest::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string ToIsoDate(TimePoint tp) {
  const auto                        day = std::chrono::floor<std::chrono::days>(tp);
  const std::chrono::year_month_day ymd{day};

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()));
  return buf;
}

std::optional<TimePoint> FromIsoDate(const std::string& text) {
  int      y = 0;
  unsigned m = 0;
  unsigned d = 0;
  int      consumed = 0;
  if (text.size() != 10 || std::sscanf(text.c_str(), "%4d-%2u-%2u%n", &y, &m, &d, &consumed) != 3 || consumed != 10) {
    return std::nullopt;
  }

  const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
  if (!ymd.ok()) {
    return std::nullopt;
  }
  return TimePoint{std::chrono::sys_days{ymd}};
}

} // namespace retest::util
