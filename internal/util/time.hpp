#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace retest::util {

/*
  Every clock read in the engine goes through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

// "YYYY-MM-DD" in UTC
std::string ToIsoDate(TimePoint tp);

// nullopt unless the text is exactly "YYYY-MM-DD"
std::optional<TimePoint> FromIsoDate(const std::string& text);

} // namespace retest::util
