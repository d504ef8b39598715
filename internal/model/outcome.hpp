#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace retest::model {

enum class Outcome : std::uint8_t {
  kPassed = 0,
  kFailed = 1,
  kOther  = 2, // skipped, xfail, ...
};

enum class Phase : std::uint8_t {
  kSetup    = 0,
  kCall     = 1,
  kTeardown = 2,
};

constexpr std::string_view ToString(Outcome outcome) {
  switch (outcome) {
    case Outcome::kPassed:
      return "passed";
    case Outcome::kFailed:
      return "failed";
    case Outcome::kOther:
    default:
      return "other";
  }
}

constexpr std::optional<Outcome> ParseOutcome(std::string_view text) {
  if (text == "passed") return Outcome::kPassed;
  if (text == "failed") return Outcome::kFailed;
  if (text == "other" || text == "skipped") return Outcome::kOther;
  return std::nullopt;
}

constexpr std::string_view ToString(Phase phase) {
  switch (phase) {
    case Phase::kSetup:
      return "setup";
    case Phase::kCall:
      return "call";
    case Phase::kTeardown:
    default:
      return "teardown";
  }
}

} // namespace retest::model
