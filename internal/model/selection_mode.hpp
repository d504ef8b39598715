#pragma once

#include <cstdint>
#include <string_view>

namespace retest::model {

enum class SelectionMode : std::uint8_t {
  kNormal      = 0, // skip stable, previously passing tests
  kForceSelect = 1, // same, conjunctive with external test filters
  kNoSelect    = 2, // run everything, still ordered
};

constexpr std::string_view ToString(SelectionMode mode) {
  switch (mode) {
    case SelectionMode::kNormal:
      return "normal";
    case SelectionMode::kForceSelect:
      return "force-select";
    case SelectionMode::kNoSelect:
    default:
      return "no-select";
  }
}

} // namespace retest::model
