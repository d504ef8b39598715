#pragma once

#include <string>
#include <vector>

#include "internal/core/scheduler.hpp"
#include "internal/core/stability_engine.hpp"
#include "internal/model/selection_mode.hpp"

namespace retest::core {

struct SelectionResult {
  // execution order
  std::vector<std::string> selected;

  // skipped this run, collection order
  std::vector<std::string> deselected;
};

/*
  Partitions collected tests into must-run and skip.

  A test is skipped only if it is stable and its last recorded outcome
  was not a failure; unknown tests always run. selected and deselected
  partition the (de-duplicated) collected set exactly.
*/
class Selector {
 public:
  Selector(model::SelectionMode mode, DurationTable durations);

  SelectionResult Select(const std::vector<std::string>& collected, const StabilityReport& report) const;

  // Advisory: the whole home file may be left uncollected.
  bool ShouldSkipCollection(const std::string& path, const StabilityReport& report) const;

  static bool CanSkip(const std::string& node_id, const StabilityReport& report);

  model::SelectionMode Mode() const {
    return mode_;
  }

 private:
  model::SelectionMode mode_;
  DurationTable        durations_;
};

} // namespace retest::core
