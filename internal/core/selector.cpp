#include "internal/core/selector.hpp"

#include <unordered_set>

namespace retest::core {

Selector::Selector(model::SelectionMode mode, DurationTable durations) : mode_(mode), durations_(std::move(durations)) {
}

bool Selector::CanSkip(const std::string& node_id, const StabilityReport& report) {
  // failing tests are always re-attempted
  return report.IsStable(node_id) && !report.LastFailed(node_id);
}

SelectionResult Selector::Select(const std::vector<std::string>& collected, const StabilityReport& report) const {
  std::vector<std::string>        affected;
  std::vector<std::string>        unaffected;
  std::unordered_set<std::string> seen;

  for (const auto& node_id : collected) {
    if (!seen.insert(node_id).second) continue;

    if (CanSkip(node_id, report)) {
      unaffected.push_back(node_id);
    } else {
      affected.push_back(node_id);
    }
  }

  SelectionResult result;
  result.selected = Scheduler::Order(affected, durations_);

  if (mode_ == model::SelectionMode::kNoSelect) {
    auto rest = Scheduler::Order(unaffected, durations_);
    result.selected.insert(result.selected.end(), std::make_move_iterator(rest.begin()), std::make_move_iterator(rest.end()));
  } else {
    result.deselected = std::move(unaffected);
  }
  return result;
}

bool Selector::ShouldSkipCollection(const std::string& path, const StabilityReport& report) const {
  if (mode_ == model::SelectionMode::kNoSelect) return false;
  return report.collection_skippable_files.contains(path);
}

} // namespace retest::core
