#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/config/run_mode.hpp"
#include "internal/core/reconciler.hpp"
#include "internal/core/stability_engine.hpp"
#include "internal/util/time.hpp"

namespace retest::report {

inline constexpr std::size_t kMaxChangedFilesListing = 100;

/*
  One-line run header, e.g.

    retest: changed files: src/a.py, skipping collection of 3 files, environment: py311

  deselected_count is appended once selection has happened.
*/
std::string BuildSummary(const core::StabilityReport& report, const config::RunMode& run_mode, const std::string& environment,
                         std::optional<uint64_t> deselected_count = std::nullopt);

// "a, b, c", or the number of changed files when that text is empty or too long.
std::string ChangedFilesText(const core::StabilityReport& report);

/*
  Periodic notice appended to the header, at most once per interval.
  The date it was last shown lives in the last_notice_date attribute.
*/
class NoticeSchedule {
 public:
  static constexpr const char* kAttribute = "last_notice_date";

  NoticeSchedule(std::string message, uint32_t interval_days);

  // Returns the notice when due and stamps today's date.
  std::optional<std::string> Due(core::Reconciler& reconciler, util::TimePoint now) const;

 private:
  std::string message_;
  uint32_t    interval_days_;
};

} // namespace retest::report
