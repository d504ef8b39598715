#include "internal/report/summary.hpp"

#include <chrono>
#include <vector>

#include "internal/observability/logging.hpp"

namespace retest::report {

namespace {

std::string Join(const std::vector<std::string>& parts) {
  std::string out;
  for (const auto& part : parts) {
    if (part.empty()) continue;
    if (!out.empty()) out += ", ";
    out += part;
  }
  return out;
}

} // namespace

std::string ChangedFilesText(const core::StabilityReport& report) {
  std::vector<std::string> changed(report.unstable_files.begin(), report.unstable_files.end());
  auto text = Join(changed);
  if (text.empty() || text.size() > kMaxChangedFilesListing) {
    text = std::to_string(report.unstable_files.size());
  }
  return text;
}

std::string BuildSummary(const core::StabilityReport& report, const config::RunMode& run_mode, const std::string& environment,
                         std::optional<uint64_t> deselected_count) {
  std::vector<std::string> parts;
  parts.push_back(run_mode.message);

  if (run_mode.Active() && run_mode.select) {
    if (report.IsNewDatabase()) {
      parts.emplace_back("new DB");
    } else {
      std::string changed = report.libraries_miss ? "libraries upgrade, " : "";
      changed += "changed files: " + ChangedFilesText(report);
      parts.push_back(std::move(changed));
      parts.push_back("skipping collection of " + std::to_string(report.collection_skippable_files.size()) + " files");
    }
    if (deselected_count) {
      parts.push_back(std::to_string(*deselected_count) + " tests deselected");
    }
  }

  if (!environment.empty()) {
    parts.push_back("environment: " + environment);
  }

  return "retest: " + Join(parts);
}

NoticeSchedule::NoticeSchedule(std::string message, uint32_t interval_days)
    : message_(std::move(message)), interval_days_(interval_days) {
}

std::optional<std::string> NoticeSchedule::Due(core::Reconciler& reconciler, util::TimePoint now) const {
  if (message_.empty()) {
    return std::nullopt;
  }

  const auto last = reconciler.ReadAttribute(kAttribute);
  if (last) {
    const auto shown = util::FromIsoDate(*last);
    if (!shown) {
      RETEST_LOG_DEBUG("unparsable notice date", {observability::StringField("value", *last)});
    } else if (now - *shown < std::chrono::days(interval_days_)) {
      return std::nullopt;
    }
  }

  reconciler.WriteAttribute(kAttribute, util::ToIsoDate(now));
  return message_;
}

} // namespace retest::report
