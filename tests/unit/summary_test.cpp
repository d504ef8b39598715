#include "internal/report/summary.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using retest::config::RunMode;
using retest::core::StabilityReport;
using retest::report::BuildSummary;

RunMode Selecting() {
  RunMode mode;
  mode.collect = true;
  mode.select  = true;
  mode.mode    = retest::model::SelectionMode::kNormal;
  return mode;
}

void TestNewDatabase() {
  assert(BuildSummary(StabilityReport{}, Selecting(), "") == "retest: new DB");
}

void TestKnownNodesWithoutFilesIsNotNew() {
  StabilityReport report;
  retest::db::model::NodeRecord node;
  node.node_id = "test_a.py::test_empty";
  report.all_nodes.emplace(node.node_id, node);

  assert(BuildSummary(report, Selecting(), "") == "retest: changed files: 0, skipping collection of 0 files");
}

void TestChangedFilesListed() {
  StabilityReport report;
  report.stable_files               = {"test_a.py", "a.py"};
  report.unstable_files             = {"b.py", "c.py"};
  report.collection_skippable_files = {"test_a.py"};

  assert(BuildSummary(report, Selecting(), "") == "retest: changed files: b.py, c.py, skipping collection of 1 files");
  assert(BuildSummary(report, Selecting(), "py311", 4) ==
         "retest: changed files: b.py, c.py, skipping collection of 1 files, 4 tests deselected, environment: py311");
}

void TestLongChangedListCollapsesToCount() {
  StabilityReport report;
  report.stable_files = {"x.py"};
  for (int i = 0; i < 20; ++i) {
    report.unstable_files.insert("src/module_number_" + std::to_string(i) + ".py");
  }

  assert(retest::report::ChangedFilesText(report) == "20");
}

void TestNoChangesShowsZero() {
  StabilityReport report;
  report.stable_files = {"x.py"};
  assert(retest::report::ChangedFilesText(report) == "0");
}

void TestLibrariesUpgrade() {
  StabilityReport report;
  report.stable_files   = {"x.py"};
  report.libraries_miss = true;
  assert(BuildSummary(report, Selecting(), "") == "retest: libraries upgrade, changed files: 0, skipping collection of 0 files");
}

void TestModeMessageAndNoSelect() {
  RunMode mode = Selecting();
  mode.select  = false;
  mode.mode    = retest::model::SelectionMode::kNoSelect;
  mode.message = "selection deactivated through no_select";

  assert(BuildSummary(StabilityReport{}, mode, "ci") == "retest: selection deactivated through no_select, environment: ci");

  RunMode off;
  off.message = "deactivated";
  assert(BuildSummary(StabilityReport{}, off, "") == "retest: deactivated");
}

void TestNoticeShownOncePerInterval() {
  auto                       repo = std::make_shared<retest::db::memory::MemoryRepository>();
  retest::core::Reconciler   reconciler(repo, "");
  retest::report::NoticeSchedule notice("please send feedback", 28);

  const auto day0 = retest::util::FromIsoDate("2024-03-01").value();

  assert(notice.Due(reconciler, day0) == std::string("please send feedback"));
  assert(reconciler.ReadAttribute(retest::report::NoticeSchedule::kAttribute) == std::string("2024-03-01"));

  assert(!notice.Due(reconciler, day0 + std::chrono::days(1)).has_value());
  assert(!notice.Due(reconciler, day0 + std::chrono::days(27)).has_value());
  assert(notice.Due(reconciler, day0 + std::chrono::days(28)).has_value());
  assert(reconciler.ReadAttribute(retest::report::NoticeSchedule::kAttribute) == std::string("2024-03-29"));
}

void TestEmptyNoticeIsDisabled() {
  auto                           repo = std::make_shared<retest::db::memory::MemoryRepository>();
  retest::core::Reconciler       reconciler(repo, "");
  retest::report::NoticeSchedule notice("", 28);

  assert(!notice.Due(reconciler, retest::util::Now()).has_value());
  assert(!reconciler.ReadAttribute(retest::report::NoticeSchedule::kAttribute).has_value());
}

} // namespace

int main() {
  TestNewDatabase();
  TestKnownNodesWithoutFilesIsNotNew();
  TestChangedFilesListed();
  TestLongChangedListCollapsesToCount();
  TestNoChangesShowsZero();
  TestLibrariesUpgrade();
  TestModeMessageAndNoSelect();
  TestNoticeShownOncePerInterval();
  TestEmptyNoticeIsDisabled();

  std::cout << "retest_unit_summary: pass\n";
  return 0;
}
