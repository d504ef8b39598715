#include "internal/core/stability_engine.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/checksum_source.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/model/fingerprint.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fakes.hpp"

namespace {

using retest::core::StabilityEngine;
using retest::db::memory::MemoryRepository;
using retest::db::model::NodeRecord;
using retest::model::Outcome;
using retest::testing::FakeChecksumSource;

void Seed(MemoryRepository& repo, const NodeRecord& node) {
  auto tx = repo.Begin();
  assert(repo.UpsertNode(*tx, node));
  for (const auto& entry : node.fingerprint) {
    assert(repo.UpsertFile(*tx, {node.environment, entry.path, entry.checksum}));
  }
  tx->Commit();
}

NodeRecord Node(const std::string& id, retest::model::Fingerprint fp, Outcome outcome = Outcome::kPassed) {
  NodeRecord node;
  node.node_id     = id;
  node.outcome     = outcome;
  node.duration_ms = 1.0;
  node.fingerprint = std::move(fp);
  return node;
}

struct Fixture {
  std::shared_ptr<MemoryRepository>   repo      = std::make_shared<MemoryRepository>();
  std::shared_ptr<FakeChecksumSource> checksums = std::make_shared<FakeChecksumSource>();

  Fixture() {
    checksums->Set("test_a.py", "ta1");
    checksums->Set("a.py", "a1");
    checksums->Set("test_b.py", "tb1");
    checksums->Set("b.py", "b1");

    Seed(*repo, Node("test_a.py::test_one", {{"test_a.py", "ta1"}, {"a.py", "a1"}}));
    Seed(*repo, Node("test_b.py::test_two", {{"test_b.py", "tb1"}, {"b.py", "b1"}}));
  }

  StabilityEngine Engine(const std::string& environment = "", const std::string& libraries = "") {
    return StabilityEngine(repo, environment, checksums, libraries);
  }
};

void TestNoChangesEverythingStable() {
  Fixture f;
  const auto report = f.Engine().DetermineStable();

  assert(report.unstable_files.empty());
  assert(report.stable_files.size() == 4);
  assert(report.IsStable("test_a.py::test_one"));
  assert(report.IsStable("test_b.py::test_two"));
  assert(report.collection_skippable_files.contains("test_a.py"));
  assert(report.collection_skippable_files.contains("test_b.py"));
  assert(!report.IsNewDatabase());
}

void TestChangedSourceMakesDependentsUnstable() {
  Fixture f;
  f.checksums->Set("a.py", "a2");

  const auto report = f.Engine().DetermineStable();
  assert(report.unstable_files == std::set<std::string>{"a.py"});
  assert(!report.IsStable("test_a.py::test_one"));
  assert(report.IsStable("test_b.py::test_two"));
  assert(!report.collection_skippable_files.contains("test_a.py"));
  assert(report.collection_skippable_files.contains("test_b.py"));
}

void TestDeletedFileIsUnstable() {
  Fixture f;
  f.checksums->Remove("b.py");

  const auto report = f.Engine().DetermineStable();
  assert(report.unstable_files.contains("b.py"));
  assert(!report.IsStable("test_b.py::test_two"));
}

void TestEntryForUnrecordedFileIsUnstable() {
  Fixture f;
  {
    // fingerprint row without a checksum store entry
    auto tx = f.repo->Begin();
    assert(f.repo->UpsertNode(*tx, Node("test_c.py::test_three", {{"c.py", "c1"}})));
    tx->Commit();
  }
  f.checksums->Set("c.py", "c1");

  const auto report = f.Engine().DetermineStable();
  assert(!report.IsStable("test_c.py::test_three"));
  assert(report.unstable_nodes.contains("test_c.py::test_three"));
}

void TestStaleChecksumInFingerprintIsUnstable() {
  Fixture f;
  {
    // node recorded against an older version of a.py
    auto tx = f.repo->Begin();
    assert(f.repo->UpsertNode(*tx, Node("test_a.py::test_old", {{"a.py", "a0"}})));
    tx->Commit();
  }

  const auto report = f.Engine().DetermineStable();
  assert(report.IsStable("test_a.py::test_one"));
  assert(!report.IsStable("test_a.py::test_old"));
  assert(!report.collection_skippable_files.contains("test_a.py"));
}

void TestEmptyFingerprintIsStable() {
  Fixture f;
  {
    auto tx = f.repo->Begin();
    assert(f.repo->UpsertNode(*tx, Node("test_e.py::test_empty", {})));
    tx->Commit();
  }

  const auto report = f.Engine().DetermineStable();
  assert(report.IsStable("test_e.py::test_empty"));
}

void TestFailedNodeBlocksFileSkip() {
  Fixture f;
  Seed(*f.repo, Node("test_b.py::test_broken", {{"test_b.py", "tb1"}}, Outcome::kFailed));

  const auto report = f.Engine().DetermineStable();
  assert(report.IsStable("test_b.py::test_broken"));
  assert(report.LastFailed("test_b.py::test_broken"));
  assert(!report.collection_skippable_files.contains("test_b.py"));
}

void TestDeterministic() {
  Fixture f;
  f.checksums->Set("b.py", "b9");

  const auto first  = f.Engine().DetermineStable();
  const auto second = f.Engine().DetermineStable();
  assert(first.stable_files == second.stable_files);
  assert(first.unstable_files == second.unstable_files);
  assert(first.stable_nodes == second.stable_nodes);
  assert(first.unstable_nodes == second.unstable_nodes);
  assert(first.collection_skippable_files == second.collection_skippable_files);
}

void TestEmptyDatabase() {
  auto repo      = std::make_shared<MemoryRepository>();
  auto checksums = std::make_shared<FakeChecksumSource>();

  const auto report = StabilityEngine(repo, "", checksums, "").DetermineStable();
  assert(report.IsNewDatabase());
  assert(report.all_nodes.empty());
}

void TestEnvironmentsAreIsolated() {
  Fixture f;
  const auto other = f.Engine("py312").DetermineStable();
  assert(other.IsNewDatabase());
}

void TestLibrariesChangeInvalidatesEveryone() {
  auto repo      = std::make_shared<MemoryRepository>();
  auto checksums = std::make_shared<FakeChecksumSource>();
  checksums->Set("test_a.py", "ta1");

  const std::string old_libraries = "fmt 9.1";
  Seed(*repo, Node("test_a.py::test_one",
                   {{"test_a.py", "ta1"}, {std::string(retest::model::kLibrariesPath), retest::core::Sha256Hex(old_libraries)}}));

  const auto same = StabilityEngine(repo, "", checksums, old_libraries).DetermineStable();
  assert(!same.libraries_miss);
  assert(same.IsStable("test_a.py::test_one"));
  assert(!same.stable_files.contains(std::string(retest::model::kLibrariesPath)));

  const auto upgraded = StabilityEngine(repo, "", checksums, "fmt 10.0").DetermineStable();
  assert(upgraded.libraries_miss);
  assert(!upgraded.IsStable("test_a.py::test_one"));
}

void TestEmptyRecordedChecksumIsCorrupt() {
  auto repo      = std::make_shared<MemoryRepository>();
  auto checksums = std::make_shared<FakeChecksumSource>();
  {
    auto tx = repo->Begin();
    assert(repo->UpsertFile(*tx, {"", "a.py", ""}));
    tx->Commit();
  }

  bool threw = false;
  try {
    (void)StabilityEngine(repo, "", checksums, "").DetermineStable();
  } catch (const retest::util::CorruptState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestNoChangesEverythingStable();
  TestChangedSourceMakesDependentsUnstable();
  TestDeletedFileIsUnstable();
  TestEntryForUnrecordedFileIsUnstable();
  TestStaleChecksumInFingerprintIsUnstable();
  TestEmptyFingerprintIsStable();
  TestFailedNodeBlocksFileSkip();
  TestDeterministic();
  TestEmptyDatabase();
  TestEnvironmentsAreIsolated();
  TestLibrariesChangeInvalidatesEveryone();
  TestEmptyRecordedChecksumIsCorrupt();

  std::cout << "retest_unit_stability_engine: pass\n";
  return 0;
}
