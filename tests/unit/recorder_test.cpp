#include "internal/core/recorder.hpp"

#include <cassert>
#include <iostream>
#include <limits>
#include <memory>
#include <string>

#include "internal/core/trace_file.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/model/fingerprint.hpp"
#include "tests/support/fakes.hpp"

namespace {

using retest::core::Recorder;
using retest::core::ReplayTracer;
using retest::core::TraceResult;
using retest::db::Result;
using retest::db::memory::MemoryRepository;
using retest::model::Outcome;
using retest::model::Phase;
using retest::testing::FakeChecksumSource;

// Delegates to a memory repository but refuses one file path.
class FailingFileRepository final : public retest::db::Repository {
 public:
  explicit FailingFileRepository(std::string bad_path) : bad_path_(std::move(bad_path)) {
  }

  std::unique_ptr<retest::db::Transaction> BeginTx(retest::db::TxMode mode) override {
    return inner_.BeginTx(mode);
  }
  Result UpsertNode(retest::db::Transaction& tx, const retest::db::model::NodeRecord& r) override {
    return inner_.UpsertNode(tx, r);
  }
  std::optional<retest::db::model::NodeRecord> GetNode(retest::db::Transaction& tx, const std::string& env, const std::string& id) override {
    return inner_.GetNode(tx, env, id);
  }
  std::vector<retest::db::model::NodeRecord> ListNodes(retest::db::Transaction& tx, const std::string& env) override {
    return inner_.ListNodes(tx, env);
  }
  Result DeleteNodesExcept(retest::db::Transaction& tx, const std::string& env, const std::set<std::string>& retained,
                           uint64_t* removed) override {
    return inner_.DeleteNodesExcept(tx, env, retained, removed);
  }
  Result UpsertFile(retest::db::Transaction& tx, const retest::db::model::FileRecord& r) override {
    if (r.path == bad_path_) return Result::Err(retest::db::ErrorCode::IOError, "disk full");
    return inner_.UpsertFile(tx, r);
  }
  std::vector<retest::db::model::FileRecord> ListFiles(retest::db::Transaction& tx, const std::string& env) override {
    return inner_.ListFiles(tx, env);
  }
  Result DeleteUnreferencedFiles(retest::db::Transaction& tx, const std::string& env, uint64_t* removed) override {
    return inner_.DeleteUnreferencedFiles(tx, env, removed);
  }
  Result SetAttribute(retest::db::Transaction& tx, const retest::db::model::AttributeRecord& r) override {
    return inner_.SetAttribute(tx, r);
  }
  std::optional<std::string> GetAttribute(retest::db::Transaction& tx, const std::string& env, const std::string& key) override {
    return inner_.GetAttribute(tx, env, key);
  }

 private:
  MemoryRepository inner_;
  std::string      bad_path_;
};

TraceResult Touching(std::initializer_list<std::string> paths) {
  TraceResult trace;
  for (const auto& path : paths) trace.lines[path] = {1};
  return trace;
}

struct Fixture {
  std::shared_ptr<retest::db::Repository> repo      = std::make_shared<MemoryRepository>();
  std::shared_ptr<FakeChecksumSource>     checksums = std::make_shared<FakeChecksumSource>();
  std::shared_ptr<ReplayTracer>           tracer    = std::make_shared<ReplayTracer>();

  Fixture() {
    checksums->Set("test_a.py", "ta1");
    checksums->Set("a.py", "a1");
    checksums->Set("b.py", "b1");
  }

  Recorder MakeRecorder(const std::string& libraries = "") {
    return Recorder(repo, "", "/project", checksums, tracer, libraries);
  }

  std::optional<retest::db::model::NodeRecord> Stored(const std::string& id) {
    auto tx   = repo->Begin();
    auto node = repo->GetNode(*tx, "", id);
    tx->Commit();
    return node;
  }

  bool Run(Recorder& recorder, const std::string& id, const TraceResult& trace, Outcome call = Outcome::kPassed) {
    tracer->Provide(id, trace);
    recorder.Start(id);
    recorder.ReportPhase(id, Phase::kSetup, Outcome::kPassed, 1.0);
    recorder.ReportPhase(id, Phase::kCall, call, 5.0);
    recorder.ReportPhase(id, Phase::kTeardown, Outcome::kPassed, 0.5);
    return recorder.Finish(id);
  }
};

void TestRecordsFingerprintOutcomeAndDuration() {
  Fixture f;
  auto    recorder = f.MakeRecorder();

  assert(f.Run(recorder, "test_a.py::test_one", Touching({"test_a.py", "/project/a.py", "/usr/lib/python3/os.py"})));

  const auto node = f.Stored("test_a.py::test_one");
  assert(node.has_value());
  assert(node->outcome == Outcome::kPassed);
  assert(node->duration_ms == 6.5);
  // outside-root paths are not part of the fingerprint
  assert(node->fingerprint.size() == 2);
  assert(node->fingerprint[0].path == "a.py");
  assert(node->fingerprint[0].checksum == "a1");
  assert(node->fingerprint[1].path == "test_a.py");

  auto tx    = f.repo->Begin();
  auto files = f.repo->ListFiles(*tx, "");
  tx->Commit();
  assert(files.size() == 2);
}

void TestNonFiniteDurationCountsAsZero() {
  Fixture f;
  auto    recorder = f.MakeRecorder();

  const std::string id = "test_a.py::test_nan";
  f.tracer->Provide(id, Touching({"a.py"}));
  recorder.Start(id);
  recorder.ReportPhase(id, Phase::kSetup, Outcome::kPassed, 1.0);
  recorder.ReportPhase(id, Phase::kCall, Outcome::kPassed, std::numeric_limits<double>::quiet_NaN());
  recorder.ReportPhase(id, Phase::kTeardown, Outcome::kPassed, 0.5);
  assert(recorder.Finish(id));

  assert(f.Stored(id)->duration_ms == 1.5);
}

void TestOutcomeAggregation() {
  Fixture f;
  auto    recorder = f.MakeRecorder();

  assert(f.Run(recorder, "test_a.py::test_fail", Touching({"a.py"}), Outcome::kFailed));
  assert(f.Stored("test_a.py::test_fail")->outcome == Outcome::kFailed);

  assert(f.Run(recorder, "test_a.py::test_skip", Touching({"a.py"}), Outcome::kOther));
  assert(f.Stored("test_a.py::test_skip")->outcome == Outcome::kOther);

  // teardown failure fails the test
  f.tracer->Provide("test_a.py::test_teardown", Touching({"a.py"}));
  recorder.Start("test_a.py::test_teardown");
  recorder.ReportPhase("test_a.py::test_teardown", Phase::kCall, Outcome::kPassed, 1.0);
  recorder.ReportPhase("test_a.py::test_teardown", Phase::kTeardown, Outcome::kFailed, 1.0);
  assert(recorder.Finish("test_a.py::test_teardown"));
  assert(f.Stored("test_a.py::test_teardown")->outcome == Outcome::kFailed);
}

void TestFingerprintIsReplacedNotMerged() {
  Fixture f;
  auto    recorder = f.MakeRecorder();

  assert(f.Run(recorder, "test_a.py::test_one", Touching({"a.py", "b.py"})));
  assert(f.Run(recorder, "test_a.py::test_one", Touching({"b.py"})));

  const auto node = f.Stored("test_a.py::test_one");
  assert(node->fingerprint.size() == 1);
  assert(node->fingerprint[0].path == "b.py");
}

void TestTracerErrorSkipsCommit() {
  Fixture f;
  auto    recorder = f.MakeRecorder();

  // nothing provided: EndTrace fails
  recorder.Start("test_a.py::test_one");
  recorder.ReportPhase("test_a.py::test_one", Phase::kCall, Outcome::kPassed, 1.0);
  assert(!recorder.Finish("test_a.py::test_one"));
  assert(!f.Stored("test_a.py::test_one").has_value());

  // the next test is unaffected
  assert(f.Run(recorder, "test_a.py::test_two", Touching({"a.py"})));
}

void TestUnreadableFileSkipsCommit() {
  Fixture f;
  auto    recorder = f.MakeRecorder();

  assert(!f.Run(recorder, "test_a.py::test_one", Touching({"a.py", "gone.py"})));
  assert(!f.Stored("test_a.py::test_one").has_value());
}

void TestCommitIsAtomic() {
  Fixture f;
  f.repo        = std::make_shared<FailingFileRepository>("b.py");
  auto recorder = f.MakeRecorder();

  assert(!f.Run(recorder, "test_a.py::test_one", Touching({"a.py", "b.py"})));
  assert(!f.Stored("test_a.py::test_one").has_value());

  auto tx    = f.repo->Begin();
  auto files = f.repo->ListFiles(*tx, "");
  tx->Commit();
  assert(files.empty());
}

void TestAbortWritesNothing() {
  Fixture f;
  auto    recorder = f.MakeRecorder();

  f.tracer->Provide("test_a.py::test_one", Touching({"a.py"}));
  recorder.Start("test_a.py::test_one");
  recorder.ReportPhase("test_a.py::test_one", Phase::kSetup, Outcome::kPassed, 1.0);
  recorder.Abort("test_a.py::test_one");

  assert(!recorder.Finish("test_a.py::test_one"));
  assert(!f.Stored("test_a.py::test_one").has_value());
}

void TestLibrariesEntryIsAdded() {
  Fixture f;
  auto    recorder = f.MakeRecorder("fmt 9.1");

  assert(f.Run(recorder, "test_a.py::test_one", Touching({"a.py"})));
  const auto node = f.Stored("test_a.py::test_one");
  assert(node->fingerprint.size() == 2);
  assert(node->fingerprint[0].path == retest::model::kLibrariesPath);
  assert(node->fingerprint[0].checksum == retest::core::Sha256Hex("fmt 9.1"));
}

void TestRelativize() {
  Fixture f;
  auto    recorder = f.MakeRecorder();

  assert(recorder.Relativize("/project/src/./x.py") == std::string("src/x.py"));
  assert(recorder.Relativize("src/../y.py") == std::string("y.py"));
  assert(!recorder.Relativize("/elsewhere/z.py").has_value());
  assert(!recorder.Relativize("../z.py").has_value());
}

} // namespace

int main() {
  TestRecordsFingerprintOutcomeAndDuration();
  TestNonFiniteDurationCountsAsZero();
  TestOutcomeAggregation();
  TestFingerprintIsReplacedNotMerged();
  TestTracerErrorSkipsCommit();
  TestUnreadableFileSkipsCommit();
  TestCommitIsAtomic();
  TestAbortWritesNothing();
  TestLibrariesEntryIsAdded();
  TestRelativize();

  std::cout << "retest_unit_recorder: pass\n";
  return 0;
}
