#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/checksum_source.hpp"
#include "internal/core/trace_file.hpp"
#include "internal/model/node_id.hpp"
#include "internal/session/run_session.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using retest::core::ExitStatus;
using retest::model::Outcome;
using retest::model::Phase;
using retest::session::RunSession;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

void WriteFile(const fs::path& path, const std::string& content) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

// A throwaway project tree with a sqlite database at its root.
struct Workspace {
  fs::path root = fs::temp_directory_path() / ("retest_incremental_" + std::to_string(NowMs()));

  // test id -> project files it executes
  std::map<std::string, std::vector<std::string>> tests;

  retest::runtime::config::RuntimeConfig config = retest::config::ConfigLoader::Defaults();

  Workspace() {
    fs::create_directories(root);
    config.set_root_dir(root.string());

    WriteFile(root / "src/calc.py", "def add(a, b):\n    return a + b\n");
    WriteFile(root / "src/text.py", "def upper(s):\n    return s.upper()\n");
    WriteFile(root / "tests/test_calc.py", "def test_add():\n    assert add(1, 2) == 3\n");
    WriteFile(root / "tests/test_text.py", "def test_upper():\n    assert upper('a') == 'A'\n");

    tests["tests/test_calc.py::test_add"]   = {"tests/test_calc.py", "src/calc.py"};
    tests["tests/test_text.py::test_upper"] = {"tests/test_text.py", "src/text.py"};
  }

  ~Workspace() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  std::vector<std::string> Run(ExitStatus* status = nullptr, std::string* header = nullptr) {
    auto       tracer = std::make_shared<retest::core::ReplayTracer>();
    RunSession session(config, retest::config::HostContext{}, tracer);
    session.Configure();
    if (header) *header = session.Header();

    std::vector<std::string> collected;
    for (const auto& [id, _] : tests) {
      if (session.ShouldIgnoreCollection(retest::model::HomeFile(id))) continue;
      collected.push_back(id);
    }

    const auto selection = session.ModifyItems(collected, 0);
    for (const auto& id : selection.selected) {
      // tracers report absolute paths, plus interpreter files outside the project
      retest::core::TraceResult trace;
      for (const auto& path : tests[id]) trace.lines[(root / path).string()] = {1, 2};
      trace.lines["/usr/lib/python3.11/os.py"] = {10};
      tracer->Provide(id, trace);

      session.TestStarted(id);
      session.PhaseFinished(id, Phase::kCall, Outcome::kPassed, 4.0);
      session.PhaseFinished(id, Phase::kTeardown, Outcome::kPassed, 0.0);
    }

    const auto final_status = session.Finish(selection.selected.empty() ? ExitStatus::kNoTestsCollected : ExitStatus::kOk);
    if (status) *status = final_status;
    return selection.selected;
  }
};

void TestRunsAgainstRealFiles() {
  Workspace w;

  std::string header;
  auto        first = w.Run(nullptr, &header);
  assert(first.size() == 2);
  assert(header == "retest: new DB");
  assert(fs::exists(w.root / ".retestdata"));

  ExitStatus status = ExitStatus::kInternalError;
  auto       second = w.Run(&status);
  assert(second.empty());
  assert(status == ExitStatus::kOk);

  WriteFile(w.root / "src/text.py", "def upper(s):\n    return s.upper()  # changed\n");
  auto third = w.Run(nullptr, &header);
  assert(third == std::vector<std::string>{"tests/test_text.py::test_upper"});
  assert(header.find("changed files: src/text.py") != std::string::npos);

  assert(w.Run().empty());
}

void TestDeletedSourceSelectsDependents() {
  Workspace w;
  w.Run();

  fs::remove(w.root / "src/calc.py");
  w.tests["tests/test_calc.py::test_add"] = {"tests/test_calc.py"};

  auto selected = w.Run();
  assert(selected == std::vector<std::string>{"tests/test_calc.py::test_add"});
  assert(w.Run().empty());
}

void TestEnvironmentsKeepSeparateHistory() {
  Workspace w;
  w.config.set_environment_expression("${RETEST_IT_PY:-default}");

  setenv("RETEST_IT_PY", "py311", 1);
  assert(w.Run().size() == 2);
  assert(w.Run().empty());

  setenv("RETEST_IT_PY", "py312", 1);
  std::string header;
  assert(w.Run(nullptr, &header).size() == 2);
  assert(header.find("environment: py312") != std::string::npos);

  setenv("RETEST_IT_PY", "py311", 1);
  assert(w.Run().empty());
  unsetenv("RETEST_IT_PY");
}

void TestLibraryUpgradeSelectsEverything() {
  Workspace w;
  w.config.add_libraries("requests 2.31");
  w.Run();
  assert(w.Run().empty());

  w.config.clear_libraries();
  w.config.add_libraries("requests 2.32");

  std::string header;
  assert(w.Run(nullptr, &header).size() == 2);
  assert(header.find("libraries upgrade") != std::string::npos);
}

void TestCorruptDatabaseIsConfigurationError() {
  Workspace w;
  WriteFile(w.root / ".retestdata", std::string(4096, 'x'));

  auto       tracer = std::make_shared<retest::core::ReplayTracer>();
  RunSession session(w.config, retest::config::HostContext{}, tracer);

  bool threw = false;
  try {
    session.Configure();
  } catch (const retest::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

void TestFileChecksumSource() {
  Workspace w;
  retest::core::FileChecksumSource checksums(w.root);

  const auto sum = checksums.Checksum("src/calc.py");
  assert(sum.has_value());
  assert(sum->size() == 64);
  assert(*sum == retest::core::Sha256Hex("def add(a, b):\n    return a + b\n"));
  assert(!checksums.Checksum("src/missing.py").has_value());
  assert(retest::core::Sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

} // namespace

int main() {
  TestRunsAgainstRealFiles();
  TestDeletedSourceSelectsDependents();
  TestEnvironmentsKeepSeparateHistory();
  TestLibraryUpgradeSelectsEverything();
  TestCorruptDatabaseIsConfigurationError();
  TestFileChecksumSource();

  std::cout << "retest_integration_incremental_runs: pass\n";
  return 0;
}
