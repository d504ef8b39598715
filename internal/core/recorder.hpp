#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "internal/core/checksum_source.hpp"
#include "internal/core/tracer.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/outcome.hpp"

namespace retest::core {

/*
  Collects fingerprint, outcome and duration of each test and commits
  them at the end of the test's lifecycle.

  One transaction per test: node row, fingerprint rows and checksum
  store entries become visible together or not at all. Tracing and
  storage failures drop that single commit; the test simply counts as
  unknown next run.
*/
class Recorder {
 public:
  Recorder(std::shared_ptr<db::Repository> repository, std::string environment, std::filesystem::path root,
           std::shared_ptr<ChecksumSource> checksums, std::shared_ptr<Tracer> tracer, std::string libraries_signature);

  void Start(const std::string& node_id);

  void ReportPhase(const std::string& node_id, model::Phase phase, model::Outcome outcome, double duration_ms);

  // After teardown. Returns true when the record was committed.
  bool Finish(const std::string& node_id);

  // Host gave up on the test before teardown; nothing is written.
  void Abort(const std::string& node_id);

  // Project-relative form of a traced path; nullopt outside the root.
  std::optional<std::string> Relativize(const std::string& path) const;

 private:
  struct PhaseReport {
    model::Outcome outcome     = model::Outcome::kPassed;
    double         duration_ms = 0.0;
  };

  struct Pending {
    std::optional<TraceHandle>         trace;
    std::map<model::Phase, PhaseReport> phases;
  };

  static model::Outcome Aggregate(const std::map<model::Phase, PhaseReport>& phases);

  std::shared_ptr<db::Repository> repository_;
  std::string                     environment_;
  std::filesystem::path           root_;
  std::shared_ptr<ChecksumSource> checksums_;
  std::shared_ptr<Tracer>         tracer_;
  std::string                     libraries_checksum_;

  std::map<std::string, Pending> pending_;
};

} // namespace retest::core
