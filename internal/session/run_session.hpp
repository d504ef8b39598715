#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "config/config.pb.h"

#include "internal/config/run_mode.hpp"
#include "internal/core/exit_status.hpp"
#include "internal/core/reconciler.hpp"
#include "internal/core/recorder.hpp"
#include "internal/core/selector.hpp"
#include "internal/core/stability_engine.hpp"
#include "internal/core/tracer.hpp"
#include "internal/factory.hpp"
#include "internal/model/outcome.hpp"

namespace retest::session {

/*
  One process's run, driven by the host runner's lifecycle callbacks:

    Configure -> Header -> ShouldIgnoreCollection* -> ModifyItems
      -> (TestStarted, PhaseFinished*)* -> Finish

  Stability is computed once in Configure; nothing observes files
  changing mid-run. When the resolved mode is inactive every callback
  is a pass-through.
*/
class RunSession {
 public:
  RunSession(retest::runtime::config::RuntimeConfig runtime_config, config::HostContext host, std::shared_ptr<core::Tracer> tracer);

  // Pre-built collaborators instead of the factory.
  RunSession(retest::runtime::config::RuntimeConfig runtime_config, config::HostContext host, std::shared_ptr<core::Tracer> tracer,
             factory::RuntimeDependencies deps);

  RunSession(const RunSession&)            = delete;
  RunSession& operator=(const RunSession&) = delete;

  // Throws util::ConfigurationError; the run must not start.
  void Configure();

  std::string Header();

  // path is relative to the project root.
  bool ShouldIgnoreCollection(const std::string& path);

  core::SelectionResult ModifyItems(const std::vector<std::string>& collected, uint64_t session_failures);

  void TestStarted(const std::string& node_id);

  // The teardown report commits the test.
  void PhaseFinished(const std::string& node_id, model::Phase phase, model::Outcome outcome, double duration_ms);

  void TestAborted(const std::string& node_id);

  core::ExitStatus Finish(core::ExitStatus status);

  const config::RunMode& Mode() const {
    return run_mode_;
  }

  const core::StabilityReport& Report() const {
    return report_;
  }

  const std::string& Environment() const;

  // nullopt until ModifyItems ran
  std::optional<uint64_t> DeselectedCount() const {
    return deselected_count_;
  }

  // Number of tests committed by the Recorder so far.
  uint64_t RecordedCount() const {
    return recorded_;
  }

 private:
  bool Configured() const {
    return deps_.has_value() && reconciler_ != nullptr;
  }

  retest::runtime::config::RuntimeConfig config_;
  config::HostContext                    host_;
  std::shared_ptr<core::Tracer>          tracer_;

  std::optional<factory::RuntimeDependencies> deps_;
  config::RunMode                             run_mode_;
  core::StabilityReport                       report_;

  std::unique_ptr<core::Selector>   selector_;
  std::unique_ptr<core::Reconciler> reconciler_;
  std::unique_ptr<core::Recorder>   recorder_;

  // home files the host was told not to collect
  std::set<std::string>   skipped_files_;
  std::optional<uint64_t> deselected_count_;
  uint64_t                recorded_ = 0;
};

} // namespace retest::session
