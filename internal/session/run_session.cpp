#include "internal/session/run_session.hpp"

#include <unordered_set>

#include "internal/core/scheduler.hpp"
#include "internal/model/node_id.hpp"
#include "internal/observability/logging.hpp"
#include "internal/report/summary.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace retest::session {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kLibrariesAttribute = "libraries";

const std::string kNoEnvironment;

} // namespace

RunSession::RunSession(retest::runtime::config::RuntimeConfig runtime_config, config::HostContext host, std::shared_ptr<core::Tracer> tracer)
    : config_(std::move(runtime_config)), host_(host), tracer_(std::move(tracer)) {
}

RunSession::RunSession(retest::runtime::config::RuntimeConfig runtime_config, config::HostContext host, std::shared_ptr<core::Tracer> tracer,
                       factory::RuntimeDependencies deps)
    : config_(std::move(runtime_config)), host_(host), tracer_(std::move(tracer)), deps_(std::move(deps)) {
}

const std::string& RunSession::Environment() const {
  return deps_ ? deps_->environment : kNoEnvironment;
}

void RunSession::Configure() {
  run_mode_ = config::ResolveRunMode(config_, host_);
  if (!run_mode_.Active()) {
    RETEST_LOG_INFO("engine inactive", {StringField("reason", run_mode_.message)});
    return;
  }

  if (!deps_) {
    deps_ = factory::BuildRuntime(config_);
  }
  auto& deps = *deps_;

  try {
    core::StabilityEngine engine(deps.repository, deps.environment, deps.checksums, deps.libraries_signature);
    report_ = engine.DetermineStable();
  } catch (const util::CorruptState& e) {
    throw util::ConfigurationError(std::string("database is corrupt, delete it to start over: ") + e.what());
  } catch (const util::StorageError& e) {
    throw util::ConfigurationError(std::string("cannot read database: ") + e.what());
  }

  selector_   = std::make_unique<core::Selector>(run_mode_.mode, core::DurationTable::Build(report_.all_nodes));
  reconciler_ = std::make_unique<core::Reconciler>(deps.repository, deps.environment);

  if (run_mode_.collect) {
    if (!tracer_) {
      throw util::ConfigurationError("collection requires a tracer");
    }
    recorder_ = std::make_unique<core::Recorder>(deps.repository, deps.environment, deps.root, deps.checksums, tracer_,
                                                 deps.libraries_signature);
    if (!deps.libraries_signature.empty()) {
      reconciler_->WriteAttribute(kLibrariesAttribute, deps.libraries_signature);
    }
  }

  RETEST_LOG_DEBUG("session configured", {StringField("environment", deps.environment),
                                          StringField("mode", model::ToString(run_mode_.mode)), BoolField("collect", run_mode_.collect),
                                          IntField("stable_nodes", static_cast<int64_t>(report_.stable_nodes.size())),
                                          IntField("unstable_nodes", static_cast<int64_t>(report_.unstable_nodes.size()))});
}

std::string RunSession::Header() {
  auto header = report::BuildSummary(report_, run_mode_, Environment(), deselected_count_);

  if (Configured() && run_mode_.collect) {
    report::NoticeSchedule notice(config_.notice().message(), config_.notice().interval_days());
    if (auto text = notice.Due(*reconciler_, util::Now())) {
      header += "\n" + *text;
    }
  }
  return header;
}

bool RunSession::ShouldIgnoreCollection(const std::string& path) {
  if (!Configured() || !run_mode_.select) {
    return false;
  }
  if (!selector_->ShouldSkipCollection(path, report_)) {
    return false;
  }
  skipped_files_.insert(path);
  return true;
}

core::SelectionResult RunSession::ModifyItems(const std::vector<std::string>& collected, uint64_t session_failures) {
  if (!Configured()) {
    return core::SelectionResult{collected, {}};
  }

  // tests in skipped files exist even though the host never saw them
  std::vector<std::string> uncollected;
  if (!skipped_files_.empty()) {
    const std::unordered_set<std::string> seen(collected.begin(), collected.end());
    for (const auto& [node_id, _] : report_.all_nodes) {
      if (skipped_files_.contains(model::HomeFile(node_id)) && !seen.contains(node_id)) {
        uncollected.push_back(node_id);
      }
    }
  }

  if (run_mode_.collect) {
    if (host_.filters_active) {
      RETEST_LOG_DEBUG("node pruning skipped: collection is filtered");
    } else {
      std::set<std::string> retained(collected.begin(), collected.end());
      retained.insert(uncollected.begin(), uncollected.end());
      reconciler_->Sync(retained, session_failures);
    }
  }

  auto result = selector_->Select(collected, report_);

  uint64_t deselected = result.deselected.size();
  for (const auto& node_id : uncollected) {
    if (core::Selector::CanSkip(node_id, report_)) ++deselected;
  }
  deselected_count_ = deselected;

  RETEST_LOG_INFO("selection done", {IntField("selected", static_cast<int64_t>(result.selected.size())),
                                     IntField("deselected", static_cast<int64_t>(deselected))});
  return result;
}

void RunSession::TestStarted(const std::string& node_id) {
  if (recorder_) recorder_->Start(node_id);
}

void RunSession::PhaseFinished(const std::string& node_id, model::Phase phase, model::Outcome outcome, double duration_ms) {
  if (!recorder_) return;

  recorder_->ReportPhase(node_id, phase, outcome, duration_ms);
  if (phase == model::Phase::kTeardown && recorder_->Finish(node_id)) {
    ++recorded_;
  }
}

void RunSession::TestAborted(const std::string& node_id) {
  if (recorder_) recorder_->Abort(node_id);
}

core::ExitStatus RunSession::Finish(core::ExitStatus status) {
  if (!Configured()) {
    return status;
  }

  if (run_mode_.collect) {
    reconciler_->RemoveUnusedFingerprints(host_.is_worker);
  }
  return core::NormalizeExitStatus(status, deselected_count_.value_or(0));
}

} // namespace retest::session
