#include "internal/core/recorder.hpp"

#include <cmath>

#include "internal/core/db_errors.hpp"
#include "internal/model/fingerprint.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace retest::core {

using observability::StringField;

Recorder::Recorder(std::shared_ptr<db::Repository> repository, std::string environment, std::filesystem::path root,
                   std::shared_ptr<ChecksumSource> checksums, std::shared_ptr<Tracer> tracer, std::string libraries_signature)
    : repository_(std::move(repository)),
      environment_(std::move(environment)),
      root_(std::move(root)),
      checksums_(std::move(checksums)),
      tracer_(std::move(tracer)) {
  if (!libraries_signature.empty()) {
    libraries_checksum_ = Sha256Hex(libraries_signature);
  }
}

void Recorder::Start(const std::string& node_id) {
  auto& pending = pending_[node_id];
  if (pending.trace) {
    tracer_->Cancel(*pending.trace);
  }
  pending = Pending{};

  try {
    pending.trace = tracer_->BeginTrace(node_id);
  } catch (const util::TracingError& e) {
    RETEST_LOG_WARN("trace start failed; result will not be recorded", {StringField("node", node_id), StringField("error", e.what())});
  }
}

void Recorder::ReportPhase(const std::string& node_id, model::Phase phase, model::Outcome outcome, double duration_ms) {
  auto it = pending_.find(node_id);
  if (it == pending_.end()) {
    RETEST_LOG_DEBUG("phase report for a test that was not started", {StringField("node", node_id)});
    return;
  }
  if (!std::isfinite(duration_ms) || duration_ms < 0.0) {
    RETEST_LOG_DEBUG("invalid phase duration counted as 0", {StringField("node", node_id), StringField("duration", std::to_string(duration_ms))});
    duration_ms = 0.0;
  }
  it->second.phases[phase] = PhaseReport{outcome, duration_ms};
}

model::Outcome Recorder::Aggregate(const std::map<model::Phase, PhaseReport>& phases) {
  for (const auto& [_, report] : phases) {
    if (report.outcome == model::Outcome::kFailed) return model::Outcome::kFailed;
  }
  const auto call = phases.find(model::Phase::kCall);
  if (call != phases.end() && call->second.outcome == model::Outcome::kPassed) return model::Outcome::kPassed;
  return model::Outcome::kOther;
}

std::optional<std::string> Recorder::Relativize(const std::string& path) const {
  std::filesystem::path p(path);
  if (p.is_relative()) {
    p = p.lexically_normal();
  } else {
    p = p.lexically_normal().lexically_relative(root_);
  }

  if (p.empty() || *p.begin() == "..") {
    return std::nullopt;
  }
  return p.generic_string();
}

bool Recorder::Finish(const std::string& node_id) {
  auto it = pending_.find(node_id);
  if (it == pending_.end()) {
    RETEST_LOG_WARN("finish for a test that was not started", {StringField("node", node_id)});
    return false;
  }
  Pending pending = std::move(it->second);
  pending_.erase(it);

  if (!pending.trace) {
    return false;
  }

  db::model::NodeRecord record;
  record.environment = environment_;
  record.node_id     = node_id;
  record.outcome     = Aggregate(pending.phases);
  for (const auto& [_, report] : pending.phases) {
    record.duration_ms += report.duration_ms;
  }

  try {
    const auto trace = tracer_->EndTrace(*pending.trace);

    for (const auto& [path, lines] : trace.lines) {
      // code outside the project is covered by the libraries signature
      const auto relative = Relativize(path);
      if (!relative) continue;

      const auto checksum = checksums_->Checksum(*relative);
      if (!checksum) {
        throw util::TracingError("cannot checksum traced file " + *relative);
      }
      record.fingerprint.push_back({*relative, *checksum});
    }
  } catch (const util::TracingError& e) {
    RETEST_LOG_WARN("fingerprint collection failed; not recorded", {StringField("node", node_id), StringField("error", e.what())});
    return false;
  }

  if (!libraries_checksum_.empty()) {
    record.fingerprint.push_back({std::string(model::kLibrariesPath), libraries_checksum_});
  }
  record.fingerprint = model::Normalize(std::move(record.fingerprint));

  try {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->UpsertNode(*tx, record), "upsert node " + node_id);
    for (const auto& entry : record.fingerprint) {
      ThrowIfDbError(repository_->UpsertFile(*tx, {environment_, entry.path, entry.checksum}), "upsert file " + entry.path);
    }
    tx->Commit();
  } catch (const util::StorageError& e) {
    RETEST_LOG_WARN("commit failed; not recorded", {StringField("node", node_id), StringField("error", e.what())});
    return false;
  }

  RETEST_LOG_DEBUG("recorded", {StringField("node", node_id), StringField("outcome", model::ToString(record.outcome)),
                                observability::IntField("files", static_cast<int64_t>(record.fingerprint.size()))});
  return true;
}

void Recorder::Abort(const std::string& node_id) {
  auto it = pending_.find(node_id);
  if (it == pending_.end()) return;

  if (it->second.trace) {
    tracer_->Cancel(*it->second.trace);
  }
  pending_.erase(it);
}

} // namespace retest::core
