#include "internal/core/reconciler.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace retest::core {

using observability::IntField;
using observability::StringField;

Reconciler::Reconciler(std::shared_ptr<db::Repository> repository, std::string environment)
    : repository_(std::move(repository)), environment_(std::move(environment)) {
}

uint64_t Reconciler::Sync(const std::set<std::string>& retained, uint64_t session_failures) {
  if (session_failures > 0) {
    // collection errors leave the collected set partial
    RETEST_LOG_INFO("node pruning skipped", {IntField("session_failures", static_cast<int64_t>(session_failures))});
    return 0;
  }

  uint64_t removed = 0;
  try {
    auto tx = repository_->Begin();
    if (retained.empty() && !repository_->ListNodes(*tx, environment_).empty()) {
      RETEST_LOG_INFO("node pruning skipped: nothing collected");
      return 0;
    }
    ThrowIfDbError(repository_->DeleteNodesExcept(*tx, environment_, retained, &removed), "prune nodes");
    tx->Commit();
  } catch (const util::StorageError& e) {
    RETEST_LOG_WARN("node pruning failed", {StringField("error", e.what())});
    return 0;
  }

  if (removed > 0) {
    RETEST_LOG_DEBUG("pruned nodes", {IntField("removed", static_cast<int64_t>(removed))});
  }
  return removed;
}

uint64_t Reconciler::RemoveUnusedFingerprints(bool is_worker) {
  if (is_worker) {
    return 0;
  }

  uint64_t removed = 0;
  try {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->DeleteUnreferencedFiles(*tx, environment_, &removed), "remove unused files");
    tx->Commit();
  } catch (const util::StorageError& e) {
    RETEST_LOG_WARN("checksum store cleanup failed", {StringField("error", e.what())});
    return 0;
  }

  if (removed > 0) {
    RETEST_LOG_DEBUG("removed unused checksums", {IntField("removed", static_cast<int64_t>(removed))});
  }
  return removed;
}

bool Reconciler::WriteAttribute(const std::string& key, const std::string& value) {
  try {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->SetAttribute(*tx, {environment_, key, value}), "set attribute " + key);
    tx->Commit();
  } catch (const util::StorageError& e) {
    RETEST_LOG_WARN("attribute write failed", {StringField("key", key), StringField("error", e.what())});
    return false;
  }
  return true;
}

std::optional<std::string> Reconciler::ReadAttribute(const std::string& key) {
  auto tx    = repository_->BeginRead();
  auto value = repository_->GetAttribute(*tx, environment_, key);
  tx->Commit();
  return value;
}

} // namespace retest::core
