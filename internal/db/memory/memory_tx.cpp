#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace retest::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, TxMode mode) : repo_(repo), mode_(mode) {
  std::scoped_lock lock(repo_.mutex_);
  snapshot_     = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

void MemoryTransaction::Commit() {
  if (discarded_) {
    throw util::StorageError("commit after rollback");
  }
  if (!wrote_) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != base_version_) {
    throw util::StorageError("concurrent commit: database changed since this transaction began");
  }
  repo_.committed_ = std::move(snapshot_);
  ++repo_.committed_version_;
  committed_ = true;
}

} // namespace retest::db::memory
