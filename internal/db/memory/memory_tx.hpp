#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace retest::db::memory {

/*
  Private copy of the committed state taken at Begin.

  Commit publishes the copy if nothing else committed in between and
  throws util::StorageError otherwise. Read transactions and
  transactions that never wrote commit without a version check.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, TxMode mode);

  void Commit() override;

  void Rollback() override {
    discarded_ = true;
  }

  bool IsCommitted() const override {
    return committed_;
  }

  TxMode Mode() const override {
    return mode_;
  }

  MemoryRepository::State& Mutable() {
    wrote_ = true;
    return snapshot_;
  }

  const MemoryRepository::State& View() const {
    return snapshot_;
  }

 private:
  MemoryRepository&       repo_;
  TxMode                  mode_;
  MemoryRepository::State snapshot_;
  uint64_t                base_version_ = 0;
  bool                    committed_    = false;
  bool                    discarded_    = false;
  bool                    wrote_        = false;
};

} // namespace retest::db::memory
