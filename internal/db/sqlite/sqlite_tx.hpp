#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace retest::db::sqlite {

/*
  kWrite opens with BEGIN IMMEDIATE so the writer lock is taken up
  front; a competing worker waits in the busy handler instead of
  failing at COMMIT. kRead opens with BEGIN DEFERRED and only takes
  a shared lock on its first SELECT.

  One connection holds at most one open transaction; beginning a
  second throws util::StorageError.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;

  bool IsCommitted() const override {
    return committed_;
  }

  TxMode Mode() const override {
    return mode_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  TxMode                    mode_;
  bool                      committed_ = false;
  bool                      open_      = true;
};

} // namespace retest::db::sqlite
