#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace retest::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode) : db_(std::move(db)), mode_(mode) {
  db_->Exec(mode_ == TxMode::kWrite ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!open_) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    RETEST_LOG_WARN("sqlite rollback failed",
                    {observability::StringField("db", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  open_      = false;
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  open_ = false;
  db_->Exec("ROLLBACK;");
}

} // namespace retest::db::sqlite
