#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace retest::db::sqlite {

namespace {

[[noreturn]] void ThrowSqlite(const std::string& path, int rc, const std::string& msg) {
  if ((rc & 0xFF) == SQLITE_CORRUPT || (rc & 0xFF) == SQLITE_NOTADB) {
    throw util::CorruptState(path + ": " + msg);
  }
  throw util::StorageError(path + ": " + msg);
}

} // namespace

SqliteDB::SqliteDB(std::string path, int busy_timeout_ms) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const std::string msg = db_ ? sqlite3_errmsg(db_) : "cannot open database";
    sqlite3_close(db_);
    db_ = nullptr;
    ThrowSqlite(path_, rc, msg);
  }

  try {
    ApplyPragmas(busy_timeout_ms);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }
  const std::string msg = err ? err : sqlite3_errstr(rc);
  sqlite3_free(err);
  ThrowSqlite(path_, rc, msg);
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  const int     rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    ThrowSqlite(path_, rc, sqlite3_errmsg(db_));
  }
  return stmt;
}

void SqliteDB::ApplyPragmas(int busy_timeout_ms) {
  const int rc = sqlite3_busy_timeout(db_, busy_timeout_ms);
  if (rc != SQLITE_OK) {
    ThrowSqlite(path_, rc, sqlite3_errmsg(db_));
  }

  // readers keep going while a worker commits
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");
  // node_fingerprint rows cascade with their node
  Exec("PRAGMA foreign_keys=ON;");
}

} // namespace retest::db::sqlite
