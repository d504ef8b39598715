#pragma once

#include <sqlite3.h>

#include <string>

namespace retest::db::sqlite {

inline constexpr int kDefaultBusyTimeoutMs = 5000;

/*
  Owns the connection to one project database file.

  The file is created on first open. Every worker of a run opens its
  own SqliteDB on the same path; commits serialize through the busy
  timeout. Throws util::StorageError when the file cannot be opened
  and util::CorruptState when it is not a database.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = kDefaultBusyTimeoutMs);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  void Exec(const std::string& sql);

  // Caller finalizes the statement.
  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  void ApplyPragmas(int busy_timeout_ms);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace retest::db::sqlite
