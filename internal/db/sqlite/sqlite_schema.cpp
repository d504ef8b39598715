#include "sqlite_schema.hpp"

#include "internal/db/sql/migrations.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace retest::db::sqlite {

namespace {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  int AppliedVersion() override {
    sqlite3_stmt* st = db_.Prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
    int           version = 0;
    if (sqlite3_step(st) == SQLITE_ROW) {
      version = sqlite3_column_int(st, 0);
    }
    sqlite3_finalize(st);
    return version;
  }

  void MarkApplied(int version) override {
    sqlite3_stmt* st = db_.Prepare("INSERT INTO schema_migrations(version,applied_at_ms) VALUES(?,?);");
    sqlite3_bind_int(st, 1, version);
    sqlite3_bind_int64(st, 2, static_cast<sqlite3_int64>(util::ToUnixMillis(util::Now())));
    const int         rc  = sqlite3_step(st);
    const std::string msg = rc == SQLITE_DONE ? "" : sqlite3_errmsg(db_.Handle());
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) {
      throw util::StorageError("schema_migrations insert failed: " + msg);
    }
  }

 private:
  SqliteDB& db_;
};

} // namespace

void BootstrapSqliteSchema(SqliteDB& db) {
  // several workers may open a fresh file at once; the immediate
  // transaction makes exactly one of them create the schema
  db.Exec("BEGIN IMMEDIATE;");
  try {
    db.Exec("CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);");

    SqliteMigrationExecutor executor(db);
    sql::RunMigrations(executor, sql::SchemaMigrations());
    db.Exec("COMMIT;");
  } catch (const std::exception&) {
    db.Exec("ROLLBACK;");
    throw;
  }

  // fail early on a file that is not a usable database
  db.Exec("SELECT environment,path,checksum FROM files LIMIT 1;");
  db.Exec("SELECT environment,node_id,outcome,duration_ms FROM nodes LIMIT 1;");
  db.Exec("SELECT environment,node_id,path,checksum FROM node_fingerprint LIMIT 1;");
  db.Exec("SELECT environment,key,value FROM attributes LIMIT 1;");
}

} // namespace retest::db::sqlite
