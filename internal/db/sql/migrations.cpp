#include "internal/db/sql/migrations.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace retest::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered) {
  const int applied = executor.AppliedVersion();
  const int latest  = ordered.empty() ? 0 : ordered.back().version;

  if (applied > latest) {
    throw util::ConfigurationError("database schema version " + std::to_string(applied) + " is newer than supported version " +
                                   std::to_string(latest));
  }

  for (const auto& migration : ordered) {
    if (migration.version <= applied) continue;

    for (const auto& sql : migration.statements) {
      executor.ExecuteSQL(sql);
    }
    executor.MarkApplied(migration.version);
    RETEST_LOG_DEBUG("applied schema migration", {observability::IntField("version", migration.version)});
  }
}

const std::vector<Migration>& SchemaMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       {
           "CREATE TABLE IF NOT EXISTS files (environment TEXT NOT NULL, path TEXT NOT NULL, checksum TEXT NOT NULL, "
           "PRIMARY KEY (environment, path));",
           "CREATE TABLE IF NOT EXISTS nodes (environment TEXT NOT NULL, node_id TEXT NOT NULL, outcome INTEGER NOT NULL, "
           "duration_ms REAL NOT NULL, PRIMARY KEY (environment, node_id));",
           "CREATE TABLE IF NOT EXISTS node_fingerprint (environment TEXT NOT NULL, node_id TEXT NOT NULL, path TEXT NOT NULL, "
           "checksum TEXT NOT NULL, PRIMARY KEY (environment, node_id, path), "
           "FOREIGN KEY (environment, node_id) REFERENCES nodes(environment, node_id) ON DELETE CASCADE);",
           "CREATE INDEX IF NOT EXISTS node_fingerprint_path ON node_fingerprint(environment, path);",
           "CREATE TABLE IF NOT EXISTS attributes (environment TEXT NOT NULL, key TEXT NOT NULL, value TEXT NOT NULL, "
           "PRIMARY KEY (environment, key));",
       }},
  };
  return kMigrations;
}

} // namespace retest::db::sql
