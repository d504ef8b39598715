#pragma once

#include <string>
#include <vector>

namespace retest::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL() and version bookkeeping.
*/

struct Migration {
  int                      version = 0;
  std::vector<std::string> statements;
};

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // highest applied version, 0 for an empty database
  virtual int AppliedVersion() = 0;

  virtual void MarkApplied(int version) = 0;
};

/*
  Runs migrations in order, skipping those already applied.
  Throws util::ConfigurationError when the database is newer
  than the newest migration known to this build.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered);

// Schema of the sqlite backend, oldest first.
const std::vector<Migration>& SchemaMigrations();

} // namespace retest::db::sql
