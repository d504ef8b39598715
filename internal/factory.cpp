#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/config/run_mode.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace retest::factory {

using observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const retest::runtime::config::RuntimeConfig& config,
                                                const std::filesystem::path&                 root) {
  const auto& database = config.database();
  if (database.has_memory()) {
    return std::make_shared<db::memory::MemoryRepository>();
  }

  std::filesystem::path path = database.has_sqlite() && !database.sqlite().path().empty() ? database.sqlite().path() : ".retestdata";
  if (path.is_relative()) {
    path = root / path;
  }

  try {
    const auto busy_timeout_ms = database.sqlite().busy_timeout_ms();
    auto       sqlite_db       = std::make_shared<db::sqlite::SqliteDB>(
        path.string(), busy_timeout_ms > 0 ? static_cast<int>(busy_timeout_ms) : db::sqlite::kDefaultBusyTimeoutMs);
    db::sqlite::BootstrapSqliteSchema(*sqlite_db);
    RETEST_LOG_DEBUG("database opened", {StringField("path", path.string())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  } catch (const util::StorageError& e) {
    throw util::ConfigurationError("cannot open database " + path.string() + ": " + e.what());
  } catch (const util::CorruptState& e) {
    throw util::ConfigurationError("corrupt database " + path.string() + ": " + e.what());
  }
}

/*
    Build full run dependency graph
*/
RuntimeDependencies BuildRuntime(const retest::runtime::config::RuntimeConfig& config) {
  RuntimeDependencies deps;

  deps.root                = config::ResolveRootDir(config);
  deps.environment         = config::EvaluateEnvironmentExpression(config.environment_expression());
  deps.libraries_signature = config::LibrariesSignature(config);

  deps.repository = BuildRepository(config, deps.root);
  deps.checksums  = std::make_shared<core::FileChecksumSource>(deps.root);

  return deps;
}

} // namespace retest::factory
