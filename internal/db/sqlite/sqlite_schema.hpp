#pragma once

#include "sqlite_db.hpp"

namespace retest::db::sqlite {

// Creates or upgrades the schema of an opened database.
void BootstrapSqliteSchema(SqliteDB& db);

} // namespace retest::db::sqlite
