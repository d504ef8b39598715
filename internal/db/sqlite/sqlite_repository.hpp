#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace retest::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> BeginTx(TxMode mode) override;

  Result UpsertNode(Transaction&, const model::NodeRecord&) override;
  std::optional<model::NodeRecord> GetNode(Transaction&, const std::string& environment, const std::string& node_id) override;
  std::vector<model::NodeRecord> ListNodes(Transaction&, const std::string& environment) override;
  Result DeleteNodesExcept(Transaction&, const std::string& environment, const std::set<std::string>& retained,
                           uint64_t* removed) override;

  Result UpsertFile(Transaction&, const model::FileRecord&) override;
  std::vector<model::FileRecord> ListFiles(Transaction&, const std::string& environment) override;
  Result DeleteUnreferencedFiles(Transaction&, const std::string& environment, uint64_t* removed) override;

  Result SetAttribute(Transaction&, const model::AttributeRecord&) override;
  std::optional<std::string> GetAttribute(Transaction&, const std::string& environment, const std::string& key) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
