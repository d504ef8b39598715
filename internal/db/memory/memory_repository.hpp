#pragma once

#include <map>
#include <mutex>
#include <string>

#include "internal/db/api/repository.hpp"

namespace retest::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct EnvironmentState {
    std::map<std::string, model::NodeRecord> nodes;
    std::map<std::string, model::FileRecord> files;
    std::map<std::string, std::string> attributes;
  };

  struct State {
    std::map<std::string, EnvironmentState> environments;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
