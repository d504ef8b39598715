#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/attribute_record.hpp"
#include "internal/db/model/file_record.hpp"
#include "internal/db/model/node_record.hpp"

namespace retest::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a write Transaction
  - Reads inside a transaction see its writes
  - A node upsert replaces outcome, duration and fingerprint together
  - Every call is scoped by environment; environments never see each other

  Writes report failures through Result. Bulk reads throw
  util::CorruptState when stored data cannot be decoded and
  util::StorageError for any other backend failure.

  The DB is the source of truth for:
    file checksums
    test nodes + fingerprints
    attributes
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  std::unique_ptr<Transaction> Begin() {
    return BeginTx(TxMode::kWrite);
  }

  std::unique_ptr<Transaction> BeginRead() {
    return BeginTx(TxMode::kRead);
  }

  virtual std::unique_ptr<Transaction> BeginTx(TxMode mode) = 0;

  // ---------------------------------------------------------------------
  // Test nodes
  // ---------------------------------------------------------------------

  virtual Result UpsertNode(Transaction&, const model::NodeRecord&) = 0;

  virtual std::optional<model::NodeRecord> GetNode(Transaction&, const std::string& environment, const std::string& node_id) = 0;

  // Ordered by node_id.
  virtual std::vector<model::NodeRecord> ListNodes(Transaction&, const std::string& environment) = 0;

  // Deletes every node of the environment whose id is not in retained.
  virtual Result DeleteNodesExcept(Transaction&, const std::string& environment, const std::set<std::string>& retained,
                                   uint64_t* removed) = 0;

  // ---------------------------------------------------------------------
  // Checksum store
  // ---------------------------------------------------------------------

  virtual Result UpsertFile(Transaction&, const model::FileRecord&) = 0;

  // Ordered by path.
  virtual std::vector<model::FileRecord> ListFiles(Transaction&, const std::string& environment) = 0;

  // Removes checksum entries no fingerprint of the environment references.
  virtual Result DeleteUnreferencedFiles(Transaction&, const std::string& environment, uint64_t* removed) = 0;

  // ---------------------------------------------------------------------
  // Attributes
  // ---------------------------------------------------------------------

  virtual Result SetAttribute(Transaction&, const model::AttributeRecord&) = 0;

  virtual std::optional<std::string> GetAttribute(Transaction&, const std::string& environment, const std::string& key) = 0;
};

} // namespace retest::db
