#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>

#include "internal/db/api/repository.hpp"

namespace retest::core {

/*
  Keeps the database aligned with the test suite: prunes nodes that no
  longer exist and checksum entries nothing references.

  Storage failures are logged and absorbed; corruption propagates.
*/
class Reconciler {
 public:
  Reconciler(std::shared_ptr<db::Repository> repository, std::string environment);

  // Deletes persisted nodes not in retained. Skipped (returns 0) when the
  // run already has failures or collected nothing while nodes exist.
  uint64_t Sync(const std::set<std::string>& retained, uint64_t session_failures);

  // Coordinator only.
  uint64_t RemoveUnusedFingerprints(bool is_worker);

  bool WriteAttribute(const std::string& key, const std::string& value);

  std::optional<std::string> ReadAttribute(const std::string& key);

 private:
  std::shared_ptr<db::Repository> repository_;
  std::string                     environment_;
};

} // namespace retest::core
