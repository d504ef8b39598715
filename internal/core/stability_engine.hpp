#pragma once

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

#include "internal/core/checksum_source.hpp"
#include "internal/db/api/repository.hpp"

namespace retest::core {

/*
  Derived, never persisted view of one run.
*/
struct StabilityReport {
  std::set<std::string> stable_files;
  std::set<std::string> unstable_files;

  std::set<std::string> stable_nodes;
  std::set<std::string> unstable_nodes;

  // Home files whose collection can be skipped (advisory).
  std::set<std::string> collection_skippable_files;

  // The dependency signature changed since it was recorded.
  bool libraries_miss = false;

  std::map<std::string, db::model::NodeRecord> all_nodes;

  bool IsStable(const std::string& node_id) const {
    return stable_nodes.contains(node_id);
  }

  bool LastFailed(const std::string& node_id) const {
    const auto it = all_nodes.find(node_id);
    return it != all_nodes.end() && it->second.Failed();
  }

  bool IsNewDatabase() const {
    return stable_files.empty() && unstable_files.empty() && all_nodes.empty();
  }
};

/*
  Recomputes file and node stability from current file contents.

  A file is stable when its current checksum equals the recorded one.
  A node is stable when every fingerprint entry names a stable file and
  carries that file's recorded checksum; an entry for a file with no
  record makes the node unstable. Empty fingerprints are stable.

  Only reads: the repository (one read transaction) and file contents.
*/
class StabilityEngine {
 public:
  StabilityEngine(std::shared_ptr<db::Repository> repository, std::string environment, std::shared_ptr<ChecksumSource> checksums,
                  std::string libraries_signature);

  // Throws util::CorruptState when recorded checksums cannot be trusted.
  StabilityReport DetermineStable() const;

 private:
  std::shared_ptr<db::Repository> repository_;
  std::string                     environment_;
  std::shared_ptr<ChecksumSource> checksums_;
  std::optional<std::string>      libraries_checksum_;
};

} // namespace retest::core
