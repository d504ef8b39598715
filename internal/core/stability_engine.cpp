#include "internal/core/stability_engine.hpp"

#include <unordered_map>

#include "internal/model/fingerprint.hpp"
#include "internal/model/node_id.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace retest::core {

using retest::model::kLibrariesPath;

StabilityEngine::StabilityEngine(std::shared_ptr<db::Repository> repository, std::string environment,
                                 std::shared_ptr<ChecksumSource> checksums, std::string libraries_signature)
    : repository_(std::move(repository)), environment_(std::move(environment)), checksums_(std::move(checksums)) {
  if (!libraries_signature.empty()) {
    libraries_checksum_ = Sha256Hex(libraries_signature);
  }
}

StabilityReport StabilityEngine::DetermineStable() const {
  std::vector<db::model::FileRecord> files;
  std::vector<db::model::NodeRecord> nodes;
  {
    auto tx = repository_->BeginRead();
    files   = repository_->ListFiles(*tx, environment_);
    nodes   = repository_->ListNodes(*tx, environment_);
    tx->Commit();
  }

  StabilityReport report;

  // path -> recorded checksum, only for files whose content is unchanged
  std::unordered_map<std::string, std::string> stable_checksums;
  std::unordered_map<std::string, std::string> recorded;

  for (const auto& file : files) {
    if (file.checksum.empty()) {
      throw util::CorruptState("empty recorded checksum for " + file.path);
    }
    recorded.emplace(file.path, file.checksum);

    if (file.path == kLibrariesPath) {
      const bool libraries_stable = libraries_checksum_ && *libraries_checksum_ == file.checksum;
      report.libraries_miss       = !libraries_stable;
      if (libraries_stable) stable_checksums.emplace(file.path, file.checksum);
      continue;
    }

    const auto current = checksums_->Checksum(file.path);
    if (current && *current == file.checksum) {
      report.stable_files.insert(file.path);
      stable_checksums.emplace(file.path, file.checksum);
    } else {
      report.unstable_files.insert(file.path);
    }
  }

  // home file -> (all nodes stable and none failed)
  std::map<std::string, bool> home_files;

  for (auto& node : nodes) {
    bool stable = true;
    for (const auto& entry : node.fingerprint) {
      const auto it = stable_checksums.find(entry.path);
      if (it == stable_checksums.end() || it->second != entry.checksum) {
        if (!recorded.contains(entry.path)) {
          RETEST_LOG_DEBUG("fingerprint references unrecorded file",
                           {observability::StringField("node", node.node_id), observability::StringField("path", entry.path)});
        }
        stable = false;
        break;
      }
    }

    const auto home = retest::model::HomeFile(node.node_id);
    auto       home_it = home_files.try_emplace(home, true).first;
    home_it->second    = home_it->second && stable && !node.Failed();

    if (stable) {
      report.stable_nodes.insert(node.node_id);
    } else {
      report.unstable_nodes.insert(node.node_id);
    }
    report.all_nodes.emplace(node.node_id, std::move(node));
  }

  for (const auto& [home, skippable] : home_files) {
    if (skippable && report.stable_files.contains(home)) {
      report.collection_skippable_files.insert(home);
    }
  }

  return report;
}

} // namespace retest::core
