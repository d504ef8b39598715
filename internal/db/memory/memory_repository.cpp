#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace retest::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::BeginTx(TxMode mode) {
  return std::make_unique<MemoryTransaction>(*this, mode);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

static Result ReadOnlyError(const char* operation) {
  return Result::Err(ErrorCode::ReadOnly, operation);
}

// ------------------------------------------------------------------
// Test nodes
// ------------------------------------------------------------------

Result MemoryRepository::UpsertNode(Transaction& t, const model::NodeRecord& r) {
  if (t.ReadOnly()) return ReadOnlyError("upsert node");
  if (r.node_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "empty node id");

  auto& env = TX(t).Mutable().environments[r.environment];
  auto  stored = r;
  stored.fingerprint = retest::model::Normalize(r.fingerprint);
  env.nodes[r.node_id] = std::move(stored);
  return Result::Ok();
}

std::optional<model::NodeRecord> MemoryRepository::GetNode(Transaction& t, const std::string& environment, const std::string& node_id) {
  const auto& s   = TX(t).View();
  const auto  eit = s.environments.find(environment);
  if (eit == s.environments.end()) return std::nullopt;

  const auto it = eit->second.nodes.find(node_id);
  if (it == eit->second.nodes.end()) return std::nullopt;
  return it->second;
}

std::vector<model::NodeRecord> MemoryRepository::ListNodes(Transaction& t, const std::string& environment) {
  std::vector<model::NodeRecord> out;
  const auto&                    s   = TX(t).View();
  const auto                     eit = s.environments.find(environment);
  if (eit == s.environments.end()) return out;

  out.reserve(eit->second.nodes.size());
  for (const auto& [_, record] : eit->second.nodes) {
    out.push_back(record);
  }
  return out;
}

Result MemoryRepository::DeleteNodesExcept(Transaction& t, const std::string& environment, const std::set<std::string>& retained,
                                           uint64_t* removed) {
  if (t.ReadOnly()) return ReadOnlyError("delete nodes");
  uint64_t count = 0;
  auto&    s     = TX(t).Mutable();
  auto     eit   = s.environments.find(environment);
  if (eit != s.environments.end()) {
    auto& nodes = eit->second.nodes;
    for (auto it = nodes.begin(); it != nodes.end();) {
      if (!retained.contains(it->first)) {
        it = nodes.erase(it);
        ++count;
      } else {
        ++it;
      }
    }
  }
  if (removed) *removed = count;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Checksum store
// ------------------------------------------------------------------

Result MemoryRepository::UpsertFile(Transaction& t, const model::FileRecord& r) {
  if (t.ReadOnly()) return ReadOnlyError("upsert file");
  if (r.path.empty()) return Result::Err(ErrorCode::ConstraintViolation, "empty file path");
  TX(t).Mutable().environments[r.environment].files[r.path] = r;
  return Result::Ok();
}

std::vector<model::FileRecord> MemoryRepository::ListFiles(Transaction& t, const std::string& environment) {
  std::vector<model::FileRecord> out;
  const auto&                    s   = TX(t).View();
  const auto                     eit = s.environments.find(environment);
  if (eit == s.environments.end()) return out;

  for (const auto& [_, record] : eit->second.files) {
    out.push_back(record);
  }
  return out;
}

Result MemoryRepository::DeleteUnreferencedFiles(Transaction& t, const std::string& environment, uint64_t* removed) {
  if (t.ReadOnly()) return ReadOnlyError("delete files");
  uint64_t count = 0;
  auto&    s     = TX(t).Mutable();
  auto     eit   = s.environments.find(environment);
  if (eit != s.environments.end()) {
    std::set<std::string> referenced;
    for (const auto& [_, node] : eit->second.nodes) {
      for (const auto& entry : node.fingerprint) referenced.insert(entry.path);
    }

    auto& files = eit->second.files;
    for (auto it = files.begin(); it != files.end();) {
      if (!referenced.contains(it->first)) {
        it = files.erase(it);
        ++count;
      } else {
        ++it;
      }
    }
  }
  if (removed) *removed = count;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Attributes
// ------------------------------------------------------------------

Result MemoryRepository::SetAttribute(Transaction& t, const model::AttributeRecord& r) {
  if (t.ReadOnly()) return ReadOnlyError("set attribute");
  if (r.key.empty()) return Result::Err(ErrorCode::ConstraintViolation, "empty attribute key");
  TX(t).Mutable().environments[r.environment].attributes[r.key] = r.value;
  return Result::Ok();
}

std::optional<std::string> MemoryRepository::GetAttribute(Transaction& t, const std::string& environment, const std::string& key) {
  const auto& s   = TX(t).View();
  const auto  eit = s.environments.find(environment);
  if (eit == s.environments.end()) return std::nullopt;

  const auto it = eit->second.attributes.find(key);
  if (it == eit->second.attributes.end()) return std::nullopt;
  return it->second;
}

} // namespace retest::db::memory
