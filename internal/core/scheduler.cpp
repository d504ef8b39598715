#include "internal/core/scheduler.hpp"

#include <algorithm>
#include <cmath>

#include "internal/model/node_id.hpp"

namespace retest::core {

DurationTable DurationTable::Build(const std::map<std::string, db::model::NodeRecord>& nodes) {
  DurationTable table;
  for (const auto& [node_id, record] : nodes) {
    // a NaN average would break the strict weak ordering of OrderKey
    const double duration_ms = std::isfinite(record.duration_ms) && record.duration_ms > 0.0 ? record.duration_ms : 0.0;
    const auto parsed = retest::model::NodeId::Parse(node_id);
    const auto module = parsed ? parsed->ModuleKey() : retest::model::HomeFile(node_id);

    auto& module_stats = table.modules_[module];
    module_stats.total_ms += duration_ms;
    module_stats.count++;

    if (parsed) {
      if (auto class_key = parsed->ClassKey()) {
        auto& class_stats = table.classes_[*class_key];
        class_stats.total_ms += duration_ms;
        class_stats.count++;
      }
    }

    auto& node_stats = table.nodes_[node_id];
    node_stats.total_ms += duration_ms;
    node_stats.count++;
  }
  return table;
}

double DurationTable::Average(const std::unordered_map<std::string, Stats>& table, const std::string& key) {
  const auto it = table.find(key);
  if (it == table.end() || it->second.count == 0) return 0.0;
  return it->second.total_ms / static_cast<double>(it->second.count);
}

double DurationTable::ModuleAverage(const std::string& module) const {
  return Average(modules_, module);
}

double DurationTable::ClassAverage(const std::string& class_key) const {
  return Average(classes_, class_key);
}

double DurationTable::NodeAverage(const std::string& node_id) const {
  return Average(nodes_, node_id);
}

OrderKey Scheduler::KeyFor(const std::string& node_id, std::size_t index, const DurationTable& durations) {
  const auto parsed = retest::model::NodeId::Parse(node_id);
  const auto module = parsed ? parsed->ModuleKey() : retest::model::HomeFile(node_id);

  OrderKey key;
  key.module_avg = durations.ModuleAverage(module);
  key.class_avg  = key.module_avg;
  if (parsed) {
    if (auto class_key = parsed->ClassKey()) {
      key.class_avg = durations.ClassAverage(*class_key);
    }
  }
  key.node_avg = durations.NodeAverage(node_id);
  key.index    = index;
  return key;
}

std::vector<std::string> Scheduler::Order(const std::vector<std::string>& node_ids, const DurationTable& durations) {
  std::vector<std::pair<OrderKey, const std::string*>> keyed;
  keyed.reserve(node_ids.size());
  for (std::size_t i = 0; i < node_ids.size(); ++i) {
    keyed.emplace_back(KeyFor(node_ids[i], i, durations), &node_ids[i]);
  }

  std::sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

  std::vector<std::string> ordered;
  ordered.reserve(keyed.size());
  for (const auto& [_, id] : keyed) {
    ordered.push_back(*id);
  }
  return ordered;
}

} // namespace retest::core
