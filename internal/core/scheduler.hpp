#pragma once

#include <compare>
#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/model/node_record.hpp"

namespace retest::core {

/*
  Historical average durations per module, class and node.
  Unknown keys average to 0; negative or non-finite recorded durations
  count as 0.
*/
class DurationTable {
 public:
  static DurationTable Build(const std::map<std::string, db::model::NodeRecord>& nodes);

  double ModuleAverage(const std::string& module) const;
  double ClassAverage(const std::string& class_key) const;
  double NodeAverage(const std::string& node_id) const;

 private:
  struct Stats {
    double   total_ms = 0.0;
    uint64_t count    = 0;
  };

  static double Average(const std::unordered_map<std::string, Stats>& table, const std::string& key);

  std::unordered_map<std::string, Stats> modules_;
  std::unordered_map<std::string, Stats> classes_;
  std::unordered_map<std::string, Stats> nodes_;
};

struct OrderKey {
  double      module_avg = 0.0;
  double      class_avg  = 0.0; // module average when the node has no class
  double      node_avg   = 0.0;
  std::size_t index      = 0;   // collection order

  auto operator<=>(const OrderKey&) const = default;
};

/*
  Orders tests to give feedback early: fast modules first, then fast
  classes within a module, then fast tests within a class. One
  lexicographic comparison over OrderKey; the index component makes
  equal durations keep collection order.
*/
class Scheduler {
 public:
  static OrderKey KeyFor(const std::string& node_id, std::size_t index, const DurationTable& durations);

  static std::vector<std::string> Order(const std::vector<std::string>& node_ids, const DurationTable& durations);
};

} // namespace retest::core
