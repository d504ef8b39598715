#pragma once

#include <string>

namespace retest::db::model {

/*
  Engine metadata unrelated to any single test
  (libraries signature, last notice date, ...).
  Last write wins.
*/

struct AttributeRecord {
  std::string environment;
  std::string key;
  std::string value;
};

} // namespace retest::db::model
