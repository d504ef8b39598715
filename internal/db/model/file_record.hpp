#pragma once

#include <string>

namespace retest::db::model {

// Checksum Store row: last recorded content checksum of a project file.
struct FileRecord {
  std::string environment;
  std::string path; // relative to project root
  std::string checksum;
};

} // namespace retest::db::model
