#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "config/config.pb.h"

namespace retest::config {

inline constexpr const char* kProjectConfigName = "retest.yaml";

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown
  fields are rejected. A section present in the file replaces the
  default section as a whole. Every failure is a
  util::ConfigurationError.
*/
class ConfigLoader {
 public:
  static retest::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Config used when no file is given: sqlite at <root>/.retestdata, engine enabled.
  static retest::runtime::config::RuntimeConfig Defaults();

  // Nearest retest.yaml in start or one of its parents.
  static std::optional<std::filesystem::path> FindProjectConfig(const std::filesystem::path& start);

  // Rejects values the engine would otherwise misread.
  static void Validate(const retest::runtime::config::RuntimeConfig& config);
};

} // namespace retest::config
