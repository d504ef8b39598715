#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <spdlog/common.h>

#include <cstdlib>
#include <system_error>

#include "internal/util/errors.hpp"

namespace retest::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("1.0", "true")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw util::ConfigurationError("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

retest::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::ConfigurationError("Failed to load YAML config: " + std::string(e.what()));
  }

  // an empty file means "all defaults"
  if (yaml.IsNull()) {
    return Defaults();
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::ConfigurationError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  retest::runtime::config::RuntimeConfig config = Defaults();

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  retest::runtime::config::RuntimeConfig loaded;
  auto status = google::protobuf::util::JsonStringToMessage(json, &loaded, options);

  if (!status.ok()) {
    throw util::ConfigurationError("Invalid configuration: " + std::string(status.message()));
  }

  // sections present in the file replace the defaults as a whole;
  // MergeFrom alone could never turn a default flag back off
  if (loaded.has_database()) {
    config.clear_database();
  }
  if (loaded.has_selection()) {
    config.clear_selection();
  }
  config.MergeFrom(loaded);
  Validate(config);
  return config;
}

std::optional<std::filesystem::path> ConfigLoader::FindProjectConfig(const std::filesystem::path& start) {
  std::error_code ec;
  auto            dir = std::filesystem::absolute(start, ec).lexically_normal();
  if (ec) {
    return std::nullopt;
  }

  while (true) {
    const auto candidate = dir / kProjectConfigName;
    if (std::filesystem::is_regular_file(candidate, ec)) {
      return candidate;
    }
    if (!dir.has_relative_path()) {
      return std::nullopt;
    }
    dir = dir.parent_path();
  }
}

void ConfigLoader::Validate(const retest::runtime::config::RuntimeConfig& config) {
  const auto& level = config.logging().level();
  // spdlog maps unknown names to "off"
  if (!level.empty() && level != "off" && spdlog::level::from_str(level) == spdlog::level::off) {
    throw util::ConfigurationError("unknown logging.level: " + level);
  }

  if (config.database().has_sqlite() && config.database().sqlite().busy_timeout_ms() > 600000) {
    throw util::ConfigurationError("database.sqlite.busy_timeout_ms above 600000");
  }

  for (const auto& library : config.libraries()) {
    if (library.empty()) {
      throw util::ConfigurationError("empty entry in libraries");
    }
  }
}

retest::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  retest::runtime::config::RuntimeConfig config;
  config.set_root_dir(".");
  config.mutable_database()->mutable_sqlite()->set_path(".retestdata");
  config.mutable_selection()->set_enabled(true);
  config.mutable_notice()->set_interval_days(28);
  return config;
}

} // namespace retest::config
