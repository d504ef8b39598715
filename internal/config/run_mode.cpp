#include "internal/config/run_mode.hpp"

#include <algorithm>
#include <cstdlib>
#include <vector>

#include "internal/util/errors.hpp"

namespace retest::config {

RunMode ResolveRunMode(const retest::runtime::config::RuntimeConfig& config, const HostContext& host) {
  const auto& selection = config.selection();

  RunMode run;
  if (selection.disabled() || !selection.enabled()) {
    run.message = "deactivated";
    return run;
  }

  if (selection.force_select() && selection.no_select()) {
    throw util::ConfigurationError("contradictory selection flags: force_select and no_select are both set");
  }

  std::vector<std::string> reasons;

  run.collect = true;
  if (selection.no_collect()) {
    run.collect = false;
    reasons.push_back("collection deactivated through no_collect");
  } else if (host.debugger_active) {
    run.collect = false;
    reasons.push_back("collection automatically deactivated because it is not compatible with a debugger");
  }

  run.select = true;
  if (selection.no_select()) {
    run.select = false;
    reasons.push_back("selection deactivated through no_select");
  } else if (host.filters_active && !selection.force_select()) {
    run.select = false;
    reasons.push_back("selection automatically deactivated because test filters are in use");
  }

  if (run.select) {
    run.mode = selection.force_select() ? model::SelectionMode::kForceSelect : model::SelectionMode::kNormal;
  }

  for (const auto& reason : reasons) {
    if (!run.message.empty()) run.message += ", ";
    run.message += reason;
  }
  return run;
}

std::string EvaluateEnvironmentExpression(std::string_view expression) {
  std::string out;
  std::size_t pos = 0;

  while (pos < expression.size()) {
    const auto start = expression.find("${", pos);
    if (start == std::string_view::npos) {
      out.append(expression.substr(pos));
      break;
    }
    out.append(expression.substr(pos, start - pos));

    const auto end = expression.find('}', start + 2);
    if (end == std::string_view::npos) {
      throw util::ConfigurationError("unterminated ${ in environment expression: " + std::string(expression));
    }

    const auto body = expression.substr(start + 2, end - start - 2);
    const auto sep  = body.find(":-");
    const auto name = std::string(sep == std::string_view::npos ? body : body.substr(0, sep));
    if (name.empty()) {
      throw util::ConfigurationError("empty variable name in environment expression: " + std::string(expression));
    }

    const char* value = std::getenv(name.c_str());
    if (value && *value) {
      out.append(value);
    } else if (sep != std::string_view::npos) {
      out.append(body.substr(sep + 2));
    }
    pos = end + 1;
  }
  return out;
}

std::string LibrariesSignature(const retest::runtime::config::RuntimeConfig& config) {
  std::vector<std::string> libraries(config.libraries().begin(), config.libraries().end());
  std::sort(libraries.begin(), libraries.end());

  std::string signature;
  for (const auto& library : libraries) {
    if (!signature.empty()) signature += ", ";
    signature += library;
  }
  return signature;
}

std::filesystem::path ResolveRootDir(const retest::runtime::config::RuntimeConfig& config) {
  const auto& root = config.root_dir();
  auto path = std::filesystem::absolute(root.empty() ? std::filesystem::path(".") : std::filesystem::path(root)).lexically_normal();
  // "/x/." normalizes to "/x/"
  if (!path.has_filename() && path.has_relative_path()) {
    path = path.parent_path();
  }
  return path;
}

} // namespace retest::config
