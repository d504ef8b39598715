#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "config/config.pb.h"
#include "internal/model/selection_mode.hpp"

namespace retest::config {

/*
  Facts about the current invocation that only the host runner knows.
*/
struct HostContext {
  // -k / -m / --lf / explicit node arguments narrowed the collection
  bool filters_active = false;

  // a debugger or another tracer owns the trace hook
  bool debugger_active = false;

  // distributed worker; end-of-run garbage collection is left to the coordinator
  bool is_worker = false;
};

struct RunMode {
  bool                 collect = false;
  bool                 select  = false;
  model::SelectionMode mode    = model::SelectionMode::kNoSelect;

  // human-readable reasons for anything deactivated
  std::string message;

  bool Active() const {
    return collect || select;
  }
};

/*
  Negotiates collection and selection from config and host facts.
  Throws util::ConfigurationError on contradictory flags.
*/
RunMode ResolveRunMode(const retest::runtime::config::RuntimeConfig& config, const HostContext& host);

/*
  Expands ${NAME} and ${NAME:-default} from the process environment.
  Unset variables without default expand to "".
*/
std::string EvaluateEnvironmentExpression(std::string_view expression);

// Sorted, ", "-joined library identifiers; "" when none are configured.
std::string LibrariesSignature(const retest::runtime::config::RuntimeConfig& config);

std::filesystem::path ResolveRootDir(const retest::runtime::config::RuntimeConfig& config);

} // namespace retest::config
