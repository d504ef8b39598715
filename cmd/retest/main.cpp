#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/config/run_mode.hpp"
#include "internal/core/exit_status.hpp"
#include "internal/core/trace_file.hpp"
#include "internal/model/node_id.hpp"
#include "internal/model/outcome.hpp"
#include "internal/observability/logging.hpp"
#include "internal/session/run_session.hpp"
#include "internal/util/errors.hpp"

using retest::core::ExitStatus;
using retest::session::RunSession;

static void Usage() {
  std::cerr << "Usage:\n"
            << "  retest [options] status\n"
            << "  retest [options] select <ids-file|->\n"
            << "  retest [options] record <node-id> <passed|failed|skipped> <duration-ms> <trace-file>\n"
            << "  retest [options] gc\n"
            << "\n"
            << "Options:\n"
            << "  --config <file>   YAML runtime config (default: nearest retest.yaml)\n"
            << "  --env <expr>      environment expression, e.g. ${PYTHON_VERSION}\n"
            << "  --worker          distributed worker; skip end-of-run cleanup\n"
            << "  --filtered        collection was narrowed by test filters\n"
            << "  --no-select       run everything, ordered\n"
            << "  --no-collect      do not record results\n"
            << "  --force-select    keep selecting together with --filtered\n";
}

static int Code(ExitStatus status) {
  return static_cast<int>(status);
}

static std::vector<std::string> ReadIds(std::istream& in) {
  std::vector<std::string> ids;
  std::string              line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;
    ids.push_back(line);
  }
  return ids;
}

static int Status(RunSession& session) {
  std::cout << session.Header() << "\n";
  if (!session.Mode().Active()) {
    return Code(ExitStatus::kOk);
  }

  const auto& report = session.Report();
  for (const auto& path : report.stable_files) {
    std::cout << "stable " << path << "\n";
  }
  for (const auto& path : report.unstable_files) {
    std::cout << "unstable " << path << "\n";
  }
  std::cout << "stable_nodes=" << report.stable_nodes.size() << "\n";
  std::cout << "unstable_nodes=" << report.unstable_nodes.size() << "\n";
  return Code(ExitStatus::kOk);
}

static int Select(RunSession& session, const std::string& source) {
  std::vector<std::string> ids;
  if (source == "-") {
    ids = ReadIds(std::cin);
  } else {
    std::ifstream in(source);
    if (!in) {
      std::cerr << "cannot read " << source << "\n";
      return Code(ExitStatus::kUsageError);
    }
    ids = ReadIds(in);
  }

  for (const auto& id : ids) {
    if (!retest::model::NodeId::Parse(id)) {
      std::cerr << "invalid node id: " << id << "\n";
      return Code(ExitStatus::kUsageError);
    }
  }

  const auto result = session.ModifyItems(ids, 0);
  std::cerr << session.Header() << "\n";

  for (const auto& id : result.selected) {
    std::cout << id << "\n";
  }
  std::cerr << "deselected=" << session.DeselectedCount().value_or(0) << "\n";

  const auto status = result.selected.empty() ? ExitStatus::kNoTestsCollected : ExitStatus::kOk;
  return Code(retest::core::NormalizeExitStatus(status, session.DeselectedCount().value_or(0)));
}

static int Record(RunSession& session, retest::core::ReplayTracer& tracer, const std::string& node_id, const std::string& outcome_text,
                  const std::string& duration_text, const std::string& trace_path) {
  if (!retest::model::NodeId::Parse(node_id)) {
    std::cerr << "invalid node id: " << node_id << "\n";
    return Code(ExitStatus::kUsageError);
  }

  const auto outcome = retest::model::ParseOutcome(outcome_text);
  if (!outcome) {
    std::cerr << "unsupported outcome: " << outcome_text << "\n";
    return Code(ExitStatus::kUsageError);
  }

  double duration_ms = 0.0;
  try {
    duration_ms = std::stod(duration_text);
  } catch (const std::exception&) {
    std::cerr << "invalid duration: " << duration_text << "\n";
    return Code(ExitStatus::kUsageError);
  }
  if (!std::isfinite(duration_ms) || duration_ms < 0.0) {
    std::cerr << "invalid duration: " << duration_text << "\n";
    return Code(ExitStatus::kUsageError);
  }

  if (!session.Mode().collect) {
    std::cerr << "collection is deactivated: " << session.Mode().message << "\n";
    return Code(ExitStatus::kUsageError);
  }

  std::ifstream in(trace_path);
  if (!in) {
    std::cerr << "cannot read " << trace_path << "\n";
    return Code(ExitStatus::kUsageError);
  }

  try {
    tracer.Provide(node_id, retest::core::ParseTraceFile(in));
  } catch (const retest::util::TracingError& e) {
    std::cerr << trace_path << ": " << e.what() << "\n";
    return Code(ExitStatus::kUsageError);
  }

  session.TestStarted(node_id);
  session.PhaseFinished(node_id, retest::model::Phase::kCall, *outcome, duration_ms);
  session.PhaseFinished(node_id, retest::model::Phase::kTeardown, retest::model::Outcome::kPassed, 0.0);

  if (session.RecordedCount() == 0) {
    std::cerr << "not recorded: " << node_id << "\n";
    return Code(ExitStatus::kInternalError);
  }

  std::cout << "recorded\n";
  return Code(ExitStatus::kOk);
}

int main(int argc, char** argv) {
  std::optional<std::string>    config_path;
  std::optional<std::string>    environment_expression;
  retest::config::HostContext   host;
  bool                          no_select    = false;
  bool                          no_collect   = false;
  bool                          force_select = false;
  std::vector<std::string>      args;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if ((arg == "--config" || arg == "--env") && i + 1 >= argc) {
      Usage();
      return Code(ExitStatus::kUsageError);
    }

    if (arg == "--config") {
      config_path = argv[++i];
    } else if (arg == "--env") {
      environment_expression = argv[++i];
    } else if (arg == "--worker") {
      host.is_worker = true;
    } else if (arg == "--filtered") {
      host.filters_active = true;
    } else if (arg == "--no-select") {
      no_select = true;
    } else if (arg == "--no-collect") {
      no_collect = true;
    } else if (arg == "--force-select") {
      force_select = true;
    } else if (arg == "-h" || arg == "--help") {
      Usage();
      return Code(ExitStatus::kOk);
    } else {
      args.push_back(arg);
    }
  }

  if (args.empty()) {
    Usage();
    return Code(ExitStatus::kUsageError);
  }

  const auto& cmd = args[0];

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    if (!config_path) {
      if (auto found = retest::config::ConfigLoader::FindProjectConfig(std::filesystem::current_path())) {
        config_path = found->string();
      }
    }
    auto config = config_path ? retest::config::ConfigLoader::LoadFromYaml(*config_path) : retest::config::ConfigLoader::Defaults();

    // a relative root_dir in a config file is relative to that file
    if (config_path && std::filesystem::path(config.root_dir()).is_relative()) {
      config.set_root_dir((std::filesystem::path(*config_path).parent_path() / config.root_dir()).lexically_normal().string());
    }

    if (environment_expression) config.set_environment_expression(*environment_expression);
    auto* selection = config.mutable_selection();
    if (no_select) selection->set_no_select(true);
    if (no_collect) selection->set_no_collect(true);
    if (force_select) selection->set_force_select(true);

    retest::observability::InitializeLogging(config, host.is_worker ? "worker" : "coordinator");

    auto       tracer = std::make_shared<retest::core::ReplayTracer>();
    RunSession session(config, host, tracer);
    session.Configure();

    int code = -1;

    if (cmd == "status" && args.size() == 1) {
      code = Status(session);
    } else if (cmd == "select" && args.size() == 2) {
      code = Select(session, args[1]);
    } else if (cmd == "record" && args.size() == 5) {
      code = Record(session, *tracer, args[1], args[2], args[3], args[4]);
    } else if (cmd == "gc" && args.size() == 1) {
      code = Code(session.Finish(ExitStatus::kOk));
      std::cout << "done\n";
    }

    retest::observability::ShutdownLogging();

    if (code < 0) {
      Usage();
      return Code(ExitStatus::kUsageError);
    }
    return code;
  } catch (const retest::util::ConfigurationError& e) {
    std::cerr << "retest: " << e.what() << "\n";
    retest::observability::ShutdownLogging();
    return Code(ExitStatus::kUsageError);
  } catch (const std::exception& e) {
    RETEST_LOG_ERROR("Fatal error", {retest::observability::StringField("error", e.what())});
    retest::observability::ShutdownLogging();
    return Code(ExitStatus::kInternalError);
  }
}
