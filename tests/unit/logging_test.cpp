#include <cassert>
#include <iostream>

#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

namespace {

using retest::observability::BoolField;
using retest::observability::FormatFields;
using retest::observability::IntField;
using retest::observability::StringField;

void TestPlainFields() {
  assert(FormatFields({}) == "");
  assert(FormatFields({StringField("path", "src/a.py"), IntField("removed", -3), BoolField("worker", true)}) ==
         "path=src/a.py removed=-3 worker=true");
}

void TestValuesWithSpacesAreQuoted() {
  assert(FormatFields({StringField("error", "disk full")}) == "error=\"disk full\"");
  assert(FormatFields({StringField("id", "t.py::test[a \"b\"]")}) == "id=\"t.py::test[a \\\"b\\\"]\"");
  assert(FormatFields({StringField("environment", "")}) == "environment=\"\"");
}

void TestInitializeNamesLoggerAfterProcess() {
  retest::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("debug");

  retest::observability::InitializeLogging(config, "worker");
  assert(spdlog::default_logger()->name() == "worker");
  assert(spdlog::default_logger()->level() == spdlog::level::debug);

  RETEST_LOG_DEBUG("logging test", {StringField("phase", "init")});
  retest::observability::ShutdownLogging();
}

} // namespace

int main() {
  TestPlainFields();
  TestValuesWithSpacesAreQuoted();
  TestInitializeNamesLoggerAfterProcess();

  std::cout << "retest_unit_logging: pass\n";
  return 0;
}
