#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>

namespace retest::core {

using TraceHandle = std::uint64_t;

/*
  Executed regions of one test: path -> executed line numbers.
  Paths may be absolute or relative to the project root.
*/
struct TraceResult {
  std::map<std::string, std::set<int>> lines;
};

/*
  Capability interface of the tracing collaborator.

  The engine calls BeginTrace/EndTrace around each test. Failures are
  reported as util::TracingError and only affect that test.
*/
class Tracer {
 public:
  virtual ~Tracer() = default;

  virtual TraceHandle BeginTrace(const std::string& node_id) = 0;

  virtual TraceResult EndTrace(TraceHandle handle) = 0;

  // Drops an in-flight trace without producing a result.
  virtual void Cancel(TraceHandle handle) = 0;
};

} // namespace retest::core
