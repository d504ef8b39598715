#pragma once

#include <istream>
#include <map>
#include <mutex>

#include "internal/core/tracer.hpp"

namespace retest::core {

/*
  Text form of a trace, one touched file per line:

    src/math.cpp:10,11,12
    src/util.cpp

  Blank lines and lines starting with '#' are ignored.
  Throws util::TracingError on a malformed line list.
*/
TraceResult ParseTraceFile(std::istream& in);

/*
  Tracer for traces produced out of process: the host hands the
  finished trace over and EndTrace returns it.
*/
class ReplayTracer final : public Tracer {
 public:
  // Trace returned by the next BeginTrace of node_id.
  void Provide(const std::string& node_id, TraceResult trace);

  TraceHandle BeginTrace(const std::string& node_id) override;
  TraceResult EndTrace(TraceHandle handle) override;
  void        Cancel(TraceHandle handle) override;

 private:
  std::mutex                         mutex_;
  std::map<std::string, TraceResult> provided_;
  std::map<TraceHandle, std::string> active_;
  TraceHandle                        next_handle_ = 1;
};

} // namespace retest::core
