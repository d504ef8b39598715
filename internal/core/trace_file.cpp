#include "internal/core/trace_file.hpp"

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace retest::core {

namespace {

bool IsLineList(const std::string& text) {
  if (text.empty()) return false;
  for (char c : text) {
    if (!(c == ',' || (c >= '0' && c <= '9'))) return false;
  }
  return true;
}

std::string Trim(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t\r");
  if (begin == std::string::npos) return {};
  const auto end = s.find_last_not_of(" \t\r");
  return s.substr(begin, end - begin + 1);
}

} // namespace

TraceResult ParseTraceFile(std::istream& in) {
  TraceResult result;
  std::string raw;
  int         line_number = 0;

  while (std::getline(in, raw)) {
    ++line_number;
    const auto line = Trim(raw);
    if (line.empty() || line.front() == '#') continue;

    const auto colon = line.rfind(':');
    // "a.py:" names a.py with no executed lines
    if (colon != std::string::npos && colon + 1 == line.size()) {
      if (colon == 0) {
        throw util::TracingError("trace line " + std::to_string(line_number) + ": missing path");
      }
      result.lines[line.substr(0, colon)];
      continue;
    }
    if (colon == std::string::npos || !IsLineList(line.substr(colon + 1))) {
      result.lines[line];
      continue;
    }

    const auto path = line.substr(0, colon);
    if (path.empty()) {
      throw util::TracingError("trace line " + std::to_string(line_number) + ": missing path");
    }

    auto&       lines = result.lines[path];
    std::size_t pos   = colon + 1;
    while (pos <= line.size()) {
      const auto comma = line.find(',', pos);
      const auto item  = line.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos);
      if (item.empty()) {
        throw util::TracingError("trace line " + std::to_string(line_number) + ": empty line number");
      }
      try {
        lines.insert(std::stoi(item));
      } catch (const std::out_of_range&) {
        throw util::TracingError("trace line " + std::to_string(line_number) + ": line number out of range");
      }
      if (comma == std::string::npos) break;
      pos = comma + 1;
    }
  }
  return result;
}

void ReplayTracer::Provide(const std::string& node_id, TraceResult trace) {
  std::lock_guard lock(mutex_);
  provided_[node_id] = std::move(trace);
}

TraceHandle ReplayTracer::BeginTrace(const std::string& node_id) {
  std::lock_guard lock(mutex_);
  const auto      handle = next_handle_++;
  active_[handle]        = node_id;
  return handle;
}

TraceResult ReplayTracer::EndTrace(TraceHandle handle) {
  std::lock_guard lock(mutex_);
  const auto      it = active_.find(handle);
  if (it == active_.end()) {
    throw util::TracingError("unknown trace handle " + std::to_string(handle));
  }

  const auto node_id = it->second;
  active_.erase(it);

  const auto provided = provided_.find(node_id);
  if (provided == provided_.end()) {
    throw util::TracingError("no trace provided for " + node_id);
  }
  auto trace = std::move(provided->second);
  provided_.erase(provided);
  return trace;
}

void ReplayTracer::Cancel(TraceHandle handle) {
  std::lock_guard lock(mutex_);
  const auto      it = active_.find(handle);
  if (it != active_.end()) {
    provided_.erase(it->second);
    active_.erase(it);
  }
}

} // namespace retest::core
