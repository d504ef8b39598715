#include "internal/model/node_id.hpp"

#include <vector>

namespace retest::model {

namespace {

constexpr std::string_view kSeparator = "::";

std::vector<std::string> SplitSegments(std::string_view text) {
  std::vector<std::string> segments;
  std::string              current;
  int                      bracket_depth = 0;

  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '[') {
      ++bracket_depth;
    } else if (c == ']' && bracket_depth > 0) {
      --bracket_depth;
    }

    if (bracket_depth == 0 && text.substr(i, kSeparator.size()) == kSeparator) {
      segments.push_back(std::move(current));
      current.clear();
      ++i;
      continue;
    }
    current.push_back(c);
  }
  segments.push_back(std::move(current));
  return segments;
}

} // namespace

NodeId::NodeId(std::string module, std::string scope, std::string name)
    : module_(std::move(module)), scope_(std::move(scope)), name_(std::move(name)) {
}

std::optional<NodeId> NodeId::Parse(std::string_view text) {
  auto segments = SplitSegments(text);
  if (segments.size() < 2) {
    return std::nullopt;
  }

  for (const auto& segment : segments) {
    if (segment.empty()) return std::nullopt;
  }

  std::string scope;
  for (std::size_t i = 1; i + 1 < segments.size(); ++i) {
    if (!scope.empty()) scope += kSeparator;
    scope += segments[i];
  }

  return NodeId(std::move(segments.front()), std::move(scope), std::move(segments.back()));
}

std::string NodeId::ToString() const {
  std::string out = module_;
  if (!scope_.empty()) {
    out += kSeparator;
    out += scope_;
  }
  out += kSeparator;
  out += name_;
  return out;
}

std::optional<std::string> NodeId::ClassKey() const {
  if (scope_.empty()) {
    return std::nullopt;
  }
  return module_ + std::string(kSeparator) + scope_;
}

std::string HomeFile(std::string_view node_id) {
  const auto pos = node_id.find(kSeparator);
  return std::string(pos == std::string_view::npos ? node_id : node_id.substr(0, pos));
}

} // namespace retest::model
