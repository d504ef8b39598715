#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace retest::model {

/*
  Structured test node identifier.

    module[::scope...]::name

  module is the test's home file. scope is the optional class path
  (nested classes joined with "::"). name may carry a parameter suffix
  in brackets; "::" inside brackets does not split.

  Parse(s)->ToString() == s for every accepted s.
*/
class NodeId {
 public:
  NodeId() = default;
  NodeId(std::string module, std::string scope, std::string name);

  static std::optional<NodeId> Parse(std::string_view text);

  const std::string& Module() const {
    return module_;
  }
  const std::string& Scope() const {
    return scope_;
  }
  const std::string& Name() const {
    return name_;
  }
  bool HasScope() const {
    return !scope_.empty();
  }

  std::string ToString() const;

  // Duration-table keys
  const std::string&         ModuleKey() const {
    return module_;
  }
  std::optional<std::string> ClassKey() const;

  bool operator==(const NodeId&) const = default;

 private:
  std::string module_;
  std::string scope_;
  std::string name_;
};

// Home file of a serialized node id; the text before the first "::".
std::string HomeFile(std::string_view node_id);

} // namespace retest::model
