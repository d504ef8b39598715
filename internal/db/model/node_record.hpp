#pragma once

#include <string>

#include "internal/model/fingerprint.hpp"
#include "internal/model/outcome.hpp"

namespace retest::db::model {

/*
  Persistent test node row plus its fingerprint rows.

  IMPORTANT:
  - The fingerprint is replaced as a whole on every upsert, never merged.
  - node_id is the serialized NodeId.
*/

struct NodeRecord {
  std::string environment;
  std::string node_id;

  retest::model::Outcome outcome = retest::model::Outcome::kPassed;

  // sum of setup/call/teardown (ms)
  double duration_ms = 0.0;

  retest::model::Fingerprint fingerprint;

  bool Failed() const {
    return outcome == retest::model::Outcome::kFailed;
  }
};

} // namespace retest::db::model
