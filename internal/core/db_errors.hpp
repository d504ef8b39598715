#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace retest::core {

// Corruption compromises future selection and escalates; everything
// else is a StorageError the caller may absorb.
inline void ThrowIfDbError(const retest::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + " (" + retest::db::ToString(result.code) + ")";
  if (!result.message.empty()) {
    message += ": " + result.message;
  }
  switch (result.code) {
    case retest::db::ErrorCode::Corruption:
      throw util::CorruptState(message);
    default:
      throw util::StorageError(message);
  }
}

} // namespace retest::core
