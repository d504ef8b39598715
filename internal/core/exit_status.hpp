#pragma once

#include <cstdint>

namespace retest::core {

// Host process exit codes.
enum class ExitStatus : int {
  kOk               = 0,
  kTestsFailed      = 1,
  kInterrupted      = 2,
  kInternalError    = 3,
  kUsageError       = 4,
  kNoTestsCollected = 5,
};

// A run that deselected everything still succeeded.
constexpr ExitStatus NormalizeExitStatus(ExitStatus status, uint64_t deselected_count) {
  if (status == ExitStatus::kNoTestsCollected && deselected_count > 0) {
    return ExitStatus::kOk;
  }
  return status;
}

} // namespace retest::core
