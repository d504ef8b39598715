#pragma once

#include <stdexcept>
#include <string>

namespace retest::util {

/*
  Central error types.

  ConfigurationError and CorruptState abort the run.
  TracingError and StorageError are absorbed per test by the Recorder.
*/

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CorruptState : public std::runtime_error {
 public:
  explicit CorruptState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TracingError : public std::runtime_error {
 public:
  explicit TracingError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace retest::util
