#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace retest::core {

/*
  Current content checksum of a project file.

  Paths are relative to the project root. nullopt means the file
  is missing or unreadable; callers treat that as "changed".
*/
class ChecksumSource {
 public:
  virtual ~ChecksumSource() = default;

  virtual std::optional<std::string> Checksum(const std::string& path) = 0;
};

// SHA-256 of file contents, hex encoded.
class FileChecksumSource final : public ChecksumSource {
 public:
  explicit FileChecksumSource(std::filesystem::path root);

  std::optional<std::string> Checksum(const std::string& path) override;

 private:
  std::filesystem::path root_;
};

// Hex SHA-256 of a byte string. Throws std::runtime_error if the digest fails.
std::string Sha256Hex(std::string_view data);

} // namespace retest::core
