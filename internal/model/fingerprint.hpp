#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace retest::model {

// Pseudo path standing for the installed dependency set.
inline constexpr std::string_view kLibrariesPath = "<libraries>";

struct FingerprintEntry {
  std::string path;
  std::string checksum;

  bool operator==(const FingerprintEntry&) const = default;
};

/*
  Set of (file, checksum) pairs a test depends on.
  Kept sorted by path with one entry per path.
*/
using Fingerprint = std::vector<FingerprintEntry>;

// Sorts by path; on duplicate paths the last entry wins.
inline Fingerprint Normalize(Fingerprint fingerprint) {
  std::stable_sort(fingerprint.begin(), fingerprint.end(),
                   [](const FingerprintEntry& a, const FingerprintEntry& b) { return a.path < b.path; });

  Fingerprint out;
  out.reserve(fingerprint.size());
  for (auto& entry : fingerprint) {
    if (!out.empty() && out.back().path == entry.path) {
      out.back() = std::move(entry);
    } else {
      out.push_back(std::move(entry));
    }
  }
  return out;
}

} // namespace retest::model
