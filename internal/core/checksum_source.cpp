#include "internal/core/checksum_source.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <memory>
#include <stdexcept>

namespace retest::core {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext NewSha256() {
  DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("sha256 init failed");
  }
  return ctx;
}

std::string FinishHex(EVP_MD_CTX* ctx) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  length = 0;
  if (EVP_DigestFinal_ex(ctx, digest, &length) != 1) {
    throw std::runtime_error("sha256 final failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    out.push_back(kHex[digest[i] >> 4]);
    out.push_back(kHex[digest[i] & 0x0F]);
  }
  return out;
}

} // namespace

std::string Sha256Hex(std::string_view data) {
  auto ctx = NewSha256();
  if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("sha256 update failed");
  }
  return FinishHex(ctx.get());
}

FileChecksumSource::FileChecksumSource(std::filesystem::path root) : root_(std::move(root)) {
}

std::optional<std::string> FileChecksumSource::Checksum(const std::string& path) {
  std::ifstream file(root_ / path, std::ios::binary);
  if (!file) {
    return std::nullopt;
  }

  auto ctx = NewSha256();

  char buffer[8192];
  while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
    if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<std::size_t>(file.gcount())) != 1) {
      throw std::runtime_error("sha256 update failed");
    }
  }
  if (file.bad()) {
    return std::nullopt;
  }

  return FinishHex(ctx.get());
}

} // namespace retest::core
