#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "config/config.pb.h"

#include "internal/core/checksum_source.hpp"
#include "internal/db/api/repository.hpp"

namespace retest::factory {

/*
  RuntimeDependencies

  Long-lived collaborators of one run. Everything here lives for the
  lifetime of the session.
*/
struct RuntimeDependencies {
  std::filesystem::path root;
  std::string           environment;
  std::string           libraries_signature;

  std::shared_ptr<db::Repository>       repository;
  std::shared_ptr<core::ChecksumSource> checksums;
};

/*
  BuildRuntime

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.

  Throws util::ConfigurationError when the database cannot be opened.
*/
RuntimeDependencies BuildRuntime(const retest::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const retest::runtime::config::RuntimeConfig& config,
                                                const std::filesystem::path&                 root);

} // namespace retest::factory
