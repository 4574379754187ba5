#pragma once

#include <filesystem>
#include <memory>

#include "internal/model/command.hpp"

namespace runtrack::storage {

/*
  Where runs live and what environment operations inherit.
*/
class StorageProvider {
 public:
  virtual ~StorageProvider() = default;

  virtual std::filesystem::path RunsDir() const = 0;

  // Ambient environment without this tool's internal variables.
  virtual model::EnvMap SafeEnvironment() const = 0;
};

using StorageProviderPtr = std::shared_ptr<const StorageProvider>;

} // namespace runtrack::storage
