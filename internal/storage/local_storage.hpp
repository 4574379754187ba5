#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "internal/storage/storage_provider.hpp"

namespace runtrack::storage {

class LocalStorage final : public StorageProvider {
 public:
  LocalStorage(std::filesystem::path runs_dir, std::vector<std::string> internal_env_prefixes);

  std::filesystem::path RunsDir() const override {
    return runs_dir_;
  }

  model::EnvMap SafeEnvironment() const override;

 private:
  std::filesystem::path    runs_dir_;
  std::vector<std::string> internal_env_prefixes_;
};

} // namespace runtrack::storage
