#include "internal/storage/local_storage.hpp"

#include <algorithm>

extern char** environ;

namespace runtrack::storage {

LocalStorage::LocalStorage(std::filesystem::path runs_dir, std::vector<std::string> internal_env_prefixes)
    : runs_dir_(std::filesystem::absolute(runs_dir)), internal_env_prefixes_(std::move(internal_env_prefixes)) {
}

model::EnvMap LocalStorage::SafeEnvironment() const {
  model::EnvMap env;
  for (char** entry = environ; entry && *entry; ++entry) {
    const std::string item(*entry);
    const auto        eq = item.find('=');
    if (eq == std::string::npos || eq == 0) {
      continue;
    }

    auto name     = item.substr(0, eq);
    bool internal = std::any_of(internal_env_prefixes_.begin(), internal_env_prefixes_.end(),
                                [&](const std::string& prefix) { return !prefix.empty() && name.rfind(prefix, 0) == 0; });
    if (!internal) {
      env.emplace(std::move(name), item.substr(eq + 1));
    }
  }
  return env;
}

} // namespace runtrack::storage
