#include "internal/factory.hpp"

#include <memory>
#include <string>
#include <vector>

#include "internal/deps/local_file_resolver.hpp"
#include "internal/plugin/plugin_registry.hpp"
#include "internal/process/process_supervisor.hpp"
#include "internal/storage/local_storage.hpp"

namespace runtrack::factory {

core::OperationContext BuildContext(const runtrack::runtime::config::RuntimeConfig& config) {
  std::vector<std::string> prefixes(config.storage().internal_env_prefixes().begin(), config.storage().internal_env_prefixes().end());

  auto registry = std::make_shared<plugin::PluginRegistry>();
  for (const auto& plugin : config.plugins()) {
    registry->Register(std::make_shared<plugin::ConfiguredPlugin>(plugin.name(), plugin.enabled(), plugin.reason()));
  }

  core::OperationContext context;
  context.storage    = std::make_shared<storage::LocalStorage>(config.storage().runs_dir(), std::move(prefixes));
  context.plugins    = std::move(registry);
  context.resolver   = std::make_shared<deps::LocalFileResolver>();
  context.supervisor = std::make_shared<process::ProcessSupervisor>();
  context.runtime    = config.runtime();
  return context;
}

} // namespace runtrack::factory
