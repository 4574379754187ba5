#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/command.hpp"
#include "internal/model/opdef.hpp"
#include "internal/plugin/plugin.hpp"
#include "internal/storage/storage_provider.hpp"

namespace runtrack::command {

/*
  Derives the child invocation of an operation:

      args: {interpreter} {module_flag} {entry_module} {cmd...} {flags...}
      env:  safe ambient environment + GUILD_PLUGINS, LOG_LEVEL, PYTHONPATH

  The run directory is not known yet; the orchestrator appends it.
*/
class CommandBuilder {
 public:
  CommandBuilder(runtrack::runtime::config::RuntimeSettings settings, plugin::PluginProviderPtr plugins,
                 storage::StorageProviderPtr storage);

  // Throws util::InvalidCommand.
  model::CommandInvocation Build(const model::OpDef& opdef) const;

  std::vector<std::string> BuildArgs(const model::OpDef& opdef) const;
  model::EnvMap            BuildEnv(const model::OpDef& opdef) const;

 private:
  std::string              ModulePath(const model::OpDef& opdef) const;
  std::filesystem::path    InstallRoot() const;

  runtrack::runtime::config::RuntimeSettings settings_;
  plugin::PluginProviderPtr                  plugins_;
  storage::StorageProviderPtr                storage_;
};

// Tokens of the operation command. Throws util::InvalidCommand when empty or unset.
std::vector<std::string> SplitCommand(const model::CommandTemplate& cmd);

// Option names given as --name or --name=value tokens.
std::vector<std::string> CommandOptions(const std::vector<std::string>& args);

/*
  --name [value] for each flag in name order. Flags already given as
  options in `cmd_args` are skipped with a warning.
*/
std::vector<std::string> FlagArgs(const model::FlagMap& flags, const std::vector<std::string>& cmd_args);

// Comma-joined, sorted names of the plugins enabled for the operation.
std::string EnabledPlugins(const model::OpDef& opdef, const plugin::PluginProvider& plugins);

} // namespace runtrack::command
