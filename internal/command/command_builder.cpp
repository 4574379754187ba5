#include "internal/command/command_builder.hpp"

#include <algorithm>
#include <system_error>

#include "internal/command/shell_split.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace runtrack::command {

using runtrack::observability::BoolField;
using runtrack::observability::StringField;

namespace {

constexpr char kPathSeparator = ':';
constexpr char kDisabledReason[] = "explicitly disabled by model or user config";

bool DisabledInProject(const std::string& name, const model::OpDef& opdef) {
  auto matches = [&](const std::vector<std::string>& disabled) {
    return std::any_of(disabled.begin(), disabled.end(), [&](const std::string& d) { return d == name || d == "all"; });
  };
  if (matches(opdef.disabled_plugins)) {
    return true;
  }
  return opdef.modeldef && matches(opdef.modeldef->disabled_plugins);
}

std::string Resolve(const std::optional<std::string>& override_value, const std::string& fallback) {
  return override_value ? *override_value : fallback;
}

std::string Basename(const std::filesystem::path& path) {
  auto normal = path.lexically_normal();
  if (!normal.has_filename()) {
    normal = normal.parent_path();
  }
  return normal.filename().string();
}

} // namespace

CommandBuilder::CommandBuilder(runtrack::runtime::config::RuntimeSettings settings, plugin::PluginProviderPtr plugins,
                               storage::StorageProviderPtr storage)
    : settings_(std::move(settings)), plugins_(std::move(plugins)), storage_(std::move(storage)) {
}

model::CommandInvocation CommandBuilder::Build(const model::OpDef& opdef) const {
  return {BuildArgs(opdef), BuildEnv(opdef)};
}

std::vector<std::string> CommandBuilder::BuildArgs(const model::OpDef& opdef) const {
  std::vector<std::string> args{
      Resolve(opdef.runtime.interpreter, settings_.interpreter()),
      Resolve(opdef.runtime.module_flag, settings_.module_flag()),
      Resolve(opdef.runtime.entry_module, settings_.entry_module()),
  };

  auto cmd_args  = SplitCommand(opdef.cmd);
  auto flag_args = FlagArgs(opdef.FlagValues(), cmd_args);

  args.insert(args.end(), cmd_args.begin(), cmd_args.end());
  args.insert(args.end(), flag_args.begin(), flag_args.end());
  return args;
}

model::EnvMap CommandBuilder::BuildEnv(const model::OpDef& opdef) const {
  auto env = storage_ ? storage_->SafeEnvironment() : model::EnvMap{};
  env["GUILD_PLUGINS"] = plugins_ ? EnabledPlugins(opdef, *plugins_) : std::string();
  env["LOG_LEVEL"]     = observability::CurrentLevelText();
  env["PYTHONPATH"]    = ModulePath(opdef);
  return env;
}

std::string CommandBuilder::ModulePath(const model::OpDef& opdef) const {
  std::vector<std::string> paths{
      std::filesystem::absolute(opdef.SourceDir()).lexically_normal().string(),
      InstallRoot().string(),
  };

  const auto& packages = settings_.runfile_packages();
  for (const auto& entry : settings_.module_search_path()) {
    if (std::find(packages.begin(), packages.end(), Basename(entry)) != packages.end()) {
      paths.push_back(std::filesystem::absolute(entry).lexically_normal().string());
    }
  }

  std::string joined;
  for (const auto& path : paths) {
    if (!joined.empty()) {
      joined.push_back(kPathSeparator);
    }
    joined += path;
  }
  return joined;
}

/*
  Configured root, else the directory above the one holding the
  running executable (<root>/bin/runtrack).
*/
std::filesystem::path CommandBuilder::InstallRoot() const {
  if (!settings_.install_root().empty()) {
    return std::filesystem::absolute(settings_.install_root()).lexically_normal();
  }

  std::error_code ec;
  auto            exe = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec) {
    return std::filesystem::current_path();
  }
  return exe.parent_path().parent_path();
}

std::vector<std::string> SplitCommand(const model::CommandTemplate& cmd) {
  std::vector<std::string> args;
  if (const auto* shell = std::get_if<model::ShellCommand>(&cmd)) {
    args = ShellSplit(shell->text);
  } else if (const auto* tokens = std::get_if<model::TokenCommand>(&cmd)) {
    args = tokens->tokens;
  } else {
    throw util::InvalidCommand("operation cmd must be a string or a list");
  }

  if (args.empty()) {
    throw util::InvalidCommand("operation cmd is empty");
  }
  return args;
}

std::vector<std::string> CommandOptions(const std::vector<std::string>& args) {
  std::vector<std::string> options;
  for (const auto& arg : args) {
    if (arg.size() < 3 || arg.compare(0, 2, "--") != 0 || arg[2] == '=') {
      continue;
    }
    options.push_back(arg.substr(2, arg.find('=', 2) - 2));
  }
  return options;
}

std::vector<std::string> FlagArgs(const model::FlagMap& flags, const std::vector<std::string>& cmd_args) {
  const auto cmd_options = CommandOptions(cmd_args);

  std::vector<std::string> args;
  for (const auto& [name, value] : flags) {
    if (std::find(cmd_options.begin(), cmd_options.end(), name) != cmd_options.end()) {
      RUNTRACK_LOG_WARN("ignoring flag because it's shadowed in the operation cmd",
                        {StringField("flag", name), StringField("value", model::IsNone(value) ? "null" : model::FlagValueText(value))});
      continue;
    }
    args.push_back("--" + name);
    if (!model::IsNone(value)) {
      args.push_back(model::FlagValueText(value));
    }
  }
  return args;
}

std::string EnabledPlugins(const model::OpDef& opdef, const plugin::PluginProvider& plugins) {
  std::vector<std::string> enabled;
  for (const auto& plugin : plugins.Plugins()) {
    const auto name = plugin->Name();

    plugin::PluginDecision decision;
    if (DisabledInProject(name, opdef)) {
      decision = {false, kDisabledReason};
    } else {
      decision = plugin->EnabledForOperation(opdef);
    }

    RUNTRACK_LOG_DEBUG("plugin decision",
                       {StringField("plugin", name), BoolField("enabled", decision.enabled), StringField("reason", decision.reason)});
    if (decision.enabled) {
      enabled.push_back(name);
    }
  }

  std::sort(enabled.begin(), enabled.end());

  std::string joined;
  for (const auto& name : enabled) {
    if (!joined.empty()) {
      joined.push_back(',');
    }
    joined += name;
  }
  return joined;
}

} // namespace runtrack::command
