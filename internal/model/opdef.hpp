#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "internal/model/flag_value.hpp"

namespace runtrack::model {

/*
  Provenance of a model: (pkg_type, pkg_name, pkg_version, model_name).
  Any field may be unknown.
*/
struct ModelRef {
  std::optional<std::string> pkg_type;
  std::optional<std::string> pkg_name;
  std::optional<std::string> pkg_version;
  std::optional<std::string> model_name;
};

struct ModelDef {
  std::string                name;
  ModelRef                   reference;
  std::vector<std::string>   disabled_plugins;
  std::filesystem::path      modelfile;
};

// Command template given as a shell-syntax string.
struct ShellCommand {
  std::string text;
};

// Command template given pre-tokenized.
struct TokenCommand {
  std::vector<std::string> tokens;
};

// std::monostate: the definition carried no usable command.
using CommandTemplate = std::variant<std::monostate, ShellCommand, TokenCommand>;

/*
  How the child process is started. Unset fields fall back to the
  runtime settings of the config.
*/
struct RuntimeOverride {
  std::optional<std::string> interpreter;
  std::optional<std::string> module_flag;
  std::optional<std::string> entry_module;
};

struct OpDef {
  std::string                     name;
  CommandTemplate                 cmd;
  FlagMap                         flags;
  std::vector<std::string>        dependencies;
  std::vector<std::string>        disabled_plugins;
  RuntimeOverride                 runtime;
  std::shared_ptr<const ModelDef> modeldef;

  const FlagMap& FlagValues() const {
    return flags;
  }

  // Directory holding the definition; dependencies and the module search
  // path are relative to it.
  std::filesystem::path SourceDir() const {
    if (!modeldef || modeldef->modelfile.empty()) {
      return std::filesystem::current_path();
    }
    return modeldef->modelfile.parent_path();
  }
};

} // namespace runtrack::model
