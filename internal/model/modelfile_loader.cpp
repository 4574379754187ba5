#include "internal/model/modelfile_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace runtrack::model {

namespace {

using runtrack::util::ModelfileError;

std::optional<std::string> OptionalScalar(const YAML::Node& node, const char* key) {
  const auto child = node[key];
  if (!child || child.IsNull()) {
    return std::nullopt;
  }
  if (!child.IsScalar()) {
    throw ModelfileError(std::string("'") + key + "' must be a scalar");
  }
  return child.Scalar();
}

std::vector<std::string> StringList(const YAML::Node& node, const char* key) {
  std::vector<std::string> values;
  const auto               child = node[key];
  if (!child || child.IsNull()) {
    return values;
  }
  if (!child.IsSequence()) {
    throw ModelfileError(std::string("'") + key + "' must be a list");
  }
  for (const auto& item : child) {
    values.push_back(item.as<std::string>());
  }
  return values;
}

FlagValue ToFlagValue(const YAML::Node& node, const std::string& name) {
  if (!node || node.IsNull()) {
    return std::monostate{};
  }
  if (!node.IsScalar()) {
    throw ModelfileError("flag '" + name + "' must be a scalar");
  }
  // Quoted scalars are always strings.
  if (node.Tag() == "!") {
    return node.Scalar();
  }
  return ParseFlagValue(node.Scalar());
}

CommandTemplate ToCommand(const YAML::Node& node) {
  if (node && node.IsScalar()) {
    return ShellCommand{node.Scalar()};
  }
  if (node && node.IsSequence()) {
    TokenCommand cmd;
    for (const auto& item : node) {
      cmd.tokens.push_back(item.as<std::string>());
    }
    return cmd;
  }
  // Missing or unsupported; rejected when the command is built.
  return std::monostate{};
}

OpDef ToOpDef(const std::string& name, const YAML::Node& node, std::shared_ptr<const ModelDef> modeldef) {
  if (!node.IsMap()) {
    throw ModelfileError("operation '" + name + "' must be a mapping");
  }

  OpDef op;
  op.name             = name;
  op.cmd              = ToCommand(node["cmd"]);
  op.dependencies     = StringList(node, "requires");
  op.disabled_plugins = StringList(node, "disabled-plugins");
  op.modeldef         = std::move(modeldef);

  if (const auto flags = node["flags"]) {
    if (!flags.IsMap()) {
      throw ModelfileError("flags of operation '" + name + "' must be a mapping");
    }
    for (const auto& it : flags) {
      const auto flag_name = it.first.as<std::string>();
      op.flags[flag_name]  = ToFlagValue(it.second, flag_name);
    }
  }

  if (const auto runtime = node["runtime"]) {
    op.runtime.interpreter  = OptionalScalar(runtime, "interpreter");
    op.runtime.module_flag  = OptionalScalar(runtime, "module-flag");
    op.runtime.entry_module = OptionalScalar(runtime, "entry-module");
  }

  return op;
}

void LoadModel(const YAML::Node& node, const std::filesystem::path& path, Modelfile* modelfile) {
  if (!node.IsMap()) {
    throw ModelfileError("model definition must be a mapping");
  }

  auto name = OptionalScalar(node, "name");
  if (!name || name->empty()) {
    throw ModelfileError("model definition is missing 'name'");
  }

  auto model       = std::make_shared<ModelDef>();
  model->name      = *name;
  model->modelfile = path;

  auto package                 = OptionalScalar(node, "package");
  model->reference.pkg_type    = "modelfile";
  model->reference.pkg_name    = package ? *package : path.parent_path().string();
  model->reference.pkg_version = OptionalScalar(node, "version");
  model->reference.model_name  = model->name;
  model->disabled_plugins      = StringList(node, "disabled-plugins");

  if (!package && model->reference.pkg_name->find_first_of(" \t") != std::string::npos) {
    RUNTRACK_LOG_WARN("modelfile directory contains whitespace; runs will record an opref that cannot be read back, set 'package'",
                      {observability::StringField("model", model->name),
                       observability::StringField("dir", *model->reference.pkg_name)});
  }

  modelfile->models.push_back(model);

  const auto operations = node["operations"];
  if (!operations || operations.IsNull()) {
    return;
  }
  if (!operations.IsMap()) {
    throw ModelfileError("operations of model '" + model->name + "' must be a mapping");
  }
  for (const auto& it : operations) {
    modelfile->operations.push_back(ToOpDef(it.first.as<std::string>(), it.second, model));
  }
}

} // namespace

const OpDef& Modelfile::FindOperation(const std::optional<std::string>& model_name, const std::string& op_name) const {
  const OpDef* found = nullptr;
  for (const auto& op : operations) {
    if (op.name != op_name) {
      continue;
    }
    if (model_name && op.modeldef->name != *model_name) {
      continue;
    }
    if (found) {
      throw util::NotFound("operation '" + op_name + "' is ambiguous in " + path.string() + ", qualify it with a model name");
    }
    found = &op;
  }
  if (!found) {
    const auto ref = model_name ? *model_name + ":" + op_name : op_name;
    throw util::NotFound("operation '" + ref + "' is not defined in " + path.string());
  }
  return *found;
}

Modelfile ModelfileLoader::LoadFromYaml(const std::filesystem::path& path) {
  const auto abs_path = std::filesystem::absolute(path);

  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(abs_path.string());
  } catch (const std::exception& e) {
    throw ModelfileError("Failed to load modelfile " + abs_path.string() + ": " + e.what());
  }

  Modelfile modelfile;
  modelfile.path = abs_path;

  try {
    if (yaml.IsSequence()) {
      for (const auto& model : yaml) {
        LoadModel(model, abs_path, &modelfile);
      }
    } else if (yaml.IsMap()) {
      LoadModel(yaml, abs_path, &modelfile);
    } else if (!yaml.IsNull()) {
      throw ModelfileError("modelfile must contain a model or a list of models");
    }
  } catch (const YAML::Exception& e) {
    throw ModelfileError("Invalid modelfile " + abs_path.string() + ": " + e.what());
  }

  return modelfile;
}

} // namespace runtrack::model
