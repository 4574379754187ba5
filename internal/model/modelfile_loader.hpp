#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/opdef.hpp"

namespace runtrack::model {

struct Modelfile {
  std::filesystem::path                        path;
  std::vector<std::shared_ptr<const ModelDef>> models;
  std::vector<OpDef>                           operations;

  /*
    Look up an operation. Without a model name the operation name must
    be unique across all models in the file.

    Throws util::NotFound.
  */
  const OpDef& FindOperation(const std::optional<std::string>& model_name, const std::string& op_name) const;
};

/*
  Loads model and operation definitions from a YAML modelfile.

  Throws util::ModelfileError on unreadable or malformed input.
*/
class ModelfileLoader {
 public:
  static Modelfile LoadFromYaml(const std::filesystem::path& path);
};

} // namespace runtrack::model
