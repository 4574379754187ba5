#pragma once

#include <string>

#include "config/config.pb.h"

namespace runtrack::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Fields left
  empty by the file are filled from Defaults().
*/
class ConfigLoader {
 public:
  static runtrack::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static runtrack::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(runtrack::runtime::config::RuntimeConfig* config);
};

} // namespace runtrack::config
