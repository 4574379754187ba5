#pragma once

#include <map>
#include <string>
#include <vector>

namespace runtrack::model {

using EnvMap = std::map<std::string, std::string>;

/*
  Argument vector and environment computed for an operation before any
  run exists. Recorded verbatim as the run's "cmd" and "env" attributes.
*/
struct CommandInvocation {
  std::vector<std::string> args;
  EnvMap                   env;
};

} // namespace runtrack::model
