#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/opdef.hpp"

namespace runtrack::deps {

struct ResolutionContext {
  std::filesystem::path target_dir;
  const model::OpDef&   opdef;
};

/*
  Materializes an operation's declared dependencies into the run
  directory before the process starts.

  Throws util::DependencyError on failure; the run is then abandoned.
*/
class DependencyResolver {
 public:
  virtual ~DependencyResolver() = default;

  virtual void Resolve(const std::vector<std::string>& dependencies, const ResolutionContext& ctx) = 0;
};

using DependencyResolverPtr = std::shared_ptr<DependencyResolver>;

} // namespace runtrack::deps
