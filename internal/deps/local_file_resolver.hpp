#pragma once

#include "internal/deps/dependency_resolver.hpp"

namespace runtrack::deps {

/*
  Links local files into the run directory.

  Each dependency is a path, relative to the operation's source
  directory unless absolute. It is symlinked into the target dir under
  its basename.
*/
class LocalFileResolver final : public DependencyResolver {
 public:
  void Resolve(const std::vector<std::string>& dependencies, const ResolutionContext& ctx) override;
};

} // namespace runtrack::deps
