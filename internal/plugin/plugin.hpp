#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/model/opdef.hpp"

namespace runtrack::plugin {

struct PluginDecision {
  bool        enabled = false;
  std::string reason;
};

/*
  A runtime capability the child process may activate. The set of
  enabled plugin names reaches the child through GUILD_PLUGINS.
*/
class Plugin {
 public:
  virtual ~Plugin() = default;

  virtual std::string Name() const = 0;

  virtual PluginDecision EnabledForOperation(const model::OpDef& opdef) const = 0;
};

using PluginPtr = std::shared_ptr<const Plugin>;

class PluginProvider {
 public:
  virtual ~PluginProvider() = default;

  virtual std::vector<PluginPtr> Plugins() const = 0;
};

using PluginProviderPtr = std::shared_ptr<const PluginProvider>;

} // namespace runtrack::plugin
