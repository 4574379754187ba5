#pragma once

#include <string>
#include <vector>

#include "internal/plugin/plugin.hpp"

namespace runtrack::plugin {

/*
  Plugin whose decision is fixed by configuration.
*/
class ConfiguredPlugin final : public Plugin {
 public:
  ConfiguredPlugin(std::string name, bool enabled, std::string reason);

  std::string Name() const override {
    return name_;
  }

  PluginDecision EnabledForOperation(const model::OpDef& opdef) const override;

 private:
  std::string name_;
  bool        enabled_;
  std::string reason_;
};

class PluginRegistry final : public PluginProvider {
 public:
  // Replaces any plugin registered under the same name.
  void Register(PluginPtr plugin);

  std::vector<PluginPtr> Plugins() const override {
    return plugins_;
  }

 private:
  std::vector<PluginPtr> plugins_;
};

} // namespace runtrack::plugin
