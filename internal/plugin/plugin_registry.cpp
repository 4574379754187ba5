#include "internal/plugin/plugin_registry.hpp"

#include <algorithm>
#include <stdexcept>

namespace runtrack::plugin {

ConfiguredPlugin::ConfiguredPlugin(std::string name, bool enabled, std::string reason)
    : name_(std::move(name)), enabled_(enabled), reason_(std::move(reason)) {
}

PluginDecision ConfiguredPlugin::EnabledForOperation(const model::OpDef&) const {
  return {enabled_, reason_};
}

void PluginRegistry::Register(PluginPtr plugin) {
  if (!plugin) {
    throw std::invalid_argument("plugin must not be null");
  }
  const auto name = plugin->Name();
  auto       it   = std::find_if(plugins_.begin(), plugins_.end(), [&](const PluginPtr& p) { return p->Name() == name; });
  if (it != plugins_.end()) {
    *it = std::move(plugin);
    return;
  }
  plugins_.push_back(std::move(plugin));
}

} // namespace runtrack::plugin
