#include "internal/command/command_builder.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using runtrack::command::CommandBuilder;
using runtrack::model::FlagMap;
using runtrack::model::OpDef;
using runtrack::model::ShellCommand;
using runtrack::model::TokenCommand;
using Words = std::vector<std::string>;

class FakeStorage final : public runtrack::storage::StorageProvider {
 public:
  std::filesystem::path RunsDir() const override {
    return "/tmp/runs";
  }

  runtrack::model::EnvMap SafeEnvironment() const override {
    return {{"HOME", "/home/tester"}, {"PYTHONPATH", "/ambient"}};
  }
};

class FakePlugin final : public runtrack::plugin::Plugin {
 public:
  FakePlugin(std::string name, bool enabled) : name_(std::move(name)), enabled_(enabled) {
  }

  std::string Name() const override {
    return name_;
  }

  runtrack::plugin::PluginDecision EnabledForOperation(const OpDef&) const override {
    return {enabled_, enabled_ ? "" : "not applicable"};
  }

 private:
  std::string name_;
  bool        enabled_;
};

class FakePlugins final : public runtrack::plugin::PluginProvider {
 public:
  std::vector<runtrack::plugin::PluginPtr> Plugins() const override {
    return {std::make_shared<FakePlugin>("zeta", true), std::make_shared<FakePlugin>("alpha", true),
            std::make_shared<FakePlugin>("beta", true), std::make_shared<FakePlugin>("gamma", false)};
  }
};

runtrack::runtime::config::RuntimeSettings Settings() {
  runtrack::runtime::config::RuntimeSettings settings;
  settings.set_interpreter("python");
  settings.set_module_flag("-um");
  settings.set_entry_module("runtrack.op_main");
  settings.set_install_root("/opt/runtrack");
  settings.add_runfile_packages("org_psutil");
  settings.add_module_search_path("/usr/lib/py/org_psutil");
  settings.add_module_search_path("/usr/lib/py/other");
  return settings;
}

CommandBuilder MakeBuilder() {
  return CommandBuilder(Settings(), std::make_shared<FakePlugins>(), std::make_shared<FakeStorage>());
}

OpDef MakeOp(runtrack::model::CommandTemplate cmd, FlagMap flags = {}) {
  auto model       = std::make_shared<runtrack::model::ModelDef>();
  model->name      = "mnist";
  model->modelfile = "/work/proj/runtrack.yml";

  OpDef op;
  op.name     = "train";
  op.cmd      = std::move(cmd);
  op.flags    = std::move(flags);
  op.modeldef = model;
  return op;
}

bool ThrowsInvalidCommand(const OpDef& op) {
  try {
    (void)MakeBuilder().BuildArgs(op);
  } catch (const runtrack::util::InvalidCommand&) {
    return true;
  }
  return false;
}

void TestFlagsFollowCommandInNameOrder() {
  FlagMap flags{{"lr", 0.1}, {"epochs", std::int64_t{3}}, {"verbose", std::monostate{}}, {"data", std::string("a b")}};
  const auto args = MakeBuilder().BuildArgs(MakeOp(ShellCommand{"train.py --seed 1"}, flags));

  assert(args == (Words{"python", "-um", "runtrack.op_main", "train.py", "--seed", "1", "--data", "a b", "--epochs", "3", "--lr", "0.1",
                        "--verbose"}));
}

void TestFloatFlagsKeepFractionalForm() {
  FlagMap flags{{"lr", 1.0}, {"big", 1e20}, {"b", true}};
  const auto args = MakeBuilder().BuildArgs(MakeOp(ShellCommand{"train.py"}, flags));

  assert(args == (Words{"python", "-um", "runtrack.op_main", "train.py", "--b", "true", "--big", "1e+20", "--lr", "1.0"}));
}

void TestShadowedFlagsAreDropped() {
  FlagMap flags{{"lr", 0.1}, {"epochs", std::int64_t{3}}};

  const auto inline_value = MakeBuilder().BuildArgs(MakeOp(ShellCommand{"train.py --lr=0.5"}, flags));
  assert(std::count_if(inline_value.begin(), inline_value.end(), [](const std::string& a) { return a.rfind("--lr", 0) == 0; }) == 1);
  assert(std::find(inline_value.begin(), inline_value.end(), "--lr=0.5") != inline_value.end());
  assert(std::find(inline_value.begin(), inline_value.end(), "--epochs") != inline_value.end());

  const auto separate_value = MakeBuilder().BuildArgs(MakeOp(TokenCommand{{"train.py", "--lr", "0.5"}}, flags));
  assert(std::count(separate_value.begin(), separate_value.end(), "--lr") == 1);
  assert(std::find(separate_value.begin(), separate_value.end(), "0.1") == separate_value.end());
}

void TestEmptyOrMissingCommandIsInvalid() {
  assert(ThrowsInvalidCommand(MakeOp(ShellCommand{""})));
  assert(ThrowsInvalidCommand(MakeOp(ShellCommand{"   "})));
  assert(ThrowsInvalidCommand(MakeOp(TokenCommand{})));
  assert(ThrowsInvalidCommand(MakeOp(std::monostate{})));
}

void TestRuntimeOverrideReplacesPrefix() {
  auto op                = MakeOp(TokenCommand{{"x"}});
  op.runtime.interpreter = "/bin/sh";
  op.runtime.module_flag = "-c";

  const auto args = MakeBuilder().BuildArgs(op);
  assert(args == (Words{"/bin/sh", "-c", "runtrack.op_main", "x"}));
}

void TestEnvironmentCarriesPluginsLevelAndModulePath() {
  spdlog::set_level(spdlog::level::info);

  auto op             = MakeOp(ShellCommand{"train.py"});
  op.disabled_plugins = {"beta"};

  const auto env = MakeBuilder().BuildEnv(op);
  assert(env.at("HOME") == "/home/tester");
  assert(env.at("GUILD_PLUGINS") == "alpha,zeta");
  assert(env.at("LOG_LEVEL") == "20");
  assert(env.at("PYTHONPATH") == "/work/proj:/opt/runtrack:/usr/lib/py/org_psutil");
}

void TestModelCanDisableAllPlugins() {
  auto op    = MakeOp(ShellCommand{"train.py"});
  auto model = std::make_shared<runtrack::model::ModelDef>(*op.modeldef);

  model->disabled_plugins = {"all"};
  op.modeldef             = model;

  assert(MakeBuilder().BuildEnv(op).at("GUILD_PLUGINS").empty());
}

} // namespace

int main() {
  TestFlagsFollowCommandInNameOrder();
  TestFloatFlagsKeepFractionalForm();
  TestShadowedFlagsAreDropped();
  TestEmptyOrMissingCommandIsInvalid();
  TestRuntimeOverrideReplacesPrefix();
  TestEnvironmentCarriesPluginsLevelAndModulePath();
  TestModelCanDisableAllPlugins();

  std::cout << "runtrack_unit_command_builder: pass\n";
  return 0;
}
