#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/operation.hpp"
#include "internal/factory.hpp"
#include "internal/model/modelfile_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/opref/op_ref.hpp"
#include "internal/run/run.hpp"

using runtrack::observability::StringField;

namespace {

constexpr char kUsage[] =
    "Usage: runtrack [--config <config.yaml>] run <modelfile> <[[pkg/]model:]op> [name=value ...]\n"
    "       runtrack [--config <config.yaml>] opref <run-dir>";

int RunOperation(const runtrack::runtime::config::RuntimeConfig& config, const std::vector<std::string>& args) {
  auto modelfile = runtrack::model::ModelfileLoader::LoadFromYaml(args[0]);
  auto parsed    = runtrack::opref::FromFreeString(args[1]);
  if (!parsed.extra.empty()) {
    RUNTRACK_LOG_WARN("ignoring trailing text in operation reference", {StringField("extra", parsed.extra)});
  }

  auto opdef = modelfile.FindOperation(parsed.ref.model_name, *parsed.ref.op_name);
  for (size_t i = 2; i < args.size(); ++i) {
    const auto eq = args[i].find('=');
    if (eq == std::string::npos || eq == 0) {
      throw std::invalid_argument("invalid flag '" + args[i] + "', expected name=value");
    }
    opdef.flags[args[i].substr(0, eq)] = runtrack::model::ParseFlagValue(args[i].substr(eq + 1));
  }

  runtrack::core::Operation op(std::move(opdef), runtrack::factory::BuildContext(config));
  const int exit_status = op.Run();
  RUNTRACK_LOG_INFO("operation finished",
                    {StringField("run", op.CurrentRun()->Id()), runtrack::observability::IntField("exit_status", exit_status)});
  return exit_status;
}

int PrintOpRef(const std::string& run_dir) {
  const auto run = runtrack::run::Run::FromPath(run_dir);
  const auto ref = runtrack::opref::OpRef::FromRunAttribute(run);

  auto field = [](const std::optional<std::string>& value) { return value ? *value : std::string("?"); };
  std::cout << "pkg_type=" << field(ref.pkg_type) << "\n"
            << "pkg_name=" << field(ref.pkg_name) << "\n"
            << "pkg_version=" << field(ref.pkg_version) << "\n"
            << "model_name=" << field(ref.model_name) << "\n"
            << "op_name=" << field(ref.op_name) << std::endl;
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::optional<std::string> config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.empty() || (args[0] == "run" && args.size() < 3) || (args[0] == "opref" && args.size() != 2) ||
      (args[0] != "run" && args[0] != "opref")) {
    std::cerr << kUsage << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path ? runtrack::config::ConfigLoader::LoadFromYaml(*config_path) : runtrack::config::ConfigLoader::Defaults();

    runtrack::observability::InitializeLogging(config);

    const std::string command = args[0];
    args.erase(args.begin());

    int exit_status = command == "run" ? RunOperation(config, args) : PrintOpRef(args[0]);

    runtrack::observability::ShutdownLogging();

    // Children killed by signal N report -N; exit like a shell would.
    return exit_status < 0 ? 128 - exit_status : exit_status;
  } catch (const std::exception& e) {
    RUNTRACK_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    runtrack::observability::ShutdownLogging();
    return 2;
  }
}
