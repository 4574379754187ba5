#include "internal/model/modelfile_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <variant>

#include "internal/opref/op_ref.hpp"
#include "internal/util/errors.hpp"

namespace {

using runtrack::model::ModelfileLoader;

std::filesystem::path WriteModelfile(const std::string& test_name, const std::string& yaml_content) {
  const auto dir = std::filesystem::temp_directory_path() / "runtrack_modelfile_loader_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);

  const auto    file_path = dir / "runtrack.yml";
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

constexpr char kTwoModels[] = R"(- name: mnist
  package: mnist-pkg
  version: 1.2
  disabled-plugins: [gpu]
  operations:
    train:
      cmd: train.py --epochs 2
      flags:
        lr: 0.1
        batch: 32
        fast: true
        tag: "007"
        resume:
      requires:
        - data/train.csv
      runtime:
        interpreter: /usr/bin/python3
    evaluate:
      cmd: [eval.py, --split, test]
      disabled-plugins: [all]
- name: cifar
  operations:
    train:
      cmd:
        script: bad
)";

void TestModelsAndOperationsAreLoaded() {
  const auto path      = WriteModelfile("two_models", kTwoModels);
  const auto modelfile = ModelfileLoader::LoadFromYaml(path);

  assert(modelfile.models.size() == 2);
  assert(modelfile.operations.size() == 3);

  const auto& mnist = *modelfile.models[0];
  assert(mnist.reference.pkg_type == std::optional<std::string>("modelfile"));
  assert(mnist.reference.pkg_name == std::optional<std::string>("mnist-pkg"));
  assert(mnist.reference.pkg_version == std::optional<std::string>("1.2"));
  assert(mnist.reference.model_name == std::optional<std::string>("mnist"));
  assert(mnist.disabled_plugins.size() == 1);

  const auto& cifar = *modelfile.models[1];
  assert(cifar.reference.pkg_name == std::optional<std::string>(path.parent_path().string()));
  assert(!cifar.reference.pkg_version);

  const auto& train = modelfile.FindOperation(std::string("mnist"), "train");
  assert(std::get<runtrack::model::ShellCommand>(train.cmd).text == "train.py --epochs 2");
  assert(std::get<double>(train.flags.at("lr")) == 0.1);
  assert(std::get<std::int64_t>(train.flags.at("batch")) == 32);
  assert(std::get<bool>(train.flags.at("fast")));
  assert(std::get<std::string>(train.flags.at("tag")) == "007");
  assert(runtrack::model::IsNone(train.flags.at("resume")));
  assert(train.dependencies.size() == 1 && train.dependencies[0] == "data/train.csv");
  assert(*train.runtime.interpreter == "/usr/bin/python3");
  assert(!train.runtime.module_flag);
  assert(train.SourceDir() == path.parent_path());

  const auto& evaluate = modelfile.FindOperation(std::nullopt, "evaluate");
  assert(std::get<runtrack::model::TokenCommand>(evaluate.cmd).tokens.size() == 3);
  assert(evaluate.modeldef->name == "mnist");

  const auto& cifar_train = modelfile.FindOperation(std::string("cifar"), "train");
  assert(std::holds_alternative<std::monostate>(cifar_train.cmd));
}

void TestAmbiguousOrUnknownOperationIsNotFound() {
  const auto modelfile = ModelfileLoader::LoadFromYaml(WriteModelfile("lookup", kTwoModels));

  bool threw = false;
  try {
    (void)modelfile.FindOperation(std::nullopt, "train");
  } catch (const runtrack::util::NotFound&) {
    threw = true;
  }
  assert(threw && "unqualified op defined by two models must be ambiguous");

  threw = false;
  try {
    (void)modelfile.FindOperation(std::string("mnist"), "deploy");
  } catch (const runtrack::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestModelWithoutNameIsRejected() {
  const auto path = WriteModelfile("no_name", R"(operations:
  train:
    cmd: train.py
)");

  bool threw = false;
  try {
    (void)ModelfileLoader::LoadFromYaml(path);
  } catch (const runtrack::util::ModelfileError&) {
    threw = true;
  }
  assert(threw);
}

void TestPackageKeyKeepsOprefReadableInSpacedDirectory() {
  using runtrack::opref::OpRef;

  const auto unnamed = ModelfileLoader::LoadFromYaml(WriteModelfile("spaced dir", R"(name: mnist
operations:
  train:
    cmd: train.py
)"));
  const auto spaced = OpRef::FromOperation("train", unnamed.models.at(0)->reference).ToString();

  bool threw = false;
  try {
    (void)OpRef::FromCanonical(spaced, "test");
  } catch (const runtrack::util::ReferenceError&) {
    threw = true;
  }
  assert(threw);

  const auto named = ModelfileLoader::LoadFromYaml(WriteModelfile("spaced dir", R"(name: mnist
package: vision
operations:
  train:
    cmd: train.py
)"));
  const auto ref = OpRef::FromOperation("train", named.models.at(0)->reference);
  assert(OpRef::FromCanonical(ref.ToString(), "test") == ref);
}

} // namespace

int main() {
  TestModelsAndOperationsAreLoaded();
  TestAmbiguousOrUnknownOperationIsNotFound();
  TestModelWithoutNameIsRejected();
  TestPackageKeyKeepsOprefReadableInSpacedDirectory();

  std::cout << "runtrack_unit_modelfile_loader: pass\n";
  return 0;
}
