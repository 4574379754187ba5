#include "internal/run/run.hpp"

#include <cassert>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>

#include "internal/util/run_id.hpp"

namespace {

using runtrack::run::Run;

std::filesystem::path FreshDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "runtrack_run_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

void TestSkeletonCanOnlyBeInitializedOnce() {
  const auto dir = FreshDir("skeleton");
  Run        run("r1", dir / "r1");
  run.InitSkeleton();

  assert(std::filesystem::is_directory(dir / "r1" / ".runtrack" / "attrs"));
  assert(run.MetaPath("LOCK") == dir / "r1" / ".runtrack" / "LOCK");

  bool threw = false;
  try {
    run.InitSkeleton();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "InitSkeleton must not reinitialize a run.");
}

void TestAttributesPersistAndOverwrite() {
  const auto dir = FreshDir("attrs");
  Run        run("r2", dir / "r2");
  run.InitSkeleton();

  run.WriteAttr("started", std::int64_t{1700000000});
  run.WriteAttr("opref", std::string("modelfile:/p 1 m op"));
  run.WriteAttr("cmd", std::vector<std::string>{"python", "-um", "x", "--msg", "a: b"});
  run.WriteAttr("flags", runtrack::model::FlagMap{{"lr", 0.25}, {"verbose", std::monostate{}}, {"name", std::string("true")}});
  run.WriteAttr("env", runtrack::model::EnvMap{{"LOG_LEVEL", "20"}});

  assert(*run.GetInt("started") == 1700000000);
  assert(*run.GetString("opref") == "modelfile:/p 1 m op");

  auto cmd = run.GetAttr("cmd");
  assert(cmd && cmd->IsSequence() && cmd->size() == 5);
  assert((*cmd)[4].as<std::string>() == "a: b");

  auto flags = run.GetAttr("flags");
  assert((*flags)["lr"].as<double>() == 0.25);
  assert((*flags)["verbose"].IsNull());
  assert((*flags)["name"].as<std::string>() == "true");

  assert((*run.GetAttr("env"))["LOG_LEVEL"].as<std::string>() == "20");

  run.WriteAttr("started", std::int64_t{1700000001});
  assert(*run.GetInt("started") == 1700000001);

  assert(!run.HasAttr("exit_status"));
  assert(!run.GetInt("exit_status"));
  assert(!run.GetString("stopped"));
}

void TestAttributeNamesMustBePlainComponents() {
  const auto dir = FreshDir("names");
  Run        run("r3", dir / "r3");
  run.InitSkeleton();

  bool threw = false;
  try {
    run.WriteAttr("../escape", std::int64_t{1});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestFromPathUsesDirectoryNameAsId() {
  const auto dir = FreshDir("from_path");
  const auto run = Run::FromPath(dir / "abc123" / "");
  assert(run.Id() == "abc123");
  assert(run.Path() == dir / "abc123");
}

void TestRunIdsAreUniqueVersionOneHex() {
  std::set<std::string> ids;
  for (int i = 0; i < 1000; ++i) {
    const auto id = runtrack::util::UniqueRunId();
    assert(id.size() == 32);
    for (char c : id) {
      assert(std::isxdigit(static_cast<unsigned char>(c)) && !std::isupper(static_cast<unsigned char>(c)));
    }
    assert(id[12] == '1');
    ids.insert(id);
  }
  assert(ids.size() == 1000);
}

} // namespace

int main() {
  TestSkeletonCanOnlyBeInitializedOnce();
  TestAttributesPersistAndOverwrite();
  TestAttributeNamesMustBePlainComponents();
  TestFromPathUsesDirectoryNameAsId();
  TestRunIdsAreUniqueVersionOneHex();

  std::cout << "runtrack_unit_run: pass\n";
  return 0;
}
