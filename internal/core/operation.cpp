#include "internal/core/operation.hpp"

#include <stdexcept>
#include <system_error>

#include "internal/command/command_builder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/opref/op_ref.hpp"
#include "internal/storage/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/run_id.hpp"
#include "internal/util/time.hpp"

namespace runtrack::core {

using runtrack::observability::StringField;

namespace {

constexpr char kLockName[] = "LOCK";

std::string JoinArgs(const std::vector<std::string>& args) {
  std::string joined;
  for (const auto& arg : args) {
    if (!joined.empty()) {
      joined.push_back(' ');
    }
    joined += arg;
  }
  return joined;
}

std::string JoinEnv(const model::EnvMap& env) {
  std::string joined;
  for (const auto& [name, value] : env) {
    if (!joined.empty()) {
      joined.push_back(' ');
    }
    joined += name + "=" + value;
  }
  return joined;
}

} // namespace

Operation::Operation(model::OpDef opdef, OperationContext context) : opdef_(std::move(opdef)), context_(std::move(context)) {
  if (!context_.storage || !context_.resolver || !context_.supervisor) {
    throw std::invalid_argument("operation context is incomplete");
  }
  command::CommandBuilder builder(context_.runtime, context_.plugins, context_.storage);
  cmd_ = builder.Build(opdef_);
}

int Operation::Run() {
  if (state_ != model::ExecutionState::kNotStarted) {
    throw util::OperationAlreadyRun("operation '" + opdef_.name + "' is " + model::ToString(state_) + " and cannot run again");
  }
  state_ = model::ExecutionState::kRunning;

  try {
    started_ = util::ToUnixSeconds(util::Now());
    InitRun();
    InitAttrs();
    ResolveDeps();
    StartProc();
    WaitForProc();
    FinalizeAttrs();
  } catch (...) {
    state_ = model::ExecutionState::kFinished;
    throw;
  }

  state_ = model::ExecutionState::kFinished;
  return *exit_status_;
}

void Operation::InitRun() {
  auto id   = util::UniqueRunId();
  auto path = storage::RunPath(context_.storage->RunsDir(), id);
  run_.emplace(std::move(id), std::move(path));
  RUNTRACK_LOG_DEBUG("initializing run", {StringField("path", run_->Path().string())});
  run_->InitSkeleton();
}

void Operation::InitAttrs() {
  run_->WriteAttr("opref", OpRefAttr());
  run_->WriteAttr("flags", opdef_.FlagValues());
  run_->WriteAttr("cmd", cmd_.args);
  run_->WriteAttr("env", cmd_.env);
  run_->WriteAttr("started", started_);
}

std::string Operation::OpRefAttr() const {
  const auto model_ref = opdef_.modeldef ? opdef_.modeldef->reference : model::ModelRef{};
  return opref::OpRef::FromOperation(opdef_.name, model_ref).ToString();
}

void Operation::ResolveDeps() {
  deps::ResolutionContext ctx{run_->Path(), opdef_};
  context_.resolver->Resolve(opdef_.dependencies, ctx);
}

void Operation::StartProc() {
  const auto args = ProcArgs();
  const auto env  = ProcEnv();
  const auto cwd  = run_->Path();

  RUNTRACK_LOG_DEBUG("starting operation run", {StringField("run", run_->Id())});
  RUNTRACK_LOG_DEBUG("operation command", {StringField("args", JoinArgs(args))});
  RUNTRACK_LOG_DEBUG("operation env", {StringField("env", JoinEnv(env))});
  RUNTRACK_LOG_DEBUG("operation cwd", {StringField("cwd", cwd.string())});

  proc_ = context_.supervisor->Spawn(args, env, cwd, run_->MetaPath(kLockName));
}

std::vector<std::string> Operation::ProcArgs() const {
  auto args = cmd_.args;
  args.push_back("--rundir");
  args.push_back(run_->Path().string());
  return args;
}

model::EnvMap Operation::ProcEnv() const {
  auto env      = cmd_.env;
  env["RUNDIR"] = run_->Path().string();
  return env;
}

void Operation::WaitForProc() {
  try {
    exit_status_ = context_.supervisor->Await(proc_);
  } catch (const std::system_error&) {
    // Exit status is lost; still record when supervision ended.
    stopped_ = util::ToUnixSeconds(util::Now());
    run_->WriteAttr("stopped", *stopped_);
    throw;
  }
  stopped_ = util::ToUnixSeconds(util::Now());
}

void Operation::FinalizeAttrs() {
  run_->WriteAttr("exit_status", static_cast<std::int64_t>(*exit_status_));
  run_->WriteAttr("stopped", *stopped_);
}

} // namespace runtrack::core
