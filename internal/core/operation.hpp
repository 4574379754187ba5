#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/deps/dependency_resolver.hpp"
#include "internal/model/command.hpp"
#include "internal/model/opdef.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/plugin/plugin.hpp"
#include "internal/process/process_supervisor.hpp"
#include "internal/run/run.hpp"
#include "internal/storage/storage_provider.hpp"

namespace runtrack::core {

/*
  Collaborators shared by all operations of a process.
*/
struct OperationContext {
  std::shared_ptr<const storage::StorageProvider> storage;
  std::shared_ptr<const plugin::PluginProvider>   plugins;
  std::shared_ptr<deps::DependencyResolver>       resolver;
  std::shared_ptr<process::ProcessSupervisor>     supervisor;
  runtrack::runtime::config::RuntimeSettings      runtime;
};

/*
  One execution of one operation.

  Run() sequences:
    1. allocate run id + directory, init skeleton
    2. write opref, flags, cmd, env, started
    3. resolve dependencies into the run directory
    4. spawn {cmd} --rundir <run> with RUNDIR=<run>, cwd <run>
    5. wait, then write exit_status, stopped

  A failure before 4 leaves the written attributes in place and no
  process is started. An Operation runs at most once.
*/
class Operation {
 public:
  // Builds the command eagerly; throws util::InvalidCommand.
  Operation(model::OpDef opdef, OperationContext context);

  Operation(const Operation&)            = delete;
  Operation& operator=(const Operation&) = delete;

  // Returns the child's exit status. Throws util::OperationAlreadyRun on reuse.
  int Run();

  const model::OpDef& Definition() const {
    return opdef_;
  }

  const model::CommandInvocation& Command() const {
    return cmd_;
  }

  model::ExecutionState State() const {
    return state_;
  }

  // Set once Run() allocated the run.
  const std::optional<run::Run>& CurrentRun() const {
    return run_;
  }

 private:
  void InitRun();
  void InitAttrs();
  void ResolveDeps();
  void StartProc();
  void WaitForProc();
  void FinalizeAttrs();

  std::string              OpRefAttr() const;
  std::vector<std::string> ProcArgs() const;
  model::EnvMap            ProcEnv() const;

  model::OpDef             opdef_;
  OperationContext         context_;
  model::CommandInvocation cmd_;

  model::ExecutionState       state_ = model::ExecutionState::kNotStarted;
  std::optional<run::Run>     run_;
  process::ProcessHandle      proc_;
  std::optional<int>          exit_status_;
  std::int64_t                started_ = 0;
  std::optional<std::int64_t> stopped_;
};

} // namespace runtrack::core
