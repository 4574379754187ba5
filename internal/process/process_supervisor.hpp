#pragma once

#include <sys/types.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "internal/model/command.hpp"
#include "internal/model/state_machine.hpp"

namespace runtrack::process {

struct ProcessHandle {
  pid_t                 pid = -1;
  std::filesystem::path lock_path;
  model::ProcessState   state = model::ProcessState::kNotStarted;
};

/*
  Starts and awaits one child process at a time per handle.

  Spawn writes the child's pid to `lock_path` once the exec succeeded;
  Await removes it after the child is reaped. A crash of this process
  in between leaves a stale lock behind.
*/
class ProcessSupervisor {
 public:
  virtual ~ProcessSupervisor() = default;

  /*
    Throws util::SpawnError when the executable cannot be started or the
    lock cannot be written. No lock exists afterwards in either case.
  */
  virtual ProcessHandle Spawn(const std::vector<std::string>& args, const model::EnvMap& env, const std::filesystem::path& cwd,
                              const std::filesystem::path& lock_path);

  /*
    Blocks until the child exits. Returns the exit code, or -N when the
    child was killed by signal N.
  */
  virtual int Await(ProcessHandle& handle);
};

using ProcessSupervisorPtr = std::shared_ptr<ProcessSupervisor>;

} // namespace runtrack::process
