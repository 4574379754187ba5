#include "internal/process/process_supervisor.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace runtrack::process {

using runtrack::observability::IntField;
using runtrack::observability::StringField;

namespace {

std::vector<char*> CStrings(std::vector<std::string>& values) {
  std::vector<char*> out;
  out.reserve(values.size() + 1);
  for (auto& value : values) {
    out.push_back(value.data());
  }
  out.push_back(nullptr);
  return out;
}

pid_t WaitFor(pid_t pid, int* status) {
  pid_t res;
  do {
    res = waitpid(pid, status, 0);
  } while (res == -1 && errno == EINTR);
  return res;
}

// Child side of fork: only async-signal-safe calls from here on.
[[noreturn]] void ExecChild(const std::string& cwd, char** argv, char** envp, int error_fd) {
  int err = 0;
  if (chdir(cwd.c_str()) != 0) {
    err = errno;
  } else {
    execvpe(argv[0], argv, envp);
    err = errno;
  }
  ssize_t ignored = write(error_fd, &err, sizeof(err));
  (void)ignored;
  _exit(127);
}

} // namespace

ProcessHandle ProcessSupervisor::Spawn(const std::vector<std::string>& args, const model::EnvMap& env, const std::filesystem::path& cwd,
                                       const std::filesystem::path& lock_path) {
  if (args.empty()) {
    throw util::SpawnError("cannot spawn an empty command");
  }

  std::vector<std::string> arg_storage = args;
  std::vector<std::string> env_storage;
  env_storage.reserve(env.size());
  for (const auto& [name, value] : env) {
    env_storage.push_back(name + "=" + value);
  }
  auto argv = CStrings(arg_storage);
  auto envp = CStrings(env_storage);
  const auto cwd_str = cwd.string();

  // Reports exec failure; closes on successful exec.
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) != 0) {
    throw util::SpawnError(std::string("pipe failed: ") + std::strerror(errno));
  }

  pid_t pid = fork();
  if (pid == -1) {
    const int err = errno;
    close(fds[0]);
    close(fds[1]);
    throw util::SpawnError(std::string("fork failed: ") + std::strerror(err));
  }
  if (pid == 0) {
    close(fds[0]);
    ExecChild(cwd_str, argv.data(), envp.data(), fds[1]);
  }

  close(fds[1]);
  int     child_errno = 0;
  ssize_t n;
  do {
    n = read(fds[0], &child_errno, sizeof(child_errno));
  } while (n == -1 && errno == EINTR);
  close(fds[0]);

  if (n > 0) {
    int status = 0;
    WaitFor(pid, &status);
    throw util::SpawnError("cannot start '" + args.front() + "' in " + cwd_str + ": " + std::strerror(child_errno));
  }

  {
    std::ofstream lock(lock_path, std::ios::trunc);
    lock << pid;
    lock.close();
    if (!lock) {
      kill(pid, SIGKILL);
      int status = 0;
      WaitFor(pid, &status);
      std::error_code ec;
      std::filesystem::remove(lock_path, ec);
      throw util::SpawnError("cannot write process lock " + lock_path.string());
    }
  }

  RUNTRACK_LOG_DEBUG("process started", {IntField("pid", pid), StringField("lock", lock_path.string())});
  return ProcessHandle{pid, lock_path, model::ProcessState::kRunning};
}

int ProcessSupervisor::Await(ProcessHandle& handle) {
  if (handle.state != model::ProcessState::kRunning) {
    throw std::logic_error("process is not running");
  }

  int         status     = 0;
  const pid_t res        = WaitFor(handle.pid, &status);
  const int   wait_errno = errno;
  handle.state           = model::ProcessState::kTerminated;

  // Already removed is fine.
  std::error_code ec;
  std::filesystem::remove(handle.lock_path, ec);

  if (res == -1) {
    throw std::system_error(wait_errno, std::generic_category(), "waitpid for " + std::to_string(handle.pid) + " failed");
  }

  int exit_status = 0;
  if (WIFEXITED(status)) {
    exit_status = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit_status = -WTERMSIG(status);
  }

  RUNTRACK_LOG_DEBUG("process exited", {IntField("pid", handle.pid), IntField("exit_status", exit_status)});
  return exit_status;
}

} // namespace runtrack::process
