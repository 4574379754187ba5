#pragma once

#include <cstdint>

namespace runtrack::model {

// Lifecycle of one Operation object. An operation runs at most once.
enum class ExecutionState : std::uint8_t {
  kNotStarted = 0,
  kRunning    = 1,
  kFinished   = 2,
};

// Lifecycle of one supervised child. The lock file exists exactly while kRunning.
enum class ProcessState : std::uint8_t {
  kNotStarted = 0,
  kRunning    = 1,
  kTerminated = 2,
};

constexpr const char* ToString(ExecutionState state) {
  switch (state) {
    case ExecutionState::kNotStarted:
      return "not-started";
    case ExecutionState::kRunning:
      return "running";
    case ExecutionState::kFinished:
      return "finished";
  }
  return "unknown";
}

}  // namespace runtrack::model
