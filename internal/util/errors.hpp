#pragma once

#include <stdexcept>
#include <string>

namespace runtrack::util {

/*
  Central error types.

  Everything raised before a child process exists means the run never
  started. The CLI maps all of them to a fatal exit.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidCommand : public std::runtime_error {
 public:
  explicit InvalidCommand(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ReferenceError : public std::runtime_error {
 public:
  explicit ReferenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DependencyError : public std::runtime_error {
 public:
  explicit DependencyError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SpawnError : public std::runtime_error {
 public:
  explicit SpawnError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ModelfileError : public std::runtime_error {
 public:
  explicit ModelfileError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Programming error: an Operation object was asked to run twice.
class OperationAlreadyRun : public std::logic_error {
 public:
  explicit OperationAlreadyRun(const std::string& msg) : std::logic_error(msg) {
  }
};

} // namespace runtrack::util
