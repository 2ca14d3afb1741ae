#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace proposal::util {

/*
  Central error types.

  These get translated at the pipeline boundary to a portable Result
  (see result.hpp).
*/

class UnknownTask : public std::runtime_error {
 public:
  explicit UnknownTask(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PrerequisiteFailed : public std::runtime_error {
 public:
  explicit PrerequisiteFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RoutingParseError : public std::runtime_error {
 public:
  explicit RoutingParseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  A task body raised while its level was running.

  task_name() is the registry name of the first task that failed.
*/
class TaskExecutionError : public std::runtime_error {
 public:
  TaskExecutionError(std::string task_name, const std::string& msg)
      : std::runtime_error("task " + task_name + " failed: " + msg), task_name_(std::move(task_name)) {
  }

  const std::string& task_name() const {
    return task_name_;
  }

 private:
  std::string task_name_;
};

} // namespace proposal::util
