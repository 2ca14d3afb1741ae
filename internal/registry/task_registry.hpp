#pragma once

#include <array>
#include <memory>

#include "internal/registry/task_id.hpp"

namespace proposal::tasks {
class Task;
}

namespace proposal::registry {

/*
  TaskId -> implementation.

  Filled once by the composition root and read-only afterwards.
*/
class TaskRegistry {
 public:
  TaskRegistry();
  ~TaskRegistry();

  // Throws util::InvalidState if the id is already registered.
  void Register(std::unique_ptr<tasks::Task> task);

  // Throws util::UnknownTask if nothing is registered for `id`.
  const tasks::Task& Get(TaskId id) const;

  bool Contains(TaskId id) const;

  TaskSet Registered() const;

 private:
  std::array<std::unique_ptr<tasks::Task>, kTaskCount> tasks_;
};

} // namespace proposal::registry
