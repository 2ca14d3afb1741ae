#pragma once

#include <cstddef>
#include <string>

#include "internal/registry/task_id.hpp"
#include "internal/state/project_state.hpp"

namespace proposal::tasks {

struct TaskContext {
  std::string pipeline;
  std::size_t level_index = 0;
};

/*
  A named unit of work.

  Run() reads an immutable snapshot of the project state and returns the
  keys it owns (see registry::kTaskDescriptors). Implementations are
  shared across worker threads and must not keep per-run state.
*/
class Task {
 public:
  virtual ~Task() = default;

  virtual registry::TaskId id() const = 0;

  virtual state::StateUpdate Run(const state::ProjectState& snapshot, TaskContext& context) const = 0;
};

} // namespace proposal::tasks
