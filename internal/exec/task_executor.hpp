#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>

#include "internal/planner/level_planner.hpp"
#include "internal/state/project_state.hpp"

namespace proposal::registry {
class TaskRegistry;
}

namespace proposal::exec {

class WorkerPool;

// Called on the orchestrating thread right after a task's update is merged.
using CompletionHook = std::function<void(registry::TaskId id, const state::ProjectState& merged)>;

/*
  Runs one level at a time on the shared worker pool.

  Every task of a level reads the same snapshot taken at level start.
  Updates are merged into the caller's state in completion order on the
  calling thread, which is the only writer. A failing task does not
  cancel its siblings: their updates are still merged and the first
  failure is thrown as util::TaskExecutionError once all have settled.
*/
class TaskExecutor {
 public:
  TaskExecutor(std::shared_ptr<WorkerPool> pool, std::shared_ptr<const registry::TaskRegistry> registry);

  std::map<registry::TaskId, state::StateUpdate> RunLevel(const planner::Level& level,
                                                          state::ProjectState& state,
                                                          const std::string& pipeline,
                                                          std::size_t level_index,
                                                          const CompletionHook& hook = {});

 private:
  std::shared_ptr<WorkerPool>                    pool_;
  std::shared_ptr<const registry::TaskRegistry> registry_;
};

} // namespace proposal::exec
