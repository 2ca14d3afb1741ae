#pragma once

#include <string>
#include <vector>

#include "internal/registry/task_id.hpp"

namespace proposal::planner {

using Level     = std::vector<registry::TaskId>;
using LevelPlan = std::vector<Level>;

enum class PlanKind {
  kStatic,
  kComputed,
};

/*
  Full generation layout:

      [title] -> [every other non-sink task] -> [sink]

  Each level is filtered to `tasks`; empty levels are dropped. Content
  tasks of the middle level share one snapshot even where they depend on
  each other, so they build on upstream sections from earlier runs.
*/
LevelPlan PlanStatic(registry::TaskSet tasks);

/*
  Edit layout: level(T) = 0 without in-set dependencies, otherwise
  1 + max(level(D)) over in-set dependencies D.
*/
LevelPlan PlanComputed(registry::TaskSet tasks);

/*
  Throws util::InvalidState when
    - a level is empty or a task is scheduled twice
    - kComputed: a task runs no later than one of its in-plan dependencies
    - kStatic: title is not alone up front or the sink not alone at the end
*/
void ValidatePlan(const LevelPlan& plan, PlanKind kind);

registry::TaskSet PlanTasks(const LevelPlan& plan);

// "[title] -> [scope_refinement, business_analyst]"
std::string DescribePlan(const LevelPlan& plan);

} // namespace proposal::planner
