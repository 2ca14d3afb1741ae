#pragma once

#include "internal/registry/task_id.hpp"

namespace proposal::graph {

using registry::TaskId;
using registry::TaskSet;

// Tasks `id` reads from (backward edges).
constexpr TaskSet Dependencies(TaskId id) {
  return registry::Describe(id).dependencies;
}

// Tasks that list `id` as a dependency (forward edges).
constexpr TaskSet Dependents(TaskId id) {
  TaskSet out;
  for (const auto& d : registry::kTaskDescriptors) {
    if (d.dependencies.Contains(id)) out.Insert(d.id);
  }
  return out;
}

// Union of Dependents() over every member of `ids`.
constexpr TaskSet Dependents(TaskSet ids) {
  TaskSet out;
  for (const auto& d : registry::kTaskDescriptors) {
    if (d.dependencies.Intersects(ids)) out.Insert(d.id);
  }
  return out;
}

static_assert(Dependencies(TaskId::kTitle).Empty());
static_assert(Dependents(TaskId::kTitle) == TaskSet{TaskId::kFinalCompilation});

} // namespace proposal::graph
