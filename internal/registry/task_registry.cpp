#include "task_registry.hpp"

#include <string>

#include "internal/tasks/task.hpp"
#include "internal/util/errors.hpp"

namespace proposal::registry {

TaskRegistry::TaskRegistry()  = default;
TaskRegistry::~TaskRegistry() = default;

void TaskRegistry::Register(std::unique_ptr<tasks::Task> task) {
  if (!task) throw util::InvalidState("cannot register a null task");

  auto& slot = tasks_[static_cast<std::size_t>(task->id())];
  if (slot) {
    throw util::InvalidState("task already registered: " + std::string(TaskName(task->id())));
  }
  slot = std::move(task);
}

const tasks::Task& TaskRegistry::Get(TaskId id) const {
  const auto& slot = tasks_[static_cast<std::size_t>(id)];
  if (!slot) throw util::UnknownTask("no implementation registered for " + std::string(TaskName(id)));
  return *slot;
}

bool TaskRegistry::Contains(TaskId id) const {
  return tasks_[static_cast<std::size_t>(id)] != nullptr;
}

TaskSet TaskRegistry::Registered() const {
  TaskSet out;
  for (const auto& d : kTaskDescriptors) {
    if (Contains(d.id)) out.Insert(d.id);
  }
  return out;
}

} // namespace proposal::registry
