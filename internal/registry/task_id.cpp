#include "task_id.hpp"

namespace proposal::registry {

std::vector<TaskId> TaskSet::ToVector() const {
  std::vector<TaskId> out;
  out.reserve(Size());
  for (const auto& d : kTaskDescriptors) {
    if (Contains(d.id)) out.push_back(d.id);
  }
  return out;
}

std::optional<TaskId> ParseTaskId(std::string_view name) {
  for (const auto& d : kTaskDescriptors) {
    if (d.name == name) return d.id;
  }
  return std::nullopt;
}

} // namespace proposal::registry
