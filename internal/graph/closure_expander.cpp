#include "closure_expander.hpp"

#include <deque>

#include "internal/graph/dependency_graph.hpp"
#include "internal/observability/logging.hpp"

namespace proposal::graph {

using registry::TaskId;
using registry::TaskSet;

std::string_view RequestKindName(RequestKind kind) {
  switch (kind) {
    case RequestKind::kFullGeneration:
      return "full_generation";
    case RequestKind::kEdit:
      return "edit";
  }
  return "unknown";
}

TaskSet Expand(const ExpansionRequest& request) {
  if (request.kind == RequestKind::kEdit && request.requested.Size() == 1) {
    PROPOSAL_LOG_DEBUG("closure skipped for single-task edit",
                       {observability::StringField("task", registry::TaskName(request.requested.ToVector().front()))});
    return request.requested;
  }

  const TaskSet sinks = registry::SinkTasks();

  TaskSet included = request.requested;
  std::deque<TaskId> frontier;
  for (auto id : request.requested.ToVector()) {
    frontier.push_back(id);
  }

  while (!frontier.empty()) {
    const TaskId current = frontier.front();
    frontier.pop_front();

    for (auto next : Dependents(current).ToVector()) {
      if (sinks.Contains(next) || included.Contains(next)) continue;
      included.Insert(next);
      frontier.push_back(next);
    }
  }

  PROPOSAL_LOG_DEBUG("closure expanded",
                     {observability::StringField("kind", RequestKindName(request.kind)),
                      observability::IntField("requested", static_cast<std::int64_t>(request.requested.Size())),
                      observability::IntField("expanded", static_cast<std::int64_t>(included.Size())),
                      observability::BoolField("generated_before", request.generated_before)});

  return included;
}

} // namespace proposal::graph
