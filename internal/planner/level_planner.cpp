#include "level_planner.hpp"

#include <algorithm>
#include <array>
#include <sstream>

#include "internal/graph/dependency_graph.hpp"
#include "internal/util/errors.hpp"

namespace proposal::planner {

using registry::TaskId;
using registry::TaskSet;

namespace {

void AppendIfNotEmpty(LevelPlan& plan, TaskSet level) {
  if (!level.Empty()) plan.push_back(level.ToVector());
}

} // namespace

LevelPlan PlanStatic(TaskSet tasks) {
  const TaskSet sinks = registry::SinkTasks();
  const TaskSet first{TaskId::kTitle};

  TaskSet middle;
  for (const auto& d : registry::kTaskDescriptors) {
    if (!sinks.Contains(d.id) && !first.Contains(d.id)) middle.Insert(d.id);
  }

  LevelPlan plan;
  AppendIfNotEmpty(plan, first.Intersection(tasks));
  AppendIfNotEmpty(plan, middle.Intersection(tasks));
  AppendIfNotEmpty(plan, sinks.Intersection(tasks));
  return plan;
}

LevelPlan PlanComputed(TaskSet tasks) {
  std::array<std::size_t, registry::kTaskCount> levels{};
  std::size_t deepest = 0;

  // Dependencies always precede a task in canonical order, so one pass
  // sees every dependency's level before the dependent's.
  const auto members = tasks.ToVector();
  for (auto id : members) {
    std::size_t level = 0;
    for (auto dep : graph::Dependencies(id).Intersection(tasks).ToVector()) {
      level = std::max(level, levels[static_cast<std::size_t>(dep)] + 1);
    }
    levels[static_cast<std::size_t>(id)] = level;
    deepest = std::max(deepest, level);
  }

  LevelPlan plan;
  if (members.empty()) return plan;

  plan.resize(deepest + 1);
  for (auto id : members) {
    plan[levels[static_cast<std::size_t>(id)]].push_back(id);
  }
  return plan;
}

namespace {

void CheckStaticLayout(const LevelPlan& plan) {
  const TaskSet sinks = registry::SinkTasks();
  const TaskSet first{TaskId::kTitle};

  for (std::size_t i = 0; i < plan.size(); ++i) {
    const TaskSet level = PlanTasks({plan[i]});

    if (level.Intersects(sinks) && (i + 1 != plan.size() || !level.IsSubsetOf(sinks))) {
      throw util::InvalidState("the sink must run alone in the last level");
    }
    if (level.Intersects(first) && (i != 0 || !level.IsSubsetOf(first))) {
      throw util::InvalidState("title must run alone in the first level");
    }
  }
}

} // namespace

void ValidatePlan(const LevelPlan& plan, PlanKind kind) {
  const TaskSet all = PlanTasks(plan);

  TaskSet earlier;
  for (const auto& level : plan) {
    if (level.empty()) throw util::InvalidState("plan contains an empty level");

    TaskSet current;
    for (auto id : level) {
      if (earlier.Contains(id) || current.Contains(id)) {
        throw util::InvalidState("task " + std::string(registry::TaskName(id)) + " scheduled twice");
      }
      current.Insert(id);
    }

    if (kind == PlanKind::kComputed) {
      for (auto id : level) {
        const TaskSet deps = graph::Dependencies(id).Intersection(all);
        if (!deps.IsSubsetOf(earlier)) {
          throw util::InvalidState("task " + std::string(registry::TaskName(id)) +
                                   " scheduled before one of its dependencies");
        }
      }
    }

    earlier = earlier.Union(current);
  }

  if (kind == PlanKind::kStatic) CheckStaticLayout(plan);
}

TaskSet PlanTasks(const LevelPlan& plan) {
  TaskSet out;
  for (const auto& level : plan) {
    for (auto id : level) out.Insert(id);
  }
  return out;
}

std::string DescribePlan(const LevelPlan& plan) {
  std::ostringstream out;
  for (std::size_t i = 0; i < plan.size(); ++i) {
    if (i > 0) out << " -> ";
    out << '[';
    for (std::size_t j = 0; j < plan[i].size(); ++j) {
      if (j > 0) out << ", ";
      out << registry::TaskName(plan[i][j]);
    }
    out << ']';
  }
  return out.str();
}

} // namespace proposal::planner
