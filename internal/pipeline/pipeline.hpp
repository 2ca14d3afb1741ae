#pragma once

#include <string>

#include "internal/exec/task_executor.hpp"
#include "internal/planner/level_planner.hpp"
#include "internal/state/project_state.hpp"

namespace proposal::session {
class Session;
}

namespace proposal::pipeline {

/*
  A fixed plan of task levels plus the checks that gate it.

  The plan is computed and validated at construction; running it is the
  PipelineExecutor's job. When a session is attached the title is pushed
  to it as soon as the title task is merged, before the rest of its level
  finishes.
*/
class Pipeline {
 public:
  virtual ~Pipeline() = default;

  const std::string& name() const {
    return name_;
  }

  const std::string& display_name() const {
    return display_name_;
  }

  const planner::LevelPlan& levels() const {
    return levels_;
  }

  registry::TaskSet tasks() const {
    return planner::PlanTasks(levels_);
  }

  // Throws util::PrerequisiteFailed. Base check: a non-empty initial idea.
  virtual void ValidatePrerequisites(const state::ProjectState& state) const;

  // Hook run after each merged task; empty without a session.
  virtual exec::CompletionHook MakeCompletionHook() const;

 protected:
  // `session` may be null; it must outlive the pipeline otherwise.
  Pipeline(std::string name,
           std::string display_name,
           planner::LevelPlan levels,
           planner::PlanKind kind,
           session::Session* session);

 private:
  std::string        name_;
  std::string        display_name_;
  planner::LevelPlan levels_;
  session::Session*  session_;
};

} // namespace proposal::pipeline
