#pragma once

#include "internal/tasks/task.hpp"

namespace proposal::tasks {

inline constexpr char kStageCompleted[] = "completed";
inline constexpr char kStageFailed[]    = "failed";
inline constexpr char kDefaultTitle[]   = "Project Proposal";

/*
  Sink task: assembles final_document from every section.

  Missing sections are not an exception: the task sets
  current_stage = "failed" and error = "Missing required components: ..."
  and the pipeline reports the run as incomplete.
*/
class CompileTask final : public Task {
 public:
  registry::TaskId id() const override {
    return registry::TaskId::kFinalCompilation;
  }

  state::StateUpdate Run(const state::ProjectState& snapshot, TaskContext& context) const override;
};

} // namespace proposal::tasks
