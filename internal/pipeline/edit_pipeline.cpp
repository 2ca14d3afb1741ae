#include "edit_pipeline.hpp"

#include "internal/util/errors.hpp"

namespace proposal::pipeline {

namespace {

registry::TaskSet EditTasks(const EditRequest& request) {
  auto tasks = graph::Expand({request.requested, graph::RequestKind::kEdit, request.generated_before});
  if (request.compile_after_edit && !tasks.Empty()) {
    tasks = tasks.Union(registry::SinkTasks());
  }
  return tasks;
}

} // namespace

EditPipeline::EditPipeline(const EditRequest& request, session::Session* session)
    : Pipeline("edit", "Proposal Edit", planner::PlanComputed(EditTasks(request)), planner::PlanKind::kComputed, session),
      requested_(request.requested) {}

void EditPipeline::ValidatePrerequisites(const state::ProjectState& state) const {
  if (levels().empty()) throw util::PrerequisiteFailed(name() + ": no tasks to run");
  Pipeline::ValidatePrerequisites(state);
}

} // namespace proposal::pipeline
