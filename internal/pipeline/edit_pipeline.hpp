#pragma once

#include "internal/graph/closure_expander.hpp"
#include "pipeline.hpp"

namespace proposal::pipeline {

struct EditRequest {
  registry::TaskSet requested;
  bool              generated_before   = false;
  bool              compile_after_edit = false;
};

/*
  Reruns the requested tasks plus everything downstream of them (see
  graph::Expand), laid out with planner::PlanComputed.
*/
class EditPipeline final : public Pipeline {
 public:
  // `session` may be null; it must outlive the pipeline otherwise.
  explicit EditPipeline(const EditRequest& request, session::Session* session = nullptr);

  const registry::TaskSet& requested() const {
    return requested_;
  }

  // Also requires at least one task to run.
  void ValidatePrerequisites(const state::ProjectState& state) const override;

 private:
  registry::TaskSet requested_;
};

} // namespace proposal::pipeline
