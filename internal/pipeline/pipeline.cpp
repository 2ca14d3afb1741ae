#include "pipeline.hpp"

#include "internal/observability/logging.hpp"
#include "internal/session/session.hpp"
#include "internal/util/errors.hpp"

namespace proposal::pipeline {

Pipeline::Pipeline(std::string name,
                   std::string display_name,
                   planner::LevelPlan levels,
                   planner::PlanKind kind,
                   session::Session* session)
    : name_(std::move(name)),
      display_name_(std::move(display_name)),
      levels_(std::move(levels)),
      session_(session) {
  planner::ValidatePlan(levels_, kind);
}

void Pipeline::ValidatePrerequisites(const state::ProjectState& state) const {
  if (!state::HasText(state, state::StateKey::kInitialIdea)) {
    throw util::PrerequisiteFailed(name_ + ": initial idea is empty");
  }
}

exec::CompletionHook Pipeline::MakeCompletionHook() const {
  if (!session_ || !tasks().Contains(registry::TaskId::kTitle)) return {};

  session::Session* session = session_;
  return [session](registry::TaskId id, const state::ProjectState& merged) {
    if (id != registry::TaskId::kTitle || merged.proposal_title().empty()) return;

    session->SetDocumentTitle(merged.proposal_title());
    if (!session->Save()) {
      PROPOSAL_LOG_WARN("session save after title failed", {observability::StringField("title", merged.proposal_title())});
    }
  };
}

} // namespace proposal::pipeline
