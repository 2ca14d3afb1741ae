#include "compile_task.hpp"

#include <array>
#include <string>
#include <string_view>
#include <utility>

#include "internal/observability/logging.hpp"

namespace proposal::tasks {

using state::StateKey;

namespace {

constexpr std::array<std::pair<StateKey, std::string_view>, 5> kRequiredSections = {{
    {StateKey::kRefinedScope, "refined scope"},
    {StateKey::kBusinessAnalysis, "business analysis"},
    {StateKey::kTechnicalSpec, "technical specification"},
    {StateKey::kProjectPlan, "project plan"},
    {StateKey::kResourcePlan, "resource plan"},
}};

} // namespace

state::StateUpdate CompileTask::Run(const state::ProjectState& snapshot, TaskContext& context) const {
  std::string missing;
  for (const auto& [key, display] : kRequiredSections) {
    if (state::HasText(snapshot, key)) continue;
    if (!missing.empty()) missing += ", ";
    missing += display;
  }

  state::StateUpdate update;
  if (!missing.empty()) {
    PROPOSAL_LOG_WARN("compilation incomplete",
                      {observability::StringField("pipeline", context.pipeline),
                       observability::StringField("missing", missing)});
    update.SetText(StateKey::kCurrentStage, kStageFailed);
    update.SetText(StateKey::kError, "Missing required components: " + missing);
    return update;
  }

  state::FinalDocument document;
  document.set_title(state::HasText(snapshot, StateKey::kProposalTitle) ? snapshot.proposal_title() : kDefaultTitle);
  document.set_initial_idea(snapshot.initial_idea());
  document.set_similar_products(snapshot.similar_products());
  document.set_refined_scope(snapshot.refined_scope());
  document.set_business_analysis(snapshot.business_analysis());
  document.set_technical_spec(snapshot.technical_spec());
  document.set_project_plan(snapshot.project_plan());
  document.set_resource_plan(snapshot.resource_plan());

  update.SetFinalDocument(document);
  update.SetText(StateKey::kCurrentStage, kStageCompleted);
  update.SetText(StateKey::kError, "");
  return update;
}

} // namespace proposal::tasks
