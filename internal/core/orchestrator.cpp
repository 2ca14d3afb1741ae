#include "orchestrator.hpp"

#include "internal/observability/logging.hpp"
#include "internal/pipeline/pipeline_factory.hpp"
#include "internal/routing/routing_classifier.hpp"
#include "internal/session/session.hpp"
#include "internal/session/task_output_codec.hpp"
#include "internal/settings/settings_resolver.hpp"
#include "internal/tasks/compile_task.hpp"
#include "internal/util/errors.hpp"

namespace proposal::core {

using registry::TaskId;

namespace {

constexpr char kFailureReply[] = "Sorry, I could not complete this update.";

state::ProjectState BuildInitialState(const session::Session& session, std::string_view utterance) {
  state::ProjectState state;
  state.set_initial_idea(session.InitialIdea());
  state.set_proposal_title(session.DocumentTitle());
  state.set_user_input(std::string(utterance));

  for (const auto& d : registry::kTaskDescriptors) {
    if (d.sink) continue;
    auto prior = session.PriorTaskOutput(d.id);
    if (!prior) continue;
    try {
      state::Merge(state, session::DecodeTaskOutput(*prior, d.id));
    } catch (const util::InvalidState& e) {
      PROPOSAL_LOG_WARN("ignoring stored task output",
                        {observability::StringField("task", d.name), observability::StringField("error", e.what())});
    }
  }

  // Title stored on the session wins over an older stored title output.
  if (!session.DocumentTitle().empty()) state.set_proposal_title(session.DocumentTitle());
  return state;
}

std::string SaveReason(const routing::RoutingDecision& decision) {
  if (decision.action == routing::Action::kGenerate) return "generate";
  return "edit: " + decision.reasoning;
}

void RecordOutputs(session::Session& session,
                   const routing::RoutingDecision& decision,
                   const pipeline::RunOutcome& outcome) {
  const auto reason = SaveReason(decision);
  for (const auto& task : outcome.run.tasks) {
    if (task.status != pipeline::TaskStatus::kDone) continue;
    session.SaveTaskOutput(task.id, session::EncodeTaskOutput(outcome.state, task.id), reason);
  }

  if (!outcome.state.proposal_title().empty()) session.SetDocumentTitle(outcome.state.proposal_title());
  if (!outcome.state.current_stage().empty()) session.SetCurrentStage(outcome.state.current_stage());

  if (decision.action == routing::Action::kGenerate && outcome.state.current_stage() == tasks::kStageCompleted) {
    session.SetDocumentGenerated(true);
  }

  if (!session.Save()) {
    PROPOSAL_LOG_WARN("session save after run failed", {observability::StringField("pipeline", outcome.run.pipeline)});
  }
}

std::string SuccessReply(const routing::RoutingDecision& decision, const pipeline::RunOutcome& outcome) {
  if (decision.action == routing::Action::kGenerate) {
    return "Your proposal \"" + outcome.state.proposal_title() + "\" is ready.";
  }

  std::string updated;
  for (const auto& task : outcome.run.tasks) {
    if (registry::Describe(task.id).sink) continue;
    if (!updated.empty()) updated += ", ";
    updated += registry::Describe(task.id).display_name;
  }
  return "Updated: " + updated + ".";
}

} // namespace

Orchestrator::Orchestrator(std::shared_ptr<routing::RoutingClassifier> classifier,
                           std::shared_ptr<settings::SettingsResolver> resolver,
                           std::shared_ptr<pipeline::PipelineFactory>  factory,
                           std::shared_ptr<pipeline::PipelineExecutor> executor)
    : classifier_(std::move(classifier)),
      resolver_(std::move(resolver)),
      factory_(std::move(factory)),
      executor_(std::move(executor)) {
  if (!classifier_ || !resolver_ || !factory_ || !executor_) {
    throw util::InvalidState("orchestrator is missing a collaborator");
  }
}

TurnOutcome Orchestrator::HandleTurn(session::Session& session, std::string_view utterance) const {
  TurnOutcome outcome;
  outcome.decision = classifier_->Classify(utterance, session);
  session.AppendMessage({"user", std::string(utterance)});

  const auto settings = resolver_->Apply(outcome.decision, session);

  if (outcome.decision.action == routing::Action::kConversation) {
    outcome.status = util::Result::Ok();
    return outcome;
  }

  auto state = BuildInitialState(session, utterance);
  settings::SettingsResolver::ApplyToState(settings, state);

  std::unique_ptr<pipeline::Pipeline> pipeline;
  try {
    pipeline = factory_->Create(outcome.decision, session);
  } catch (const std::exception& e) {
    outcome.status = util::ToResult(e);
    outcome.reply  = kFailureReply;
    PROPOSAL_LOG_ERROR("pipeline build failed", {observability::StringField("error", e.what())});
    session.AppendMessage({"assistant", outcome.reply});
    return outcome;
  }

  auto run       = executor_->Execute(*pipeline, std::move(state));
  outcome.status = run.status;

  switch (run.status.code) {
    case util::ErrorCode::OK:
      RecordOutputs(session, outcome.decision, run);
      outcome.reply = SuccessReply(outcome.decision, run);
      break;

    case util::ErrorCode::Incomplete:
      // content sections still landed; only the final document is missing
      RecordOutputs(session, outcome.decision, run);
      outcome.reply = "The proposal could not be compiled. " + run.status.message;
      break;

    default:
      outcome.reply = kFailureReply;
      break;
  }

  session.AppendMessage({"assistant", outcome.reply});
  outcome.run = std::move(run);
  return outcome;
}

} // namespace proposal::core
