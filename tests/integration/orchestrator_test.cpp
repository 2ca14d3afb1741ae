#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/core/orchestrator.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/session/memory_session.hpp"
#include "internal/session/task_output_codec.hpp"
#include "internal/tasks/compile_task.hpp"
#include "internal/util/errors.hpp"
#include "support/fake_backends.hpp"

namespace {

using proposal::core::TurnOutcome;
using proposal::registry::TaskId;
using proposal::routing::Action;
using proposal::session::MemorySession;
using proposal::testing::FakeClassificationBackend;
using proposal::testing::FakeGenerationBackend;
using proposal::util::ErrorCode;

constexpr char kIdea[] = "a meal planning app";

struct Engine {
  std::shared_ptr<FakeGenerationBackend>     generation     = std::make_shared<FakeGenerationBackend>();
  std::shared_ptr<FakeClassificationBackend> classification = std::make_shared<FakeClassificationBackend>();
  proposal::factory::Application             app;

  // Backends must be configured before Start(): workers call them concurrently.
  void Start() {
    auto config = proposal::config::ConfigLoader::Defaults();
    config.mutable_workers()->set_threads(2);
    app = proposal::factory::Build(config, {generation, classification});
  }

  TurnOutcome Turn(MemorySession& session, const std::string& utterance) {
    return app.orchestrator->HandleTurn(session, utterance);
  }
};

std::string Generated(const std::string& section) {
  return section + " for " + kIdea;
}

void TestGenerateThenEdit() {
  Engine engine;
  engine.Start();
  MemorySession session(kIdea);

  auto first = engine.Turn(session, "Sounds great, go ahead");
  assert(first.decision.action == Action::kGenerate);
  assert(first.status);
  assert(first.run);
  assert(first.run->run.terminal == "completed");
  assert(first.reply == "Your proposal \"" + Generated("title") + "\" is ready.");
  assert(engine.classification->calls() == 0);

  assert(session.IsDocumentGenerated());
  assert(session.DocumentTitle() == Generated("title"));
  assert(session.CurrentStage() == proposal::tasks::kStageCompleted);
  for (const auto& d : proposal::registry::kTaskDescriptors) {
    auto revisions = session.Revisions(d.id);
    assert(revisions.size() == 1);
    assert(revisions[0].reason == "generate");
  }
  // title hook save + end-of-run save
  assert(session.save_count() == 2);

  auto scope = proposal::session::DecodeTaskOutput(*session.PriorTaskOutput(TaskId::kScopeRefinement),
                                                   TaskId::kScopeRefinement);
  assert(scope.values.refined_scope() == Generated("refined_scope"));
  assert(scope.values.similar_products() == Generated("similar_products"));

  engine.classification->SetAnswer(
      R"({"action": "edit", "task_ids": ["business_analyst"], "reasoning": "deeper market analysis", "confidence": 0.92})");
  auto second = engine.Turn(session, "Can you dig deeper into the competition?");
  assert(second.decision.action == Action::kEdit);
  assert(second.status);
  assert(second.reply == "Updated: Business Analyst.");
  assert(second.run->run.tasks.size() == 1);

  auto revisions = session.Revisions(TaskId::kBusinessAnalyst);
  assert(revisions.size() == 2);
  assert(revisions[1].reason == "edit: deeper market analysis");
  assert(session.Revisions(TaskId::kTechnicalArchitect).size() == 1);

  // the edit saw the stored sections and the utterance
  auto requests = engine.generation->RequestsFor("business_analysis");
  assert(requests.size() == 2);
  assert(requests[1].previous_content == Generated("business_analysis"));
  assert(requests[1].inputs.at("refined_scope") == Generated("refined_scope"));
  assert(requests[1].inputs.at("user_input") == "Can you dig deeper into the competition?");

  // classifier saw the conversation so far
  const auto classified = engine.classification->last();
  assert(classified.document_exists);
  assert(classified.current_stage == proposal::tasks::kStageCompleted);
  assert(classified.history.size() == 2);

  assert(session.ConversationHistory().size() == 4);
  assert(session.ConversationHistory().back().content == second.reply);
}

void TestConversationRunsNothing() {
  Engine engine;
  engine.Start();
  MemorySession session(kIdea);

  auto outcome = engine.Turn(session, "Hello there");
  assert(outcome.decision.action == Action::kConversation);
  assert(outcome.status);
  assert(!outcome.run);
  assert(outcome.reply.empty());
  assert(engine.generation->Requests().empty());
  assert(session.ConversationHistory().size() == 1);
}

void TestSettingsTriggerReruns() {
  Engine engine;
  engine.Start();
  MemorySession session(kIdea);

  engine.classification->SetAnswer(R"({
    "action": "conversation",
    "reasoning": "rate update",
    "extracted_settings": {"rates": {"senior_engineer": {"value": 800, "unit": "day"}}}
  })");
  auto rates = engine.Turn(session, "our senior engineers cost 800 a day");
  assert(rates.decision.action == Action::kEdit);
  assert(rates.status);
  assert((rates.run->run.levels == proposal::planner::LevelPlan{{TaskId::kResourceAllocation}}));
  assert(session.ScopedState().rates.at("senior_engineer") == 100.0);

  auto resource = engine.generation->RequestsFor("resource_plan");
  assert(resource.size() == 1);
  assert(resource[0].inputs.at("rates").find("senior_engineer: 100.00/hour") != std::string::npos);

  engine.classification->SetAnswer(R"({"action": "conversation", "extracted_settings": {"budget": 2500}})");
  auto budget = engine.Turn(session, "we can spend 2500");
  assert(budget.status);
  assert(budget.run->run.StatusOf(TaskId::kProjectManager) == proposal::pipeline::TaskStatus::kDone);
  assert(budget.run->run.StatusOf(TaskId::kResourceAllocation) == proposal::pipeline::TaskStatus::kDone);

  auto plan = engine.generation->RequestsFor("project_plan");
  assert(plan.size() == 1);
  assert(plan[0].inputs.at("budget") == "2500");
  // remembered rates still apply
  assert(engine.generation->RequestsFor("resource_plan")[1].inputs.at("rates").find("100.00") != std::string::npos);
  assert(!session.IsDocumentGenerated());
}

void TestFailedSectionKeepsSessionUnchanged() {
  Engine engine;
  engine.generation->Fail("technical_spec");
  engine.Start();
  MemorySession session(kIdea);

  auto outcome = engine.Turn(session, "generate proposal");
  assert(outcome.status.code == ErrorCode::TaskFailed);
  assert(outcome.reply == "Sorry, I could not complete this update.");
  assert(!session.IsDocumentGenerated());
  assert(!session.PriorTaskOutput(TaskId::kBusinessAnalyst));
  // the title hook still ran
  assert(session.DocumentTitle() == Generated("title"));
}

void TestUnknownTaskIsReported() {
  Engine engine;
  engine.Start();
  MemorySession session(kIdea);

  engine.classification->SetAnswer(R"({"action": "edit", "task_ids": ["marketing_plan"]})");
  auto outcome = engine.Turn(session, "add a marketing plan");
  assert(outcome.status.code == ErrorCode::UnknownTask);
  assert(!outcome.run);
  assert(outcome.reply == "Sorry, I could not complete this update.");
  assert(engine.generation->Requests().empty());
}

void TestBuildRequiresGenerationBackend() {
  bool threw = false;
  try {
    (void)proposal::factory::Build(proposal::config::ConfigLoader::Defaults(), {});
  } catch (const proposal::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  auto config = proposal::config::ConfigLoader::Defaults();
  config.mutable_logging()->set_level("warn");
  proposal::observability::InitializeLogging(config);

  TestGenerateThenEdit();
  TestConversationRunsNothing();
  TestSettingsTriggerReruns();
  TestFailedSectionKeepsSessionUnchanged();
  TestUnknownTaskIsReported();
  TestBuildRequiresGenerationBackend();

  proposal::observability::ShutdownLogging();
  std::cout << "proposal_integration_orchestrator: pass\n";
  return 0;
}
