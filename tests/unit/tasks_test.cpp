#include "internal/registry/task_registry.hpp"
#include "internal/tasks/compile_task.hpp"
#include "internal/tasks/section_task.hpp"
#include "internal/tasks/task_catalog.hpp"
#include "internal/tasks/title_task.hpp"
#include "internal/util/errors.hpp"
#include "support/fake_backends.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

namespace {

using proposal::registry::TaskId;
using proposal::state::ProjectState;
using proposal::state::StateKey;
using proposal::tasks::TaskContext;
using proposal::testing::FakeGenerationBackend;

ProjectState Complete() {
  ProjectState state;
  state.set_initial_idea("a recipe app");
  state.set_refined_scope("scope");
  state.set_similar_products("products");
  state.set_business_analysis("analysis");
  state.set_technical_spec("spec");
  state.set_project_plan("plan");
  state.set_resource_plan("resources");
  return state;
}

void TestCompileReportsMissingSections() {
  auto state = Complete();
  state.clear_resource_plan();
  state.set_technical_spec("   ");

  TaskContext context{"test", 0};
  auto update = proposal::tasks::CompileTask().Run(state, context);

  assert(update.keys.Contains(StateKey::kCurrentStage));
  assert(update.values.current_stage() == proposal::tasks::kStageFailed);
  assert(update.values.error() == "Missing required components: technical specification, resource plan");
  assert(!update.keys.Contains(StateKey::kFinalDocument));
}

void TestCompileAssemblesDocument() {
  auto state = Complete();
  TaskContext context{"test", 2};
  auto update = proposal::tasks::CompileTask().Run(state, context);

  assert(update.values.current_stage() == proposal::tasks::kStageCompleted);
  assert(update.keys.Contains(StateKey::kError));
  assert(update.values.error().empty());

  const auto& document = update.values.final_document();
  assert(document.title() == proposal::tasks::kDefaultTitle);
  assert(document.initial_idea() == "a recipe app");
  assert(document.similar_products() == "products");
  assert(document.resource_plan() == "resources");

  state.set_proposal_title("Cookbook");
  assert(proposal::tasks::CompileTask().Run(state, context).values.final_document().title() == "Cookbook");
}

void TestTitleCleaningAndFallback() {
  assert(proposal::tasks::CleanTitle("  \"Recipe Hub\"\n") == "Recipe Hub");
  assert(proposal::tasks::CleanTitle("' '").empty());

  const std::string idea(80, 'x');
  assert(proposal::tasks::FallbackTitle(idea) == std::string(50, 'x') + " Proposal");
  assert(proposal::tasks::FallbackTitle("  short idea ") == "short idea Proposal");

  auto backend = std::make_shared<FakeGenerationBackend>();
  backend->Answer("title", "\"Recipe Hub\"");
  proposal::tasks::TitleTask task(backend);

  ProjectState state;
  state.set_initial_idea("a recipe app");
  TaskContext context{"test", 0};
  assert(task.Run(state, context).values.proposal_title() == "Recipe Hub");

  backend->Answer("title", "  ");
  assert(task.Run(state, context).values.proposal_title() == "a recipe app Proposal");
}

void TestFallbackTitleKeepsWholeCodePoints() {
  // 20 three-byte characters; 50 bytes ends inside the 17th
  std::string idea;
  for (int i = 0; i < 20; ++i) idea += "\xE6\x97\xA5";

  std::string expected;
  for (int i = 0; i < 16; ++i) expected += "\xE6\x97\xA5";
  assert(proposal::tasks::FallbackTitle(idea) == expected + " Proposal");

  // two-byte characters after 49 ASCII bytes
  const std::string mixed = std::string(49, 'a') + "\xC3\xA9\xC3\xA9";
  assert(proposal::tasks::FallbackTitle(mixed) == std::string(49, 'a') + " Proposal");

  auto backend = std::make_shared<FakeGenerationBackend>();
  backend->Answer("title", "");
  proposal::tasks::TitleTask task(backend);

  ProjectState state;
  state.set_initial_idea(idea);
  TaskContext context{"test", 0};
  assert(task.Run(state, context).values.proposal_title() == expected + " Proposal");
}

void TestTitleFallsBackWhenBackendFails() {
  auto backend = std::make_shared<FakeGenerationBackend>();
  backend->Fail("title");
  proposal::tasks::TitleTask task(backend);

  ProjectState state;
  state.set_initial_idea("a recipe app");
  TaskContext context{"test", 0};
  auto update = task.Run(state, context);
  assert(update.values.proposal_title() == "a recipe app Proposal");
}

void TestRetitlePassesCurrentTitle() {
  auto backend = std::make_shared<FakeGenerationBackend>();
  proposal::tasks::TitleTask task(backend);

  ProjectState state;
  state.set_initial_idea("a recipe app");
  state.set_proposal_title("Old Title");
  state.set_user_input("something catchier");
  TaskContext context{"edit", 0};
  (void)task.Run(state, context);

  auto requests = backend->RequestsFor("title");
  assert(requests.size() == 1);
  assert(requests[0].previous_content == "Old Title");
  assert(requests[0].inputs.at("user_input") == "something catchier");
}

void TestSectionInputs() {
  auto backend  = std::make_shared<FakeGenerationBackend>();
  auto registry = proposal::tasks::BuildTaskRegistry(backend);
  assert(registry->Registered() == proposal::registry::AllTasks());

  ProjectState state;
  state.set_initial_idea("a recipe app");
  state.set_business_analysis("analysis");
  state.set_currency("USD");
  state.set_budget("2500");
  state.set_instructions("be brief");
  (*state.mutable_rates())["senior_engineer"] = 60.0;
  (*state.mutable_rates())["designer"]        = 42.5;

  TaskContext context{"test", 1};
  auto update = registry->Get(TaskId::kProjectManager).Run(state, context);
  assert(update.values.project_plan() == "project_plan for a recipe app");

  auto requests = backend->RequestsFor("project_plan");
  assert(requests.size() == 1);
  const auto& inputs = requests[0].inputs;
  assert(inputs.at("refined_scope") == std::string(proposal::tasks::kNotProvided));
  assert(inputs.at("business_analysis") == "analysis");
  assert(inputs.at("rates") == "designer: 42.50/hour\nsenior_engineer: 60.00/hour");
  assert(inputs.at("currency") == "USD");
  assert(inputs.at("budget") == "2500");
  assert(inputs.at("timeline") == std::string(proposal::tasks::kNotProvided));
  assert(inputs.count("user_input") == 0);
  assert(requests[0].instructions == "be brief");
  assert(requests[0].previous_content.empty());

  (void)registry->Get(TaskId::kBusinessAnalyst).Run(state, context);
  auto analysis = backend->RequestsFor("business_analysis");
  assert(analysis.size() == 1);
  assert(analysis[0].inputs.count("rates") == 0);
  assert(analysis[0].previous_content == "analysis");

  ProjectState large;
  (*large.mutable_rates())["architect"] = 1e300;
  const auto formatted = proposal::tasks::FormatRates(large);
  // all 301 integer digits, nothing cut off
  assert(formatted.size() == std::string("architect: ").size() + 301 + std::string(".00/hour").size());
  assert(formatted.compare(0, 12, "architect: 1") == 0);
  assert(formatted.compare(formatted.size() - 8, 8, ".00/hour") == 0);
}

void TestScopeWritesBothSections() {
  auto backend  = std::make_shared<FakeGenerationBackend>();
  auto registry = proposal::tasks::BuildTaskRegistry(backend);

  ProjectState state;
  state.set_initial_idea("a recipe app");
  TaskContext context{"test", 1};
  auto update = registry->Get(TaskId::kScopeRefinement).Run(state, context);

  assert(update.keys.Contains(StateKey::kRefinedScope));
  assert(update.keys.Contains(StateKey::kSimilarProducts));
  assert(update.values.similar_products() == "similar_products for a recipe app");
  assert(backend->Requests().size() == 2);
}

void TestContentTaskNeedsIdea() {
  auto backend  = std::make_shared<FakeGenerationBackend>();
  auto registry = proposal::tasks::BuildTaskRegistry(backend);

  ProjectState state;
  TaskContext context{"test", 0};
  for (auto id : {TaskId::kTitle, TaskId::kTechnicalArchitect}) {
    bool threw = false;
    try {
      (void)registry->Get(id).Run(state, context);
    } catch (const proposal::util::InvalidState&) {
      threw = true;
    }
    assert(threw);
  }
  assert(backend->Requests().empty());
}

} // namespace

int main() {
  TestCompileReportsMissingSections();
  TestCompileAssemblesDocument();
  TestTitleCleaningAndFallback();
  TestFallbackTitleKeepsWholeCodePoints();
  TestTitleFallsBackWhenBackendFails();
  TestRetitlePassesCurrentTitle();
  TestSectionInputs();
  TestScopeWritesBothSections();
  TestContentTaskNeedsIdea();

  std::cout << "proposal_unit_tasks: pass\n";
  return 0;
}
