#include "internal/config/config_loader.hpp"
#include "internal/session/memory_session.hpp"
#include "internal/settings/settings_resolver.hpp"

#include <cassert>
#include <iostream>

namespace {

using proposal::registry::TaskId;
using proposal::registry::TaskSet;
using proposal::routing::Action;
using proposal::routing::ExtractedRate;
using proposal::routing::ExtractedSettings;
using proposal::routing::RoutingDecision;
using proposal::session::ScopedSettings;
using proposal::settings::Resolution;
using proposal::settings::SettingsResolver;

proposal::runtime::config::RuntimeConfig Config() {
  auto config = proposal::config::ConfigLoader::Defaults();
  auto* settings = config.mutable_settings();
  settings->set_currency("EUR");
  settings->set_instructions("plain language");
  settings->mutable_default_rates()->clear();
  (*settings->mutable_default_rates())["senior_engineer"] = 60.0;
  (*settings->mutable_default_rates())["designer"]        = 40.0;
  return config;
}

void TestPriorityOrder() {
  SettingsResolver resolver(Config());

  ScopedSettings remembered;
  remembered.rates["designer"] = 45.0;
  remembered.rates["pm"]       = 50.0;
  remembered.budget            = "10000";

  ExtractedSettings extracted;
  extracted.rates["pm"] = ExtractedRate{440.0, "day", ""};

  auto resolution = resolver.Resolve(extracted, remembered);
  const auto& rates = resolution.settings.rates;
  assert(rates.at("senior_engineer") == 60.0);
  assert(rates.at("designer") == 45.0);
  assert(rates.at("pm") == 55.0);
  assert(resolution.settings.currency == "EUR");
  assert(resolution.settings.instructions == "plain language");

  // absent budget keeps the remembered one
  assert(resolution.settings.budget == std::optional<std::string>("10000"));
  assert(!resolution.budget_changed);
  assert(resolution.rates_changed);
  assert(resolution.remembered.rates.at("pm") == 55.0);
  assert(resolution.remembered.rates.count("senior_engineer") == 0);
}

void TestBudgetForcesEdit() {
  RoutingDecision decision;
  Resolution resolution;
  resolution.budget_changed = true;

  SettingsResolver::InjectConstraints(decision, resolution);
  assert(decision.action == Action::kEdit);
  assert((decision.task_ids == TaskSet{TaskId::kProjectManager, TaskId::kResourceAllocation}));
}

void TestRatesAddResourceAllocation() {
  RoutingDecision decision;
  decision.action   = Action::kEdit;
  decision.task_ids = {TaskId::kTitle};
  Resolution resolution;
  resolution.rates_changed = true;

  SettingsResolver::InjectConstraints(decision, resolution);
  assert((decision.task_ids == TaskSet{TaskId::kTitle, TaskId::kResourceAllocation}));
}

void TestTimelineAddsProjectManagerOnly() {
  RoutingDecision decision;
  Resolution resolution;
  resolution.timeline_changed = true;

  SettingsResolver::InjectConstraints(decision, resolution);
  assert(decision.task_ids == TaskSet{TaskId::kProjectManager});
  assert(decision.action == Action::kEdit);
}

void TestGenerateStaysGenerate() {
  RoutingDecision decision;
  decision.action = Action::kGenerate;
  Resolution resolution;
  resolution.budget_changed = true;

  SettingsResolver::InjectConstraints(decision, resolution);
  assert(decision.action == Action::kGenerate);
}

void TestNothingNewLeavesDecisionAlone() {
  RoutingDecision decision;
  SettingsResolver::InjectConstraints(decision, Resolution{});
  assert(decision.action == Action::kConversation);
  assert(decision.task_ids.Empty());
}

void TestApplyRemembersInSession() {
  SettingsResolver resolver(Config());
  proposal::session::MemorySession session("a recipe app");

  RoutingDecision decision;
  decision.extracted_settings.budget = "2500";
  auto settings = resolver.Apply(decision, session);

  assert(settings.budget == std::optional<std::string>("2500"));
  assert(session.ScopedState().budget == std::optional<std::string>("2500"));
  assert(session.save_count() == 1);
  assert(decision.action == Action::kEdit);
  assert(decision.task_ids.Contains(TaskId::kResourceAllocation));

  // next turn brings nothing new
  RoutingDecision next;
  auto later = resolver.Apply(next, session);
  assert(later.budget == std::optional<std::string>("2500"));
  assert(session.save_count() == 1);
  assert(next.action == Action::kConversation);

  proposal::state::ProjectState state;
  SettingsResolver::ApplyToState(later, state);
  assert(state.budget() == "2500");
  assert(state.timeline().empty());
  assert(state.currency() == "EUR");
  assert(state.rates().at("senior_engineer") == 60.0);
}

} // namespace

int main() {
  TestPriorityOrder();
  TestBudgetForcesEdit();
  TestRatesAddResourceAllocation();
  TestTimelineAddsProjectManagerOnly();
  TestGenerateStaysGenerate();
  TestNothingNewLeavesDecisionAlone();
  TestApplyRemembersInSession();

  std::cout << "proposal_unit_settings_resolver: pass\n";
  return 0;
}
