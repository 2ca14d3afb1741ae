#include "project_state.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include "internal/util/errors.hpp"

namespace proposal::state {

namespace {

using Reducer = void (*)(ProjectState& into, const ProjectState& from, StateKey key);

void OverwriteText(ProjectState& into, const ProjectState& from, StateKey key) {
  *MutableText(into, key) = Text(from, key);
}

void OverwriteFinalDocument(ProjectState& into, const ProjectState& from, StateKey) {
  into.mutable_final_document()->CopyFrom(from.final_document());
}

void MergeRates(ProjectState& into, const ProjectState& from, StateKey) {
  auto& rates = *into.mutable_rates();
  for (const auto& [role, hourly] : from.rates()) {
    rates[role] = hourly;
  }
}

void AppendSections(ProjectState& into, const ProjectState& from, StateKey) {
  for (const auto& name : from.sections_generated()) {
    MarkSectionGenerated(into, name);
  }
}

constexpr std::array<Reducer, kStateKeyCount> kReducers = {
    OverwriteText,          // kInitialIdea
    OverwriteText,          // kUserInput
    OverwriteText,          // kProposalTitle
    OverwriteText,          // kRefinedScope
    OverwriteText,          // kSimilarProducts
    OverwriteText,          // kBusinessAnalysis
    OverwriteText,          // kTechnicalSpec
    OverwriteText,          // kProjectPlan
    OverwriteText,          // kResourcePlan
    OverwriteFinalDocument, // kFinalDocument
    OverwriteText,          // kCurrentStage
    OverwriteText,          // kError
    MergeRates,             // kRates
    OverwriteText,          // kCurrency
    OverwriteText,          // kInstructions
    OverwriteText,          // kBudget
    OverwriteText,          // kTimeline
    AppendSections,         // kSectionsGenerated
};

constexpr std::array<std::string_view, kStateKeyCount> kKeyNames = {
    "initial_idea",   "user_input",    "proposal_title", "refined_scope", "similar_products", "business_analysis",
    "technical_spec", "project_plan",  "resource_plan",  "final_document", "current_stage",   "error",
    "rates",          "currency",      "instructions",   "budget",        "timeline",         "sections_generated",
};

[[noreturn]] void ThrowNotText(StateKey key) {
  throw util::InvalidState("state key " + std::string(StateKeyName(key)) + " is not a text key");
}

} // namespace

std::string_view StateKeyName(StateKey key) {
  return kKeyNames[static_cast<std::size_t>(key)];
}

std::vector<StateKey> StateKeySet::Keys() const {
  std::vector<StateKey> out;
  for (std::size_t i = 0; i < kStateKeyCount; ++i) {
    const auto key = static_cast<StateKey>(i);
    if (Contains(key)) out.push_back(key);
  }
  return out;
}

void StateUpdate::SetText(StateKey key, std::string value) {
  *MutableText(values, key) = std::move(value);
  keys.Insert(key);
}

void StateUpdate::SetFinalDocument(const FinalDocument& document) {
  values.mutable_final_document()->CopyFrom(document);
  keys.Insert(StateKey::kFinalDocument);
}

void StateUpdate::SetRate(const std::string& role, double hourly) {
  (*values.mutable_rates())[role] = hourly;
  keys.Insert(StateKey::kRates);
}

bool IsTextKey(StateKey key) {
  switch (key) {
    case StateKey::kFinalDocument:
    case StateKey::kRates:
    case StateKey::kSectionsGenerated:
      return false;
    default:
      return true;
  }
}

const std::string& Text(const ProjectState& state, StateKey key) {
  switch (key) {
    case StateKey::kInitialIdea:
      return state.initial_idea();
    case StateKey::kUserInput:
      return state.user_input();
    case StateKey::kProposalTitle:
      return state.proposal_title();
    case StateKey::kRefinedScope:
      return state.refined_scope();
    case StateKey::kSimilarProducts:
      return state.similar_products();
    case StateKey::kBusinessAnalysis:
      return state.business_analysis();
    case StateKey::kTechnicalSpec:
      return state.technical_spec();
    case StateKey::kProjectPlan:
      return state.project_plan();
    case StateKey::kResourcePlan:
      return state.resource_plan();
    case StateKey::kCurrentStage:
      return state.current_stage();
    case StateKey::kError:
      return state.error();
    case StateKey::kCurrency:
      return state.currency();
    case StateKey::kInstructions:
      return state.instructions();
    case StateKey::kBudget:
      return state.budget();
    case StateKey::kTimeline:
      return state.timeline();
    case StateKey::kFinalDocument:
    case StateKey::kRates:
    case StateKey::kSectionsGenerated:
      break;
  }
  ThrowNotText(key);
}

std::string* MutableText(ProjectState& state, StateKey key) {
  switch (key) {
    case StateKey::kInitialIdea:
      return state.mutable_initial_idea();
    case StateKey::kUserInput:
      return state.mutable_user_input();
    case StateKey::kProposalTitle:
      return state.mutable_proposal_title();
    case StateKey::kRefinedScope:
      return state.mutable_refined_scope();
    case StateKey::kSimilarProducts:
      return state.mutable_similar_products();
    case StateKey::kBusinessAnalysis:
      return state.mutable_business_analysis();
    case StateKey::kTechnicalSpec:
      return state.mutable_technical_spec();
    case StateKey::kProjectPlan:
      return state.mutable_project_plan();
    case StateKey::kResourcePlan:
      return state.mutable_resource_plan();
    case StateKey::kCurrentStage:
      return state.mutable_current_stage();
    case StateKey::kError:
      return state.mutable_error();
    case StateKey::kCurrency:
      return state.mutable_currency();
    case StateKey::kInstructions:
      return state.mutable_instructions();
    case StateKey::kBudget:
      return state.mutable_budget();
    case StateKey::kTimeline:
      return state.mutable_timeline();
    case StateKey::kFinalDocument:
    case StateKey::kRates:
    case StateKey::kSectionsGenerated:
      break;
  }
  ThrowNotText(key);
}

bool HasText(const ProjectState& state, StateKey key) {
  const auto& value = Text(state, key);
  return std::any_of(value.begin(), value.end(), [](unsigned char c) { return !std::isspace(c); });
}

void Merge(ProjectState& state, const StateUpdate& update) {
  for (auto key : update.keys.Keys()) {
    kReducers[static_cast<std::size_t>(key)](state, update.values, key);
  }
}

void MarkSectionGenerated(ProjectState& state, std::string_view task_name) {
  const auto& sections = state.sections_generated();
  if (std::find(sections.begin(), sections.end(), task_name) != sections.end()) return;
  state.add_sections_generated(std::string(task_name));
}

} // namespace proposal::state
