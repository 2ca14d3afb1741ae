#pragma once

#include <string>
#include <string_view>

#include "internal/state/state_key.hpp"
#include "proposal/orchestrator/v1.hpp"

namespace proposal::state {

using ProjectState  = proposal::orchestrator::v1::ProjectState;
using FinalDocument = proposal::orchestrator::v1::FinalDocument;

/*
  Partial update returned by a task.

  Only keys recorded in `keys` are merged; any other field set on
  `values` is ignored by Merge().
*/
struct StateUpdate {
  ProjectState values;
  StateKeySet  keys;

  void SetText(StateKey key, std::string value);
  void SetFinalDocument(const FinalDocument& document);
  void SetRate(const std::string& role, double hourly);
};

// True for keys backed by a plain string field.
bool IsTextKey(StateKey key);

// Throws util::InvalidState for non-text keys.
const std::string& Text(const ProjectState& state, StateKey key);
std::string*       MutableText(ProjectState& state, StateKey key);

// Trimmed value is non-empty.
bool HasText(const ProjectState& state, StateKey key);

/*
  Applies `update` to `state` through each key's reducer:
    - text keys and final_document overwrite
    - rates overwrite per role
    - sections_generated appends names not already present
*/
void Merge(ProjectState& state, const StateUpdate& update);

void MarkSectionGenerated(ProjectState& state, std::string_view task_name);

} // namespace proposal::state
