#pragma once

#include <string>

#include "internal/registry/task_id.hpp"
#include "internal/state/project_state.hpp"

namespace proposal::session {

/*
  Session storage form of a task's output: the task's own keys of a
  ProjectState, as protobuf JSON with proto field names.

      {"refined_scope": "...", "similar_products": "..."}
*/
std::string EncodeTaskOutput(const state::ProjectState& state, registry::TaskId id);

// Throws util::InvalidState when `content` is not a ProjectState JSON.
state::StateUpdate DecodeTaskOutput(const std::string& content, registry::TaskId id);

} // namespace proposal::session
