#pragma once

#include <string_view>

#include "internal/registry/task_id.hpp"

namespace proposal::graph {

enum class RequestKind {
  kFullGeneration,
  kEdit,
};

std::string_view RequestKindName(RequestKind kind);

struct ExpansionRequest {
  registry::TaskSet requested;
  RequestKind       kind             = RequestKind::kEdit;
  bool              generated_before = false;
};

/*
  Decides which tasks rerun for a request.

    - a single-task edit is returned as requested
    - otherwise every task downstream of the request is added, to fixed
      point; the sink is never pulled in by closure but stays if it was
      requested explicitly

  TaskSet iterates in canonical order, so the result is ordered.
*/
registry::TaskSet Expand(const ExpansionRequest& request);

} // namespace proposal::graph
