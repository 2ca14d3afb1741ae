#pragma once

#include <string>
#include <string_view>

#include "internal/routing/routing_decision.hpp"

namespace proposal::routing {

// Returns the body of the first ``` fence (an optional "json" tag
// dropped), or the trimmed input when there is no fence.
std::string StripCodeFence(std::string_view raw);

/*
  Parses the classifier's JSON into a RoutingDecision.

  Fields of earlier classifier prompts are accepted: agents_to_rerun,
  relevant_context_sections, needs_proposal_generation and the
  "generate_proposal" action. Task names the registry does not know end
  up in unresolved_task_ids. Throws util::RoutingParseError on malformed
  input or an unknown action. The result is not sanitized.
*/
RoutingDecision ParseDecision(std::string_view raw);

} // namespace proposal::routing
