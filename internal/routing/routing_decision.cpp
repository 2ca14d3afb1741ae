#include "routing_decision.hpp"

#include <algorithm>
#include <cmath>

namespace proposal::routing {

std::string_view ActionName(Action action) {
  switch (action) {
    case Action::kConversation:
      return "conversation";
    case Action::kEdit:
      return "edit";
    case Action::kGenerate:
      return "generate";
  }
  return "unknown";
}

std::string_view DecisionSourceName(DecisionSource source) {
  switch (source) {
    case DecisionSource::kFastPath:
      return "fast_path";
    case DecisionSource::kGreeting:
      return "greeting";
    case DecisionSource::kClassifier:
      return "classifier";
    case DecisionSource::kKeywordFallback:
      return "keyword_fallback";
  }
  return "unknown";
}

std::optional<Action> ParseAction(std::string_view name) {
  if (name == "conversation") return Action::kConversation;
  if (name == "edit") return Action::kEdit;
  if (name == "generate" || name == "generate_proposal") return Action::kGenerate;
  return std::nullopt;
}

void Sanitize(RoutingDecision& decision) {
  if (std::isnan(decision.confidence)) decision.confidence = 0.0;
  decision.confidence = std::clamp(decision.confidence, 0.0, 1.0);
  if (decision.needs_full_generation) decision.action = Action::kGenerate;
}

} // namespace proposal::routing
