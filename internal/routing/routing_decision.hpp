#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/registry/task_id.hpp"

namespace proposal::routing {

enum class Action {
  kConversation,
  kEdit,
  kGenerate,
};

enum class DecisionSource {
  kFastPath,
  kGreeting,
  kClassifier,
  kKeywordFallback,
};

std::string_view ActionName(Action action);
std::string_view DecisionSourceName(DecisionSource source);

// Accepts the legacy "generate_proposal" spelling. Unknown names yield nullopt.
std::optional<Action> ParseAction(std::string_view name);

/*
  A rate as the classifier reported it. `raw` keeps the text form of a
  value that did not parse as a number so it can be reported.
*/
struct ExtractedRate {
  std::optional<double> value;
  std::string           unit;
  std::string           raw;
};

struct ExtractedSettings {
  std::map<std::string, ExtractedRate> rates;
  std::optional<std::string>           budget;
  std::optional<std::string>           timeline;

  bool Empty() const {
    return rates.empty() && !budget && !timeline;
  }
};

/*
  Outcome of classifying one utterance. Built once per turn and consumed
  immediately by the settings resolver and the pipeline factory.
*/
struct RoutingDecision {
  Action                   action = Action::kConversation;
  registry::TaskSet        task_ids;
  std::vector<std::string> unresolved_task_ids;
  std::vector<std::string> relevant_sections;
  std::string              reasoning;
  double                   confidence            = 0.0;
  bool                     needs_full_generation = false;
  ExtractedSettings        extracted_settings;
  DecisionSource           source = DecisionSource::kClassifier;
};

// Clamps confidence to [0, 1]; needs_full_generation forces kGenerate.
void Sanitize(RoutingDecision& decision);

} // namespace proposal::routing
