#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.pb.h"
#include "internal/llm/language_model.hpp"
#include "internal/routing/routing_decision.hpp"

namespace proposal::session {
class Session;
}

namespace proposal::routing {

/*
  Turns one utterance into a RoutingDecision:

    1. a configured generation trigger in the utterance,
       or a generation command as its last word         -> generate
    2. nothing but greeting words                       -> conversation
    3. structured classification call
    4. any failure of 3                                  -> keyword table

  Never throws for classifier problems. Without a backend every turn
  past step 2 uses the keyword table.
*/
class RoutingClassifier {
 public:
  RoutingClassifier(const proposal::runtime::config::RuntimeConfig& config,
                    std::shared_ptr<llm::ClassificationBackend> backend);

  RoutingDecision Classify(std::string_view utterance, const session::Session& session) const;

  // Exposed for tests.
  bool IsGreeting(std::string_view lowered) const;

  RoutingDecision KeywordFallback(std::string_view lowered) const;

 private:
  llm::ClassificationRequest BuildRequest(std::string_view utterance, const session::Session& session) const;

  bool RequestsGeneration(std::string_view lowered) const;

  std::vector<std::string>                    triggers_;
  std::vector<std::string>                    commands_;
  std::vector<std::string>                    greetings_;
  std::vector<std::string>                    roles_;
  std::size_t                                 history_turns_;
  double                                      fallback_confidence_;
  std::shared_ptr<llm::ClassificationBackend> backend_;
};

std::string ToLower(std::string_view text);

} // namespace proposal::routing
