#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/pipeline/pipeline_executor.hpp"
#include "internal/routing/routing_decision.hpp"
#include "internal/util/result.hpp"

namespace proposal::routing {
class RoutingClassifier;
}
namespace proposal::settings {
class SettingsResolver;
}
namespace proposal::pipeline {
class PipelineFactory;
}
namespace proposal::session {
class Session;
}

namespace proposal::core {

struct TurnOutcome {
  routing::RoutingDecision           decision;
  std::optional<pipeline::RunOutcome> run;
  util::Result                        status;

  // Empty for conversation turns; answering those is the caller's job.
  std::string reply;
};

/*
  Handles one user turn end to end:

      classify -> resolve settings -> build pipeline -> run -> record

  Sessions are not locked here: callers serialize turns of one session.
*/
class Orchestrator {
 public:
  Orchestrator(std::shared_ptr<routing::RoutingClassifier> classifier,
               std::shared_ptr<settings::SettingsResolver> resolver,
               std::shared_ptr<pipeline::PipelineFactory>  factory,
               std::shared_ptr<pipeline::PipelineExecutor> executor);

  TurnOutcome HandleTurn(session::Session& session, std::string_view utterance) const;

 private:
  std::shared_ptr<routing::RoutingClassifier> classifier_;
  std::shared_ptr<settings::SettingsResolver> resolver_;
  std::shared_ptr<pipeline::PipelineFactory>  factory_;
  std::shared_ptr<pipeline::PipelineExecutor> executor_;
};

} // namespace proposal::core
