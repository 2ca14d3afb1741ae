#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/pipeline/pipeline.hpp"

namespace proposal::routing {
struct RoutingDecision;
}

namespace proposal::session {
class Session;
}

namespace proposal::pipeline {

/*
  Turns a routing decision into a runnable pipeline.

    generate -> FullGenerationPipeline over pipeline.enabled_tasks
    edit     -> EditPipeline over the decision's tasks
*/
class PipelineFactory {
 public:
  // Throws util::UnknownTask for an unknown id in pipeline.enabled_tasks.
  explicit PipelineFactory(const proposal::runtime::config::RuntimeConfig& config);

  // Throws util::UnknownTask when the decision names tasks the registry
  // does not know and util::InvalidState for conversation decisions.
  std::unique_ptr<Pipeline> Create(const routing::RoutingDecision& decision, session::Session& session) const;

  registry::TaskSet enabled_tasks() const {
    return enabled_;
  }

 private:
  registry::TaskSet enabled_;
  bool              compile_after_edit_;
};

} // namespace proposal::pipeline
