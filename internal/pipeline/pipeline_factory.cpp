#include "pipeline_factory.hpp"

#include "internal/observability/logging.hpp"
#include "internal/pipeline/edit_pipeline.hpp"
#include "internal/pipeline/full_generation_pipeline.hpp"
#include "internal/routing/routing_decision.hpp"
#include "internal/session/session.hpp"
#include "internal/util/errors.hpp"

namespace proposal::pipeline {

namespace {

registry::TaskSet ParseEnabled(const proposal::runtime::config::PipelineConfig& config) {
  if (config.enabled_tasks().empty()) return registry::AllTasks();

  registry::TaskSet enabled;
  for (const auto& name : config.enabled_tasks()) {
    auto id = registry::ParseTaskId(name);
    if (!id) throw util::UnknownTask("unknown task in pipeline.enabled_tasks: " + name);
    enabled.Insert(*id);
  }
  return enabled;
}

std::string JoinNames(const std::vector<std::string>& names) {
  std::string out;
  for (const auto& name : names) {
    if (!out.empty()) out += ", ";
    out += name;
  }
  return out;
}

} // namespace

PipelineFactory::PipelineFactory(const proposal::runtime::config::RuntimeConfig& config)
    : enabled_(ParseEnabled(config.pipeline())),
      compile_after_edit_(config.pipeline().compile_after_edit()) {}

std::unique_ptr<Pipeline> PipelineFactory::Create(const routing::RoutingDecision& decision,
                                                  session::Session& session) const {
  if (!decision.unresolved_task_ids.empty()) {
    throw util::UnknownTask("unknown task ids: " + JoinNames(decision.unresolved_task_ids));
  }

  switch (decision.action) {
    case routing::Action::kGenerate:
      return std::make_unique<FullGenerationPipeline>(enabled_, &session);

    case routing::Action::kEdit: {
      EditRequest request;
      request.requested          = decision.task_ids;
      request.generated_before   = session.IsDocumentGenerated();
      request.compile_after_edit = compile_after_edit_;

      auto pipeline = std::make_unique<EditPipeline>(request, &session);
      PROPOSAL_LOG_INFO("edit pipeline planned",
                        {observability::StringField("plan", planner::DescribePlan(pipeline->levels())),
                         observability::BoolField("generated_before", request.generated_before)});
      return pipeline;
    }

    case routing::Action::kConversation:
      break;
  }

  throw util::InvalidState("conversation decisions do not run a pipeline");
}

} // namespace proposal::pipeline
