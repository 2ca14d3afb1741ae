#include "factory.hpp"

#include "internal/core/orchestrator.hpp"
#include "internal/exec/task_executor.hpp"
#include "internal/exec/worker_pool.hpp"
#include "internal/llm/language_model.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/pipeline_executor.hpp"
#include "internal/pipeline/pipeline_factory.hpp"
#include "internal/registry/task_registry.hpp"
#include "internal/routing/routing_classifier.hpp"
#include "internal/settings/settings_resolver.hpp"
#include "internal/tasks/task_catalog.hpp"
#include "internal/util/errors.hpp"

namespace proposal::factory {

/*
    Build full engine dependency graph
*/
Application Build(const proposal::runtime::config::RuntimeConfig& config, Backends backends) {
  if (!backends.generation) throw util::InvalidState("a generation backend is required");

  Application app;

  // ------------------------------------------------------------------
  // Pipelines (validates enabled_tasks before any thread starts)
  // ------------------------------------------------------------------
  app.pipelines = std::make_shared<pipeline::PipelineFactory>(config);

  // ------------------------------------------------------------------
  // Tasks
  // ------------------------------------------------------------------
  app.registry = tasks::BuildTaskRegistry(backends.generation);

  // ------------------------------------------------------------------
  // Execution
  // ------------------------------------------------------------------
  app.worker_pool = std::make_shared<exec::WorkerPool>(config.workers().threads());
  app.worker_pool->Start();

  auto task_executor = std::make_shared<exec::TaskExecutor>(app.worker_pool, app.registry);
  app.executor       = std::make_shared<pipeline::PipelineExecutor>(task_executor);

  // ------------------------------------------------------------------
  // Routing + settings
  // ------------------------------------------------------------------
  auto classifier = std::make_shared<routing::RoutingClassifier>(config, backends.classification);
  auto resolver   = std::make_shared<settings::SettingsResolver>(config);

  app.orchestrator = std::make_shared<core::Orchestrator>(classifier, resolver, app.pipelines, app.executor);

  PROPOSAL_LOG_INFO("engine ready",
                    {observability::IntField("threads", static_cast<std::int64_t>(app.worker_pool->thread_count())),
                     observability::BoolField("classifier", backends.classification != nullptr),
                     observability::BoolField("compile_after_edit", config.pipeline().compile_after_edit())});
  return app;
}

} // namespace proposal::factory
