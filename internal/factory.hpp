#pragma once

#include <memory>

#include "config/config.pb.h"

namespace proposal::llm {
class GenerationBackend;
class ClassificationBackend;
}
namespace proposal::exec {
class WorkerPool;
}
namespace proposal::registry {
class TaskRegistry;
}
namespace proposal::pipeline {
class PipelineExecutor;
class PipelineFactory;
}
namespace proposal::core {
class Orchestrator;
}

namespace proposal::factory {

struct Backends {
  std::shared_ptr<llm::GenerationBackend> generation;

  // Optional: without it routing relies on triggers and keywords only.
  std::shared_ptr<llm::ClassificationBackend> classification;
};

/*
  Application

  Owns all long-lived objects of the engine. The worker pool is started
  by Build() and stopped when the last owner goes away.
*/
struct Application {
  std::shared_ptr<exec::WorkerPool>           worker_pool;
  std::shared_ptr<registry::TaskRegistry>     registry;
  std::shared_ptr<pipeline::PipelineFactory>  pipelines;
  std::shared_ptr<pipeline::PipelineExecutor> executor;
  std::shared_ptr<core::Orchestrator>         orchestrator;
};

/*
  Build

  Composition root: the only place that wires concrete tasks, backends
  and the worker pool together. Throws util::UnknownTask for unknown
  pipeline.enabled_tasks entries and util::InvalidState without a
  generation backend.
*/
Application Build(const proposal::runtime::config::RuntimeConfig& config, Backends backends);

} // namespace proposal::factory
