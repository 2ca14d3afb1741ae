#include "task_catalog.hpp"

#include "internal/tasks/compile_task.hpp"
#include "internal/tasks/section_task.hpp"
#include "internal/tasks/title_task.hpp"

namespace proposal::tasks {

using registry::TaskId;
using state::StateKey;

std::shared_ptr<registry::TaskRegistry> BuildTaskRegistry(std::shared_ptr<llm::GenerationBackend> backend) {
  auto registry = std::make_shared<registry::TaskRegistry>();

  registry->Register(std::make_unique<TitleTask>(backend));

  registry->Register(std::make_unique<SectionTask>(
      TaskId::kScopeRefinement,
      std::vector<SectionSpec>{
          {StateKey::kRefinedScope, "refined_scope", {}, false},
          {StateKey::kSimilarProducts, "similar_products", {StateKey::kRefinedScope}, false},
      },
      backend));

  registry->Register(std::make_unique<SectionTask>(
      TaskId::kBusinessAnalyst,
      std::vector<SectionSpec>{
          {StateKey::kBusinessAnalysis, "business_analysis", {StateKey::kRefinedScope, StateKey::kSimilarProducts}, false},
      },
      backend));

  registry->Register(std::make_unique<SectionTask>(
      TaskId::kTechnicalArchitect,
      std::vector<SectionSpec>{
          {StateKey::kTechnicalSpec, "technical_spec", {StateKey::kRefinedScope, StateKey::kBusinessAnalysis}, false},
      },
      backend));

  registry->Register(std::make_unique<SectionTask>(
      TaskId::kProjectManager,
      std::vector<SectionSpec>{
          {StateKey::kProjectPlan,
           "project_plan",
           {StateKey::kRefinedScope, StateKey::kBusinessAnalysis, StateKey::kTechnicalSpec},
           true},
      },
      backend));

  registry->Register(std::make_unique<SectionTask>(
      TaskId::kResourceAllocation,
      std::vector<SectionSpec>{
          {StateKey::kResourcePlan,
           "resource_plan",
           {StateKey::kRefinedScope, StateKey::kTechnicalSpec, StateKey::kProjectPlan},
           true},
      },
      backend));

  registry->Register(std::make_unique<CompileTask>());

  return registry;
}

} // namespace proposal::tasks
