#include "full_generation_pipeline.hpp"

namespace proposal::pipeline {

FullGenerationPipeline::FullGenerationPipeline(registry::TaskSet enabled, session::Session* session)
    : Pipeline("full_generation",
               "Full Proposal Generation",
               planner::PlanStatic(enabled),
               planner::PlanKind::kStatic,
               session) {}

} // namespace proposal::pipeline
