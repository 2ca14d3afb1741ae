#pragma once

#include "pipeline.hpp"

namespace proposal::pipeline {

/*
  Generates the whole document:

      [title] -> [content sections] -> [final_compilation]

  The title runs alone in the first level, so callers can show it from the
  session before the content levels start.
*/
class FullGenerationPipeline final : public Pipeline {
 public:
  // `session` may be null; it must outlive the pipeline otherwise.
  FullGenerationPipeline(registry::TaskSet enabled, session::Session* session);
};

} // namespace proposal::pipeline
