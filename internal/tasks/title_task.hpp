#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "internal/tasks/task.hpp"

namespace proposal::llm {
class GenerationBackend;
}

namespace proposal::tasks {

/*
  Writes proposal_title.

  When a title already exists and the user said something this turn,
  the current title and the utterance are passed along so the backend
  proposes a different one. A failed or empty backend answer falls back
  to "<idea> Proposal".
*/
class TitleTask final : public Task {
 public:
  explicit TitleTask(std::shared_ptr<llm::GenerationBackend> backend);

  registry::TaskId id() const override {
    return registry::TaskId::kTitle;
  }

  state::StateUpdate Run(const state::ProjectState& snapshot, TaskContext& context) const override;

 private:
  std::shared_ptr<llm::GenerationBackend> backend_;
};

// Strips surrounding whitespace and quote characters.
std::string CleanTitle(std::string_view raw);

std::string FallbackTitle(std::string_view idea);

} // namespace proposal::tasks
