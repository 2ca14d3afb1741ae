#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "internal/tasks/task.hpp"

namespace proposal::llm {
class GenerationBackend;
}

namespace proposal::tasks {

inline constexpr std::string_view kNotProvided = "Not provided";

/*
  One backend call writing one state key.

  `inputs` are copied from the snapshot (placeholder when empty);
  `with_settings` adds rates, currency, budget and timeline.
*/
struct SectionSpec {
  state::StateKey              output;
  std::string_view             section;
  std::vector<state::StateKey> inputs;
  bool                         with_settings = false;
};

/*
  Content task built from one or more sections. Sections of a task run
  sequentially inside the task's work item and all read the same
  snapshot.
*/
class SectionTask final : public Task {
 public:
  SectionTask(registry::TaskId id, std::vector<SectionSpec> sections, std::shared_ptr<llm::GenerationBackend> backend);

  registry::TaskId id() const override {
    return id_;
  }

  state::StateUpdate Run(const state::ProjectState& snapshot, TaskContext& context) const override;

 private:
  registry::TaskId                        id_;
  std::vector<SectionSpec>                sections_;
  std::shared_ptr<llm::GenerationBackend> backend_;
};

// Throws util::InvalidState when the snapshot carries no idea.
void RequireInitialIdea(const state::ProjectState& snapshot, registry::TaskId id);

// "role: 60.00/hour" lines in role order, or kNotProvided.
std::string FormatRates(const state::ProjectState& snapshot);

} // namespace proposal::tasks
