#pragma once

#include <array>
#include <string_view>
#include <vector>

#include "internal/registry/task_id.hpp"

namespace proposal::routing {

struct TaskKeywords {
  registry::TaskId              task;
  std::vector<std::string_view> keywords;
};

// Deterministic keyword lists used when the classifier is unavailable.
const std::array<TaskKeywords, 5>& KeywordTable();

// Tasks whose keyword list has a substring match in `lowered`.
registry::TaskSet MatchKeywords(std::string_view lowered);

} // namespace proposal::routing
