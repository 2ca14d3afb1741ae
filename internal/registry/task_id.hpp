#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <vector>

#include "internal/state/state_key.hpp"

namespace proposal::registry {

/*
  Closed set of task identifiers, in canonical (declaration) order.

  Canonical order is the tie-breaker everywhere a task set is listed:
  closure expansion, level contents, logging.
*/
enum class TaskId : uint8_t {
  kTitle,
  kScopeRefinement,
  kBusinessAnalyst,
  kTechnicalArchitect,
  kProjectManager,
  kResourceAllocation,
  kFinalCompilation,
};

inline constexpr std::size_t kTaskCount = 7;

class TaskSet {
 public:
  constexpr TaskSet() = default;

  constexpr TaskSet(std::initializer_list<TaskId> ids) {
    for (auto id : ids) {
      bits_ |= Bit(id);
    }
  }

  constexpr void Insert(TaskId id) {
    bits_ |= Bit(id);
  }

  constexpr void Erase(TaskId id) {
    bits_ &= static_cast<uint8_t>(~Bit(id));
  }

  constexpr bool Contains(TaskId id) const {
    return (bits_ & Bit(id)) != 0;
  }

  constexpr bool Empty() const {
    return bits_ == 0;
  }

  constexpr bool Intersects(TaskSet other) const {
    return (bits_ & other.bits_) != 0;
  }

  constexpr TaskSet Union(TaskSet other) const {
    TaskSet out;
    out.bits_ = static_cast<uint8_t>(bits_ | other.bits_);
    return out;
  }

  constexpr TaskSet Intersection(TaskSet other) const {
    TaskSet out;
    out.bits_ = static_cast<uint8_t>(bits_ & other.bits_);
    return out;
  }

  // Tasks with a lower canonical index than `id`.
  static constexpr TaskSet Before(TaskId id) {
    TaskSet out;
    out.bits_ = static_cast<uint8_t>(Bit(id) - 1);
    return out;
  }

  constexpr std::size_t Size() const {
    std::size_t n = 0;
    for (uint8_t b = bits_; b != 0; b &= static_cast<uint8_t>(b - 1)) ++n;
    return n;
  }

  constexpr bool IsSubsetOf(TaskSet other) const {
    return (bits_ & ~other.bits_) == 0;
  }

  // Members in canonical order.
  std::vector<TaskId> ToVector() const;

  constexpr bool operator==(const TaskSet& other) const {
    return bits_ == other.bits_;
  }

  constexpr bool operator!=(const TaskSet& other) const {
    return bits_ != other.bits_;
  }

 private:
  static constexpr uint8_t Bit(TaskId id) {
    return static_cast<uint8_t>(1u << static_cast<unsigned>(id));
  }

  uint8_t bits_ = 0;
};

struct TaskDescriptor {
  TaskId             id;
  std::string_view   name;
  std::string_view   display_name;
  std::string_view   description;
  state::StateKeySet outputs;
  TaskSet            dependencies;
  bool               sink;
};

using state::StateKey;

inline constexpr std::array<TaskDescriptor, kTaskCount> kTaskDescriptors = {{
    {TaskId::kTitle,
     "title",
     "Proposal Title Generator",
     "Generates a concise proposal title from the idea",
     {StateKey::kProposalTitle},
     {},
     false},
    {TaskId::kScopeRefinement,
     "scope_refinement",
     "Scope Refinement Specialist",
     "Handles initial idea refinement and scope definition",
     {StateKey::kRefinedScope, StateKey::kSimilarProducts},
     {},
     false},
    {TaskId::kBusinessAnalyst,
     "business_analyst",
     "Business Analyst",
     "Handles business viability and market analysis",
     {StateKey::kBusinessAnalysis},
     {TaskId::kScopeRefinement},
     false},
    {TaskId::kTechnicalArchitect,
     "technical_architect",
     "Technical Architect",
     "Handles technical specifications and architecture",
     {StateKey::kTechnicalSpec},
     {TaskId::kScopeRefinement, TaskId::kBusinessAnalyst},
     false},
    {TaskId::kProjectManager,
     "project_manager",
     "Project Manager",
     "Handles project planning and timelines",
     {StateKey::kProjectPlan},
     {TaskId::kScopeRefinement, TaskId::kBusinessAnalyst, TaskId::kTechnicalArchitect},
     false},
    {TaskId::kResourceAllocation,
     "resource_allocation",
     "Resource Allocation",
     "Handles budget and resource allocation",
     {StateKey::kResourcePlan},
     {TaskId::kScopeRefinement, TaskId::kBusinessAnalyst, TaskId::kTechnicalArchitect, TaskId::kProjectManager},
     false},
    {TaskId::kFinalCompilation,
     "final_compilation",
     "Final Compilation",
     "Compiles all sections into the final proposal",
     {StateKey::kFinalDocument, StateKey::kCurrentStage, StateKey::kError},
     {TaskId::kTitle, TaskId::kScopeRefinement, TaskId::kBusinessAnalyst, TaskId::kTechnicalArchitect,
      TaskId::kProjectManager, TaskId::kResourceAllocation},
     true},
}};

constexpr const TaskDescriptor& Describe(TaskId id) {
  return kTaskDescriptors[static_cast<std::size_t>(id)];
}

constexpr std::string_view TaskName(TaskId id) {
  return Describe(id).name;
}

std::optional<TaskId> ParseTaskId(std::string_view name);

constexpr TaskSet AllTasks() {
  TaskSet out;
  for (const auto& d : kTaskDescriptors) out.Insert(d.id);
  return out;
}

constexpr TaskSet SinkTasks() {
  TaskSet out;
  for (const auto& d : kTaskDescriptors) {
    if (d.sink) out.Insert(d.id);
  }
  return out;
}

namespace detail {

constexpr bool DescriptorsIndexed() {
  for (std::size_t i = 0; i < kTaskCount; ++i) {
    if (static_cast<std::size_t>(kTaskDescriptors[i].id) != i) return false;
  }
  return true;
}

constexpr bool DependenciesPointBackwards() {
  for (const auto& d : kTaskDescriptors) {
    if (!d.dependencies.IsSubsetOf(TaskSet::Before(d.id))) return false;
  }
  return true;
}

constexpr bool OutputsDisjoint() {
  for (std::size_t i = 0; i < kTaskCount; ++i) {
    for (std::size_t j = i + 1; j < kTaskCount; ++j) {
      if (kTaskDescriptors[i].outputs.Intersects(kTaskDescriptors[j].outputs)) return false;
    }
  }
  return true;
}

} // namespace detail

static_assert(detail::DescriptorsIndexed(), "descriptor table must be indexed by TaskId");
static_assert(detail::DependenciesPointBackwards(), "a task may only depend on tasks declared before it");
static_assert(detail::OutputsDisjoint(), "two tasks declare the same output key");

} // namespace proposal::registry
