#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <vector>

namespace proposal::state {

/*
  Closed set of ProjectState keys. Each key has exactly one reducer
  (see project_state.hpp) and, for task outputs, exactly one owning task.
*/
enum class StateKey : uint8_t {
  kInitialIdea,
  kUserInput,
  kProposalTitle,
  kRefinedScope,
  kSimilarProducts,
  kBusinessAnalysis,
  kTechnicalSpec,
  kProjectPlan,
  kResourcePlan,
  kFinalDocument,
  kCurrentStage,
  kError,
  kRates,
  kCurrency,
  kInstructions,
  kBudget,
  kTimeline,
  kSectionsGenerated,
};

inline constexpr std::size_t kStateKeyCount = 18;

std::string_view StateKeyName(StateKey key);

class StateKeySet {
 public:
  constexpr StateKeySet() = default;

  constexpr StateKeySet(std::initializer_list<StateKey> keys) {
    for (auto key : keys) {
      bits_ |= Bit(key);
    }
  }

  constexpr void Insert(StateKey key) {
    bits_ |= Bit(key);
  }

  constexpr bool Contains(StateKey key) const {
    return (bits_ & Bit(key)) != 0;
  }

  constexpr bool Empty() const {
    return bits_ == 0;
  }

  constexpr bool Intersects(StateKeySet other) const {
    return (bits_ & other.bits_) != 0;
  }

  constexpr StateKeySet Union(StateKeySet other) const {
    StateKeySet out;
    out.bits_ = bits_ | other.bits_;
    return out;
  }

  std::vector<StateKey> Keys() const;

 private:
  static constexpr uint32_t Bit(StateKey key) {
    return uint32_t{1} << static_cast<uint32_t>(key);
  }

  uint32_t bits_ = 0;
};

} // namespace proposal::state
