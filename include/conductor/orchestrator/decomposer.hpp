#pragma once

#include "conductor/core/error.hpp"
#include "conductor/dag/dag.hpp"
#include "conductor/model/types.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace conductor {

// Capability tags used for generated subtasks.
namespace capability {
inline constexpr std::string_view kPlan = "plan";
inline constexpr std::string_view kImplement = "implement";
inline constexpr std::string_view kReview = "review";
inline constexpr std::string_view kValidate = "validate";
}  // namespace capability

struct ComplexitySignals {
  std::vector<std::string> file_targets;
  // Enumerated list items, or headings when there are no list items.
  std::vector<std::string> sections;
  std::vector<std::string> concerns;
  bool system_wide{false};
  std::size_t word_count{0};
};

struct DecompositionPlan {
  Complexity complexity{Complexity::Atomic};
  ExecutionPattern pattern{ExecutionPattern::Single};
  std::string reasoning;
  std::vector<std::string> file_targets;
  SubtaskGraph graph;
};

struct DecomposerOptions {
  std::size_t max_fan_out{8};
};

// Heuristic task decomposition. When signals are ambiguous the lower tier
// wins: an under-decomposed task retries less surface area than an
// over-decomposed one.
class Decomposer {
public:
  explicit Decomposer(DecomposerOptions options = {});

  [[nodiscard]] static auto analyze(std::string_view description)
      -> ComplexitySignals;
  [[nodiscard]] static auto classify(const ComplexitySignals& signals)
      -> Complexity;

  // Builds the subtask graph for the task's complexity tier:
  //   atomic/simple       one implement subtask
  //   moderate            implement -> validate
  //   complex/enterprise  plan -> N x implement -> validate
  // A fork-join with fewer than two independent units falls back to the
  // moderate pipeline.
  [[nodiscard]] auto decompose(const Task& task) const
      -> Result<DecompositionPlan>;

private:
  DecomposerOptions options_;
};

}  // namespace conductor
