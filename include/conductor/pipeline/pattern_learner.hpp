#pragma once

#include "conductor/model/types.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace conductor {

struct FailurePattern {
  FailureSignature signature{FailureSignature::Unknown};
  int occurrences{0};
  // Up to three distinct error texts, first-seen order.
  std::vector<std::string> example_errors;
  std::string suggested_fix;
  // Strategy that most often succeeded on the same subtask after a failure
  // with this signature.
  std::optional<Strategy> effective_strategy;
};

// Aggregates attempt histories across tasks and reports recurring failure
// signatures. Safe to share between orchestrators.
class FailurePatternLearner {
public:
  static constexpr int kDefaultMinOccurrences = 2;
  static constexpr std::size_t kMaxExamples = 3;

  explicit FailurePatternLearner(int min_occurrences = kDefaultMinOccurrences);

  // Adds one task's attempt history.
  auto observe(std::span<const AgentAttempt> attempts) -> void;

  // Signatures seen at least min_occurrences times, most frequent first.
  [[nodiscard]] auto analyze() const -> std::vector<FailurePattern>;

  [[nodiscard]] auto recommend(FailureSignature signature) const
      -> std::optional<Strategy>;

private:
  struct Stats {
    int occurrences{0};
    std::vector<std::string> examples;
    std::map<Strategy, int> recovered_by;
  };

  [[nodiscard]] static auto best_strategy(const Stats& stats)
      -> std::optional<Strategy>;

  int min_occurrences_;
  mutable std::mutex mu_;
  std::map<FailureSignature, Stats> stats_;
};

}  // namespace conductor
