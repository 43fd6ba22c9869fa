#include "conductor/pipeline/pattern_learner.hpp"

#include "conductor/pipeline/failure_classifier.hpp"

#include <algorithm>

namespace conductor {

FailurePatternLearner::FailurePatternLearner(int min_occurrences)
    : min_occurrences_(std::max(min_occurrences, 1)) {
}

auto FailurePatternLearner::observe(std::span<const AgentAttempt> attempts)
    -> void {
  std::lock_guard lock(mu_);

  for (std::size_t i = 0; i < attempts.size(); ++i) {
    const auto& a = attempts[i];
    if (a.outcome != Outcome::Failure) {
      continue;
    }
    FailureSignature sig =
        a.signature.value_or(classify_failure(a.error));
    auto& stats = stats_[sig];
    ++stats.occurrences;
    if (!a.error.empty() && stats.examples.size() < kMaxExamples &&
        std::ranges::find(stats.examples, a.error) == stats.examples.end()) {
      stats.examples.push_back(a.error);
    }

    // The next success of the same subtask is what recovered from it.
    for (std::size_t j = i + 1; j < attempts.size(); ++j) {
      if (attempts[j].subtask_id == a.subtask_id &&
          attempts[j].outcome == Outcome::Success) {
        ++stats.recovered_by[attempts[j].strategy];
        break;
      }
    }
  }
}

auto FailurePatternLearner::best_strategy(const Stats& stats)
    -> std::optional<Strategy> {
  std::optional<Strategy> best;
  int best_count = 0;
  for (const auto& [strategy, count] : stats.recovered_by) {
    if (count > best_count) {
      best = strategy;
      best_count = count;
    }
  }
  return best;
}

auto FailurePatternLearner::analyze() const -> std::vector<FailurePattern> {
  std::lock_guard lock(mu_);

  std::vector<FailurePattern> patterns;
  for (const auto& [sig, stats] : stats_) {
    if (stats.occurrences < min_occurrences_) {
      continue;
    }
    patterns.push_back(FailurePattern{
        .signature = sig,
        .occurrences = stats.occurrences,
        .example_errors = stats.examples,
        .suggested_fix = std::string(suggested_fix(sig)),
        .effective_strategy = best_strategy(stats),
    });
  }

  std::ranges::stable_sort(patterns, [](const auto& a, const auto& b) {
    return a.occurrences > b.occurrences;
  });
  return patterns;
}

auto FailurePatternLearner::recommend(FailureSignature signature) const
    -> std::optional<Strategy> {
  std::lock_guard lock(mu_);
  auto it = stats_.find(signature);
  if (it == stats_.end()) {
    return std::nullopt;
  }
  return best_strategy(it->second);
}

}  // namespace conductor
