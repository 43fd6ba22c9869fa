#pragma once

#include "conductor/model/types.hpp"

#include <span>
#include <string>
#include <string_view>

namespace conductor {

// Maps a worker's error text to a coarse signature. Detectors run in a fixed
// order and the first match wins; matching is case-insensitive.
[[nodiscard]] auto classify_failure(std::string_view error) -> FailureSignature;

// Concrete follow-up actions for a reviewer, most important first.
[[nodiscard]] auto next_steps(FailureSignature signature)
    -> std::span<const std::string_view>;

// next_steps() joined into a single line.
[[nodiscard]] auto next_step_hint(FailureSignature signature) -> std::string;

// One-line remedy used by the pattern learner.
[[nodiscard]] auto suggested_fix(FailureSignature signature)
    -> std::string_view;

}  // namespace conductor
