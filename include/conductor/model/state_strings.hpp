#pragma once

#include "conductor/core/error.hpp"
#include "conductor/model/types.hpp"

#include <algorithm>
#include <array>
#include <string_view>
#include <type_traits>
#include <utility>

namespace conductor {

template <typename E>
struct EnumNames;

template <>
struct EnumNames<Complexity> {
  static constexpr std::array<std::string_view, 5> names = {
      "atomic", "simple", "moderate", "complex", "enterprise"};
};

template <>
struct EnumNames<ExecutionPattern> {
  static constexpr std::array<std::string_view, 3> names = {
      "single", "pipeline", "fork_join"};
};

template <>
struct EnumNames<SubtaskStatus> {
  static constexpr std::array<std::string_view, 6> names = {
      "pending", "ready", "running", "succeeded", "failed", "skipped"};
};

template <>
struct EnumNames<Strategy> {
  static constexpr std::array<std::string_view, 4> names = {
      "direct", "mechanical-fix", "regenerate", "simplify"};
};

template <>
struct EnumNames<TaskStage> {
  static constexpr std::array<std::string_view, 8> names = {
      "submitted", "routing",  "implementing", "reviewing",
      "testing",   "complete", "failed",       "escalated"};
};

template <>
struct EnumNames<CircuitState> {
  static constexpr std::array<std::string_view, 3> names = {
      "closed", "open", "half_open"};
};

template <>
struct EnumNames<Outcome> {
  static constexpr std::array<std::string_view, 2> names = {"success",
                                                            "failure"};
};

template <>
struct EnumNames<FailureSignature> {
  static constexpr std::array<std::string_view, 7> names = {
      "missing-current-state", "missing-target-file", "vague-requirements",
      "syntax-error",          "test-failure",        "timeout",
      "unknown"};
};

template <>
struct EnumNames<FailurePolicy> {
  static constexpr std::array<std::string_view, 2> names = {"graceful",
                                                            "all_or_nothing"};
};

template <typename E>
concept NamedEnum = std::is_enum_v<E> && requires {
  { EnumNames<E>::names.size() } -> std::convertible_to<std::size_t>;
};

template <NamedEnum E>
[[nodiscard]] constexpr auto to_string_view(E value) noexcept
    -> std::string_view {
  auto idx = static_cast<std::size_t>(std::to_underlying(value));
  return idx < EnumNames<E>::names.size() ? EnumNames<E>::names[idx]
                                          : "unknown";
}

// Unknown names are an error rather than a silent default: persisted history
// and configuration must round-trip exactly.
template <NamedEnum E>
[[nodiscard]] auto parse(std::string_view name) -> Result<E> {
  const auto& names = EnumNames<E>::names;
  auto it = std::ranges::find(names, name);
  if (it == names.end()) {
    return fail(Error::InvalidArgument);
  }
  return static_cast<E>(std::ranges::distance(names.begin(), it));
}

}  // namespace conductor
