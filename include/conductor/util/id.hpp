#pragma once

#include <fmt/format.h>

#include <chrono>
#include <concepts>
#include <cstdint>
#include <functional>
#include <ostream>
#include <random>
#include <string>
#include <string_view>

namespace conductor {

// Phantom type tags for type-safe ID disambiguation
struct TaskTag {};
struct SubtaskTag {};
struct ServiceTag {};

// Type-safe ID wrapper using phantom type pattern
// Prevents accidental mixing of different ID types at compile time
template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }
  [[nodiscard]] auto c_str() const -> const char* { return value_.c_str(); }

  [[nodiscard]] explicit operator std::string() const { return value_; }
  [[nodiscard]] explicit operator std::string_view() const { return value_; }

  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs, const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs, const TypedId& rhs) -> bool = default;

  [[nodiscard]] auto size() const -> size_t { return value_.size(); }

private:
  std::string value_;
};

using TaskId = TypedId<TaskTag>;
using SubtaskId = TypedId<SubtaskTag>;
using ServiceKey = TypedId<ServiceTag>;

namespace detail {
inline auto generate_short_uuid() -> std::string {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint32_t> dis;
  return fmt::format("{:08x}", dis(gen));
}
}  // namespace detail

// Format: "task_<epoch-ms>_<random>", sortable by submission time.
inline auto generate_task_id() -> TaskId {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch())
                .count();
  return TaskId{fmt::format("task_{}_{}", ms, detail::generate_short_uuid())};
}

// Format: "<task_id>.<role>", e.g. "task_1_ab.impl_2".
inline auto generate_subtask_id(const TaskId& task_id, std::string_view role)
    -> SubtaskId {
  return SubtaskId{fmt::format("{}.{}", task_id.value(), role)};
}

inline auto extract_task_id(const SubtaskId& subtask_id) -> TaskId {
  auto sv = subtask_id.value();
  auto pos = sv.rfind('.');
  if (pos != std::string_view::npos) {
    return TaskId{std::string{sv.substr(0, pos)}};
  }
  return TaskId{std::string{sv}};
}

template <typename T>
concept IsTypedId = requires(T id) {
  { id.value() } -> std::convertible_to<std::string_view>;
  { id.empty() } -> std::convertible_to<bool>;
};

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id) -> std::ostream& {
  return os << id.value();
}

}  // namespace conductor

template <typename Tag>
struct std::hash<conductor::TypedId<Tag>> {
  auto operator()(const conductor::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct fmt::formatter<conductor::TypedId<Tag>> : fmt::formatter<std::string_view> {
  auto format(const conductor::TypedId<Tag>& id, fmt::format_context& ctx) const {
    return fmt::formatter<std::string_view>::format(id.value(), ctx);
  }
};
