#pragma once

#include "conductor/core/error.hpp"
#include "conductor/model/types.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace conductor {

[[nodiscard]] auto to_millis(TimePoint tp) -> std::int64_t;
[[nodiscard]] auto from_millis(std::int64_t ms) -> TimePoint;

auto to_json(nlohmann::json& j, const AgentAttempt& attempt) -> void;
auto to_json(nlohmann::json& j, const EscalationRecord& record) -> void;

[[nodiscard]] auto escalation_to_json(const EscalationRecord& record)
    -> std::string;

// Multi-line, human-readable attempt history for reviewers.
[[nodiscard]] auto escalation_to_text(const EscalationRecord& record)
    -> std::string;

// JSON array <-> string list, used for dependency and touched-file columns.
[[nodiscard]] auto encode_string_list(const std::vector<std::string>& items)
    -> std::string;
[[nodiscard]] auto decode_string_list(std::string_view text)
    -> Result<std::vector<std::string>>;

}  // namespace conductor
