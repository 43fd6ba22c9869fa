#include "conductor/model/serialization.hpp"

#include "conductor/model/state_strings.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace conductor {

auto to_millis(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

auto from_millis(std::int64_t ms) -> TimePoint {
  return TimePoint(std::chrono::milliseconds(ms));
}

auto to_json(nlohmann::json& j, const AgentAttempt& attempt) -> void {
  j = nlohmann::json{
      {"subtask_id", attempt.subtask_id.str()},
      {"attempt", attempt.attempt},
      {"strategy", to_string_view(attempt.strategy)},
      {"outcome", to_string_view(attempt.outcome)},
      {"started_at", to_millis(attempt.started_at)},
      {"finished_at", to_millis(attempt.finished_at)},
  };
  if (attempt.signature) {
    j["signature"] = to_string_view(*attempt.signature);
  }
  if (!attempt.error.empty()) {
    j["error"] = attempt.error;
  }
  if (!attempt.touched_files.empty()) {
    j["touched_files"] = attempt.touched_files;
  }
}

auto to_json(nlohmann::json& j, const EscalationRecord& record) -> void {
  auto signatures = nlohmann::json::array();
  for (auto sig : record.failure_signatures) {
    signatures.push_back(to_string_view(sig));
  }

  j = nlohmann::json{
      {"task_id", record.task_id.str()},
      {"description", record.description},
      {"stage", to_string_view(record.stage)},
      {"retry_count", record.retry_count},
      {"max_retries", record.max_retries},
      {"attempts", record.attempts},
      {"failure_signatures", std::move(signatures)},
      {"touched_files", record.touched_files},
      {"next_step_hint", record.next_step_hint},
  };
}

auto escalation_to_json(const EscalationRecord& record) -> std::string {
  nlohmann::json j = record;
  return j.dump(2);
}

auto escalation_to_text(const EscalationRecord& record) -> std::string {
  std::string out;
  auto it = std::back_inserter(out);
  fmt::format_to(it, "Task {} escalated after {}/{} retries\n",
                 record.task_id, record.retry_count, record.max_retries);
  fmt::format_to(it, "Description: {}\n", record.description);
  fmt::format_to(it, "Attempts:\n");
  for (const auto& a : record.attempts) {
    fmt::format_to(it, "  #{} {} [{}] {}", a.attempt, a.subtask_id,
                   to_string_view(a.strategy), to_string_view(a.outcome));
    if (a.signature) {
      fmt::format_to(it, " ({})", to_string_view(*a.signature));
    }
    if (!a.error.empty()) {
      fmt::format_to(it, ": {}", a.error);
    }
    out.push_back('\n');
  }
  if (!record.touched_files.empty()) {
    fmt::format_to(it, "Touched: {}\n", fmt::join(record.touched_files, ", "));
  }
  fmt::format_to(it, "Next step: {}\n", record.next_step_hint);
  return out;
}

auto encode_string_list(const std::vector<std::string>& items) -> std::string {
  return nlohmann::json(items).dump();
}

auto decode_string_list(std::string_view text)
    -> Result<std::vector<std::string>> {
  if (text.empty()) {
    return std::vector<std::string>{};
  }
  auto j = nlohmann::json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_array()) {
    return fail(Error::ParseError);
  }
  std::vector<std::string> items;
  items.reserve(j.size());
  for (const auto& item : j) {
    if (!item.is_string()) {
      return fail(Error::ParseError);
    }
    items.push_back(item.get<std::string>());
  }
  return items;
}

}  // namespace conductor
