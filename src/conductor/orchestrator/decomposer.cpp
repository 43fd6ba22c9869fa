#include "conductor/orchestrator/decomposer.hpp"

#include "conductor/model/state_strings.hpp"
#include "conductor/util/log.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <regex>
#include <sstream>

namespace conductor {

namespace {

struct ConcernGroup {
  std::string_view name;
  std::array<std::string_view, 5> words;
};

constexpr std::array<ConcernGroup, 10> kConcernGroups = {{
    {"testing", {"test", "tests", "testing", "coverage", "assert"}},
    {"documentation", {"docs", "documentation", "readme", "docstring", ""}},
    {"configuration", {"config", "configuration", "settings", "env", ""}},
    {"security", {"security", "auth", "permission", "token", "secret"}},
    {"performance", {"performance", "latency", "optimize", "cache", "memory"}},
    {"api", {"api", "endpoint", "endpoints", "route", "request"}},
    {"database", {"database", "sql", "schema", "query", "table"}},
    {"ui", {"ui", "frontend", "button", "page", "css"}},
    {"migration", {"migrate", "migration", "upgrade", "", ""}},
    {"refactor", {"refactor", "restructure", "cleanup", "rename", ""}},
}};

constexpr std::array<std::string_view, 6> kSystemWidePhrases = {
    "migrate",        "architecture",      "end-to-end",
    "refactor entire", "implement system", "full stack",
};

auto file_target_regex() -> const std::regex& {
  static const std::regex re(
      R"((?:^|[\s"'`(\[])((?:\.{0,2}/)?(?:[\w.-]+/)*[\w-]+\.)"
      R"((?:py|js|ts|tsx|jsx|c|cc|cpp|cxx|h|hpp|rs|go|java|rb|sh|sql|)"
      R"(md|txt|rst|json|yaml|yml|toml|cfg|conf|ini|html|css)))"
      R"((?=$|[\s"'`)\],:;!?]|\.(?:\s|$)))");
  return re;
}

auto to_lower(std::string_view text) -> std::string {
  std::string out(text);
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

auto trim(std::string_view s) -> std::string_view {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  while (!s.empty() && is_space(s.front())) {
    s.remove_prefix(1);
  }
  while (!s.empty() && is_space(s.back())) {
    s.remove_suffix(1);
  }
  return s;
}

// Returns the item text for "- x", "* x", "+ x", "1. x" and "1) x".
auto list_item(std::string_view line) -> std::optional<std::string_view> {
  if (line.size() >= 2 && (line[0] == '-' || line[0] == '*' || line[0] == '+') &&
      line[1] == ' ') {
    return trim(line.substr(2));
  }
  std::size_t digits = 0;
  while (digits < line.size() &&
         std::isdigit(static_cast<unsigned char>(line[digits]))) {
    ++digits;
  }
  if (digits > 0 && digits + 1 < line.size() &&
      (line[digits] == '.' || line[digits] == ')') && line[digits + 1] == ' ') {
    return trim(line.substr(digits + 2));
  }
  return std::nullopt;
}

auto heading(std::string_view line) -> std::optional<std::string_view> {
  std::size_t hashes = 0;
  while (hashes < line.size() && line[hashes] == '#') {
    ++hashes;
  }
  if (hashes > 0 && hashes < line.size() && line[hashes] == ' ') {
    return trim(line.substr(hashes + 1));
  }
  return std::nullopt;
}

auto words_of(std::string_view lowered) -> std::vector<std::string> {
  std::vector<std::string> words;
  std::string current;
  for (char c : lowered) {
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
      current.push_back(c);
    } else if (!current.empty()) {
      words.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

auto make_subtask(const Task& task, std::string_view role,
                  std::string_view capability, std::string description)
    -> Subtask {
  Subtask s;
  s.id = generate_subtask_id(task.id, role);
  s.task_id = task.id;
  s.description = std::move(description);
  s.capability = std::string(capability);
  return s;
}

// Spreads units over at most `max_groups` implementation subtasks.
auto group_units(const std::vector<std::string>& units, std::size_t max_groups)
    -> std::vector<std::string> {
  std::size_t n = std::min(units.size(), std::max<std::size_t>(max_groups, 1));
  std::vector<std::vector<std::string>> buckets(n);
  for (std::size_t i = 0; i < units.size(); ++i) {
    buckets[i % n].push_back(units[i]);
  }
  std::vector<std::string> groups;
  groups.reserve(n);
  for (const auto& b : buckets) {
    groups.push_back(fmt::format("{}", fmt::join(b, ", ")));
  }
  return groups;
}

}  // namespace

Decomposer::Decomposer(DecomposerOptions options) : options_(options) {
}

auto Decomposer::analyze(std::string_view description) -> ComplexitySignals {
  ComplexitySignals signals;
  std::string lowered = to_lower(description);

  // Leading space lets the boundary group match at the very start.
  std::string padded = " " + std::string(description);
  for (std::sregex_iterator it(padded.begin(), padded.end(),
                               file_target_regex()),
       end;
       it != end; ++it) {
    std::string target = (*it)[1].str();
    if (std::ranges::find(signals.file_targets, target) ==
        signals.file_targets.end()) {
      signals.file_targets.push_back(std::move(target));
    }
  }

  std::vector<std::string> items;
  std::vector<std::string> headings;
  std::istringstream lines{std::string(description)};
  for (std::string line; std::getline(lines, line);) {
    auto trimmed = trim(line);
    if (auto item = list_item(trimmed); item && !item->empty()) {
      items.emplace_back(*item);
    } else if (auto h = heading(trimmed); h && !h->empty()) {
      headings.emplace_back(*h);
    }
  }
  signals.sections = !items.empty() ? std::move(items) : std::move(headings);

  auto words = words_of(lowered);
  signals.word_count = words.size();
  for (const auto& group : kConcernGroups) {
    bool hit = std::ranges::any_of(group.words, [&](std::string_view w) {
      return !w.empty() && std::ranges::find(words, w) != words.end();
    });
    if (hit) {
      signals.concerns.emplace_back(group.name);
    }
  }

  signals.system_wide =
      std::ranges::any_of(kSystemWidePhrases, [&](std::string_view phrase) {
        return lowered.find(phrase) != std::string::npos;
      });
  return signals;
}

auto Decomposer::classify(const ComplexitySignals& signals) -> Complexity {
  std::size_t files = signals.file_targets.size();
  std::size_t sections = signals.sections.size();
  std::size_t concerns = signals.concerns.size();
  std::size_t units = std::max(files, sections);

  if (units >= 3 || (units >= 2 && concerns >= 3)) {
    return signals.system_wide ? Complexity::Enterprise : Complexity::Complex;
  }
  if (units == 2 || concerns >= 2) {
    return Complexity::Moderate;
  }
  if (files <= 1 && sections == 0 && concerns <= 1 &&
      signals.word_count <= 12) {
    return Complexity::Atomic;
  }
  return Complexity::Simple;
}

auto Decomposer::decompose(const Task& task) const
    -> Result<DecompositionPlan> {
  auto signals = analyze(task.description);

  DecompositionPlan plan;
  plan.complexity = task.complexity;
  plan.file_targets = signals.file_targets;

  const auto& units = signals.file_targets.size() >= 2 ? signals.file_targets
                                                       : signals.sections;

  std::vector<Subtask> subtasks;
  switch (task.complexity) {
    case Complexity::Atomic:
    case Complexity::Simple:
      plan.pattern = ExecutionPattern::Single;
      subtasks.push_back(make_subtask(task, "implement", capability::kImplement,
                                      task.description));
      break;

    case Complexity::Complex:
    case Complexity::Enterprise:
      if (units.size() >= 2) {
        plan.pattern = ExecutionPattern::ForkJoin;
        auto planning = make_subtask(task, "plan", capability::kPlan,
                                     fmt::format("Plan: {}", task.description));
        auto validation = make_subtask(
            task, "validate", capability::kValidate,
            fmt::format("Validate: {}", task.description));

        auto groups = group_units(units, options_.max_fan_out);
        for (std::size_t i = 0; i < groups.size(); ++i) {
          auto impl = make_subtask(
              task, fmt::format("implement_{}", i + 1), capability::kImplement,
              fmt::format("Implement {}: {}", groups[i], task.description));
          impl.depends_on.push_back(planning.id);
          validation.depends_on.push_back(impl.id);
          subtasks.push_back(std::move(impl));
        }
        subtasks.insert(subtasks.begin(), std::move(planning));
        subtasks.push_back(std::move(validation));
        break;
      }
      [[fallthrough]];

    case Complexity::Moderate: {
      plan.pattern = ExecutionPattern::Pipeline;
      auto impl = make_subtask(task, "implement", capability::kImplement,
                               task.description);
      auto validation = make_subtask(
          task, "validate", capability::kValidate,
          fmt::format("Validate: {}", task.description));
      validation.depends_on.push_back(impl.id);
      subtasks.push_back(std::move(impl));
      subtasks.push_back(std::move(validation));
      break;
    }
  }

  auto graph = SubtaskGraph::from_subtasks(std::move(subtasks));
  if (!graph) {
    return fail(graph.error());
  }
  plan.graph = std::move(*graph);
  plan.reasoning = fmt::format(
      "{} file target(s), {} section(s), {} concern(s){}: {} as {} with {} "
      "subtask(s)",
      signals.file_targets.size(), signals.sections.size(),
      signals.concerns.size(), signals.system_wide ? ", system-wide" : "",
      to_string_view(plan.complexity), to_string_view(plan.pattern),
      plan.graph.size());

  log::debug("Decomposer[{}]: {}", task.id, plan.reasoning);
  return plan;
}

}  // namespace conductor
