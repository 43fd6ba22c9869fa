#include "conductor/orchestrator/decomposer.hpp"

#include "test_utils.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace conductor;
using conductor::test::subtask_id;

namespace {

auto make_task(std::string description) -> Task {
  Task task;
  task.id = test::task_id("task_1_ab");
  task.description = std::move(description);
  task.complexity = Decomposer::classify(Decomposer::analyze(task.description));
  return task;
}

auto deps_of(const SubtaskGraph& graph, std::string_view id)
    -> std::vector<std::string> {
  std::vector<std::string> out;
  for (const auto& d : graph.subtask(graph.get_index(subtask_id(id))).depends_on) {
    out.push_back(d.str());
  }
  std::ranges::sort(out);
  return out;
}

}  // namespace

TEST(DecomposerAnalyzeTest, FindsFileTargets) {
  auto signals = Decomposer::analyze(
      "Update src/api.py, src/db.py and (include/ui.hpp) to log requests.");
  EXPECT_EQ(signals.file_targets,
            (std::vector<std::string>{"src/api.py", "src/db.py",
                                      "include/ui.hpp"}));
}

TEST(DecomposerAnalyzeTest, TargetsAreDeduplicated) {
  auto signals = Decomposer::analyze("edit main.cpp then recompile main.cpp");
  EXPECT_EQ(signals.file_targets, std::vector<std::string>{"main.cpp"});
}

TEST(DecomposerAnalyzeTest, ListItemsBeatHeadings) {
  auto with_items = Decomposer::analyze(
      "# Login\nWork items:\n- add form\n2. validate input\n* store session\n");
  EXPECT_EQ(with_items.sections,
            (std::vector<std::string>{"add form", "validate input",
                                      "store session"}));

  auto headings_only =
      Decomposer::analyze("# Backend\nstuff\n## Frontend\nmore stuff\n");
  EXPECT_EQ(headings_only.sections,
            (std::vector<std::string>{"Backend", "Frontend"}));
}

TEST(DecomposerAnalyzeTest, DetectsConcernsAndScope) {
  auto signals = Decomposer::analyze(
      "Migrate the database schema and add tests for the API endpoints");
  EXPECT_TRUE(signals.system_wide);
  EXPECT_NE(std::ranges::find(signals.concerns, "database"),
            signals.concerns.end());
  EXPECT_NE(std::ranges::find(signals.concerns, "testing"),
            signals.concerns.end());
  EXPECT_NE(std::ranges::find(signals.concerns, "api"), signals.concerns.end());
}

TEST(DecomposerClassifyTest, TiersFollowSignals) {
  EXPECT_EQ(Decomposer::classify(
                Decomposer::analyze("fix typo in README line 10")),
            Complexity::Atomic);
  EXPECT_EQ(Decomposer::classify(Decomposer::analyze(
                "Rework the retry loop in worker.cpp so that it stops after "
                "the configured number of attempts and logs each one")),
            Complexity::Simple);
  EXPECT_EQ(Decomposer::classify(
                Decomposer::analyze("Update parser.cpp and lexer.cpp")),
            Complexity::Moderate);
  EXPECT_EQ(Decomposer::classify(
                Decomposer::analyze("Update a.py, b.py and c.py")),
            Complexity::Complex);
  EXPECT_EQ(Decomposer::classify(Decomposer::analyze(
                "Migrate a.py, b.py and c.py to the new architecture")),
            Complexity::Enterprise);
}

TEST(DecomposerTest, AtomicTaskIsSingleSubtask) {
  Decomposer decomposer;
  auto task = make_task("fix typo in README line 10");
  ASSERT_EQ(task.complexity, Complexity::Atomic);

  auto plan = decomposer.decompose(task);
  ASSERT_TRUE(plan) << plan.error().message();
  EXPECT_EQ(plan->pattern, ExecutionPattern::Single);
  ASSERT_EQ(plan->graph.size(), 1U);

  const auto& only = plan->graph.subtask(0);
  EXPECT_EQ(only.capability, capability::kImplement);
  EXPECT_TRUE(only.depends_on.empty());
  EXPECT_EQ(only.task_id, task.id);
  EXPECT_EQ(only.description, task.description);
}

TEST(DecomposerTest, ModerateTaskIsImplementThenValidate) {
  Decomposer decomposer;
  auto plan = decomposer.decompose(make_task("Update parser.cpp and lexer.cpp"));
  ASSERT_TRUE(plan);
  EXPECT_EQ(plan->complexity, Complexity::Moderate);
  EXPECT_EQ(plan->pattern, ExecutionPattern::Pipeline);
  ASSERT_EQ(plan->graph.size(), 2U);
  EXPECT_EQ(deps_of(plan->graph, "task_1_ab.validate"),
            std::vector<std::string>{"task_1_ab.implement"});
  const auto& validation = plan->graph.subtask(
      plan->graph.get_index(subtask_id("task_1_ab.validate")));
  EXPECT_EQ(validation.capability, capability::kValidate);
}

TEST(DecomposerTest, ThreeFileTargetsForkAndJoin) {
  Decomposer decomposer;
  auto plan = decomposer.decompose(
      make_task("Update src/api.py, src/db.py and src/ui.js to use the new "
                "logger"));
  ASSERT_TRUE(plan) << plan.error().message();
  EXPECT_EQ(plan->complexity, Complexity::Complex);
  EXPECT_EQ(plan->pattern, ExecutionPattern::ForkJoin);
  ASSERT_EQ(plan->graph.size(), 5U);
  ASSERT_TRUE(plan->graph.is_valid());

  EXPECT_TRUE(deps_of(plan->graph, "task_1_ab.plan").empty());
  for (auto impl : {"task_1_ab.implement_1", "task_1_ab.implement_2",
                    "task_1_ab.implement_3"}) {
    EXPECT_EQ(deps_of(plan->graph, impl),
              std::vector<std::string>{"task_1_ab.plan"});
    EXPECT_EQ(plan->graph.subtask(plan->graph.get_index(subtask_id(impl)))
                  .capability,
              capability::kImplement);
  }
  EXPECT_EQ(deps_of(plan->graph, "task_1_ab.validate"),
            (std::vector<std::string>{"task_1_ab.implement_1",
                                      "task_1_ab.implement_2",
                                      "task_1_ab.implement_3"}));

  auto sinks = plan->graph.sinks();
  ASSERT_EQ(sinks.size(), 1U);
  EXPECT_EQ(plan->graph.get_key(sinks[0]).str(), "task_1_ab.validate");
}

TEST(DecomposerTest, FanOutIsCapped) {
  Decomposer decomposer(DecomposerOptions{.max_fan_out = 2});
  auto plan = decomposer.decompose(make_task("Update a.py, b.py, c.py and d.py"));
  ASSERT_TRUE(plan);
  EXPECT_EQ(plan->graph.size(), 4U);
  const auto& impl =
      plan->graph.subtask(plan->graph.get_index(subtask_id("task_1_ab.implement_1")));
  EXPECT_NE(impl.description.find("a.py, c.py"), std::string::npos);
}

TEST(DecomposerTest, ComplexWithoutIndependentUnitsFallsBackToPipeline) {
  Decomposer decomposer;
  Task task;
  task.id = test::task_id("task_1_ab");
  task.description = "Rewrite the scheduler";
  task.complexity = Complexity::Complex;

  auto plan = decomposer.decompose(task);
  ASSERT_TRUE(plan);
  EXPECT_EQ(plan->complexity, Complexity::Complex);
  EXPECT_EQ(plan->pattern, ExecutionPattern::Pipeline);
  EXPECT_EQ(plan->graph.size(), 2U);
}

TEST(DecomposerTest, ReasoningMentionsTierAndPattern) {
  Decomposer decomposer;
  auto plan = decomposer.decompose(make_task("Update a.py, b.py and c.py"));
  ASSERT_TRUE(plan);
  EXPECT_NE(plan->reasoning.find("complex"), std::string::npos);
  EXPECT_NE(plan->reasoning.find("fork_join"), std::string::npos);
  EXPECT_NE(plan->reasoning.find("5 subtask(s)"), std::string::npos);
}
