#include "conductor/orchestrator/orchestrator.hpp"

#include "conductor/storage/persistence.hpp"

#include "test_utils.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace conductor;
using namespace std::chrono_literals;
using conductor::test::always_fail;
using conductor::test::make_subtask;
using conductor::test::ScriptedWorker;
using conductor::test::subtask_id;
using conductor::test::succeed;
using conductor::test::task_id;

namespace {

auto test_config() -> OrchestratorConfig {
  OrchestratorConfig config;
  config.max_parallelism = 4;
  config.subtask_timeout = 5s;
  config.backoff_base = 1ms;
  config.backoff_cap = 5ms;
  return config;
}

// Limits loose enough that admission control never gets in the way.
auto generous_governor() -> std::shared_ptr<ResilienceGovernor> {
  ResilienceConfig config;
  config.defaults.failure_threshold = 100;
  config.defaults.bucket_capacity = 1000;
  config.defaults.refill_per_minute = 60000.0;
  return std::make_shared<ResilienceGovernor>(config);
}

auto make_context(const std::shared_ptr<IWorker>& worker,
                  OrchestratorConfig config = test_config())
    -> OrchestratorContext {
  OrchestratorContext ctx;
  ctx.config = std::move(config);
  ctx.governor = generous_governor();
  for (auto cap : {capability::kPlan, capability::kImplement,
                   capability::kReview, capability::kValidate}) {
    EXPECT_TRUE(ctx.registry.register_worker(
        std::string(cap), test::service_key("worker.test"), worker));
  }
  return ctx;
}

// Two subtasks nobody depends on: neither is critical.
auto independent_pair() -> std::vector<Subtask> {
  return {make_subtask("task_1_ab.a"), make_subtask("task_1_ab.b")};
}

auto fail_for(std::string_view failing) -> ScriptedWorker::Script {
  return [failing = std::string(failing)](const WorkerRequest& r) {
    if (r.subtask_id.str() == failing) {
      return WorkerResult{.success = false, .error = "tests failed"};
    }
    return WorkerResult{.success = true, .payload = "ok"};
  };
}

}  // namespace

TEST(OrchestratorTest, AtomicTaskRunsOneSubtaskToCompletion) {
  auto worker = std::make_shared<ScriptedWorker>(succeed({"README.md"}));
  auto ctx = make_context(worker);

  std::vector<std::string> integrated;
  int integrations = 0;
  ctx.on_ready_for_integration = [&](const TaskId&,
                                     const std::vector<std::string>& files) {
    ++integrations;
    integrated = files;
  };
  TaskOrchestrator orchestrator(std::move(ctx));

  auto id = orchestrator.submit("fix typo in README line 10");
  ASSERT_TRUE(id) << id.error().message();
  auto plan = orchestrator.decompose(*id);
  ASSERT_TRUE(plan);
  EXPECT_EQ(plan->complexity, Complexity::Atomic);
  EXPECT_EQ(plan->graph.size(), 1U);

  auto verdict = orchestrator.execute(*id);
  ASSERT_TRUE(verdict) << verdict.error().message();
  EXPECT_EQ(verdict->stage, TaskStage::Complete);
  EXPECT_TRUE(verdict->reason.empty());
  EXPECT_EQ(verdict->succeeded.size(), 1U);
  EXPECT_FALSE(verdict->escalation.has_value());
  EXPECT_EQ(worker->calls(), 1);

  EXPECT_EQ(integrations, 1);
  EXPECT_EQ(integrated, std::vector<std::string>{"README.md"});
  EXPECT_EQ(verdict->touched_files, std::vector<std::string>{"README.md"});
}

TEST(OrchestratorTest, ForkJoinValidatesOnlyAfterAllImplementations) {
  std::atomic<int> implemented{0};
  std::atomic<int> seen_by_validate{-1};
  auto worker = std::make_shared<ScriptedWorker>([&](const WorkerRequest& r) {
    if (r.capability == capability::kImplement) {
      test::sleep_ms(10ms);
      implemented.fetch_add(1);
    } else if (r.capability == capability::kValidate) {
      seen_by_validate.store(implemented.load());
    }
    return WorkerResult{.success = true};
  });
  TaskOrchestrator orchestrator(make_context(worker));

  auto id = orchestrator.submit(
      "Update src/api.py, src/db.py and src/ui.js to use the new logger");
  ASSERT_TRUE(id);
  auto verdict = orchestrator.execute(*id);
  ASSERT_TRUE(verdict);

  EXPECT_EQ(verdict->stage, TaskStage::Complete);
  EXPECT_EQ(verdict->succeeded.size(), 5U);
  EXPECT_EQ(worker->calls(), 5);
  EXPECT_EQ(seen_by_validate.load(), 3);

  const auto* tracker = orchestrator.tracker(*id);
  ASSERT_NE(tracker, nullptr);
  std::vector<TaskStage> reached;
  for (const auto& t : tracker->state().transitions) {
    reached.push_back(t.to);
  }
  EXPECT_EQ(reached,
            (std::vector<TaskStage>{TaskStage::Routing, TaskStage::Implementing,
                                    TaskStage::Testing, TaskStage::Complete}));
}

TEST(OrchestratorTest, ExhaustedRetriesEscalateWithFullHistory) {
  auto worker = std::make_shared<ScriptedWorker>(always_fail("tests failed"));
  auto ctx = make_context(worker);
  auto learner = std::make_shared<FailurePatternLearner>();
  ctx.learner = learner;
  std::vector<EscalationRecord> escalations;
  ctx.on_escalation = [&](const EscalationRecord& r) {
    escalations.push_back(r);
  };
  TaskOrchestrator orchestrator(std::move(ctx));

  auto id = orchestrator.submit("fix typo in README line 10");
  ASSERT_TRUE(id);
  auto verdict = orchestrator.execute(*id);
  ASSERT_TRUE(verdict);

  EXPECT_EQ(verdict->stage, TaskStage::Escalated);
  ASSERT_TRUE(verdict->escalation.has_value());
  EXPECT_EQ(verdict->escalation->attempts.size(), 3U);
  EXPECT_EQ(verdict->escalation->retry_count, 3);
  EXPECT_EQ(verdict->escalation->failure_signatures,
            std::vector<FailureSignature>{FailureSignature::TestFailure});

  auto requests = worker->requests();
  ASSERT_EQ(requests.size(), 3U);
  EXPECT_EQ(requests[0].strategy, Strategy::Direct);
  EXPECT_EQ(requests[1].strategy, Strategy::MechanicalFix);
  EXPECT_EQ(requests[2].strategy, Strategy::Regenerate);
  for (std::size_t i = 0; i < requests.size(); ++i) {
    EXPECT_EQ(requests[i].attempt, static_cast<int>(i) + 1);
    EXPECT_EQ(requests[i].prior_attempts.size(), i);
  }

  ASSERT_EQ(escalations.size(), 1U);
  EXPECT_EQ(escalations[0].task_id, *id);
  EXPECT_EQ(escalations[0].attempts.size(), 3U);

  auto patterns = learner->analyze();
  ASSERT_EQ(patterns.size(), 1U);
  EXPECT_EQ(patterns[0].signature, FailureSignature::TestFailure);
  EXPECT_EQ(patterns[0].occurrences, 3);
}

TEST(OrchestratorTest, EscalationHintCarriesLearnedRecovery) {
  auto learner = std::make_shared<FailurePatternLearner>();
  std::vector<AgentAttempt> earlier{
      test::failed_attempt("task_9_zz.impl", Strategy::Direct, "tests failed"),
      test::succeeded_attempt("task_9_zz.impl", Strategy::Regenerate),
  };
  learner->observe(earlier);

  auto worker = std::make_shared<ScriptedWorker>(always_fail("tests failed"));
  auto ctx = make_context(worker);
  ctx.learner = learner;
  std::vector<EscalationRecord> escalations;
  ctx.on_escalation = [&](const EscalationRecord& r) {
    escalations.push_back(r);
  };
  TaskOrchestrator orchestrator(std::move(ctx));

  auto id = orchestrator.submit("fix typo in README line 10");
  ASSERT_TRUE(id);
  auto verdict = orchestrator.execute(*id);
  ASSERT_TRUE(verdict);
  ASSERT_TRUE(verdict->escalation.has_value());

  const std::string learned =
      "test-failure failures have recovered with regenerate before";
  EXPECT_NE(verdict->escalation->next_step_hint.find(learned),
            std::string::npos)
      << verdict->escalation->next_step_hint;
  ASSERT_EQ(escalations.size(), 1U);
  EXPECT_EQ(escalations[0].next_step_hint,
            verdict->escalation->next_step_hint);
}

TEST(OrchestratorTest, FailedAttemptIsRetriedWithNextStrategy) {
  std::atomic<int> n{0};
  auto worker = std::make_shared<ScriptedWorker>([&](const WorkerRequest&) {
    if (n.fetch_add(1) == 0) {
      return WorkerResult{.success = false, .error = "syntax error"};
    }
    return WorkerResult{.success = true};
  });
  TaskOrchestrator orchestrator(make_context(worker));

  auto id = orchestrator.submit("fix typo in README line 10");
  ASSERT_TRUE(id);
  auto verdict = orchestrator.execute(*id);
  ASSERT_TRUE(verdict);
  EXPECT_EQ(verdict->stage, TaskStage::Complete);

  const auto& attempts = orchestrator.tracker(*id)->state().attempts;
  ASSERT_EQ(attempts.size(), 2U);
  EXPECT_EQ(attempts[0].signature, FailureSignature::SyntaxError);
  EXPECT_EQ(attempts[1].strategy, Strategy::MechanicalFix);
  EXPECT_EQ(attempts[1].outcome, Outcome::Success);
}

TEST(OrchestratorTest, NonCriticalFailureDegradesGracefully) {
  auto worker = std::make_shared<ScriptedWorker>(fail_for("task_1_ab.b"));
  TaskOrchestrator orchestrator(make_context(worker));

  auto id = orchestrator.submit(task_id("task_1_ab"), "two independent edits");
  ASSERT_TRUE(id);
  ASSERT_TRUE(orchestrator.set_plan(*id, independent_pair()));
  auto verdict = orchestrator.execute(*id);
  ASSERT_TRUE(verdict);

  EXPECT_EQ(verdict->stage, TaskStage::Complete);
  EXPECT_EQ(verdict->reason, "completed with 1 failed and 0 skipped subtask(s)");
  EXPECT_EQ(verdict->succeeded, std::vector<SubtaskId>{subtask_id("task_1_ab.a")});
  EXPECT_EQ(verdict->failed, std::vector<SubtaskId>{subtask_id("task_1_ab.b")});
  EXPECT_EQ(worker->called_for("task_1_ab.b"), 3);
}

TEST(OrchestratorTest, AllOrNothingEscalatesOnAnyExhaustedSubtask) {
  auto worker = std::make_shared<ScriptedWorker>(fail_for("task_1_ab.b"));
  auto config = test_config();
  config.failure_policy = FailurePolicy::AllOrNothing;
  TaskOrchestrator orchestrator(make_context(worker, config));

  auto id = orchestrator.submit(task_id("task_1_ab"), "two independent edits");
  ASSERT_TRUE(id);
  ASSERT_TRUE(orchestrator.set_plan(*id, independent_pair()));
  auto verdict = orchestrator.execute(*id);
  ASSERT_TRUE(verdict);

  EXPECT_EQ(verdict->stage, TaskStage::Escalated);
  EXPECT_NE(verdict->reason.find("all-or-nothing"), std::string::npos);
  EXPECT_TRUE(verdict->escalation.has_value());
}

TEST(OrchestratorTest, CriticalFailureSkipsDependentsAndEscalates) {
  auto worker = std::make_shared<ScriptedWorker>(fail_for("task_1_ab.a"));
  TaskOrchestrator orchestrator(make_context(worker));

  auto id = orchestrator.submit(task_id("task_1_ab"), "chained edits");
  ASSERT_TRUE(id);
  ASSERT_TRUE(orchestrator.set_plan(
      *id, {make_subtask("task_1_ab.a"),
            make_subtask("task_1_ab.b", {"task_1_ab.a"}, "review")}));
  auto verdict = orchestrator.execute(*id);
  ASSERT_TRUE(verdict);

  EXPECT_EQ(verdict->stage, TaskStage::Escalated);
  EXPECT_EQ(verdict->reason,
            "critical subtask task_1_ab.a exhausted its retry strategies");
  EXPECT_EQ(verdict->failed, std::vector<SubtaskId>{subtask_id("task_1_ab.a")});
  EXPECT_EQ(verdict->skipped, std::vector<SubtaskId>{subtask_id("task_1_ab.b")});
  EXPECT_EQ(worker->called_for("task_1_ab.b"), 0);
}

TEST(OrchestratorTest, AdmissionControlDefersInsteadOfFailing) {
  auto worker = std::make_shared<ScriptedWorker>(succeed());
  auto ctx = make_context(worker);
  ResilienceConfig tight;
  tight.defaults.bucket_capacity = 1;
  tight.defaults.refill_per_minute = 1200.0;  // one token every 50ms
  ctx.governor = std::make_shared<ResilienceGovernor>(tight);
  TaskOrchestrator orchestrator(std::move(ctx));

  auto id = orchestrator.submit(task_id("task_1_ab"), "three edits");
  ASSERT_TRUE(id);
  ASSERT_TRUE(orchestrator.set_plan(
      *id, {make_subtask("task_1_ab.a"), make_subtask("task_1_ab.b"),
            make_subtask("task_1_ab.c")}));

  auto start = std::chrono::steady_clock::now();
  auto verdict = orchestrator.execute(*id);
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_TRUE(verdict);
  EXPECT_EQ(verdict->stage, TaskStage::Complete);
  EXPECT_EQ(verdict->succeeded.size(), 3U);
  EXPECT_EQ(worker->calls(), 3);
  // Deferrals are not attempts.
  EXPECT_EQ(orchestrator.tracker(*id)->state().attempts.size(), 3U);
  EXPECT_GE(elapsed, 90ms);
}

TEST(OrchestratorTest, CancelStopsUnstartedSubtasks) {
  auto worker = std::make_shared<ScriptedWorker>([](const WorkerRequest& r) {
    auto give_up = std::chrono::steady_clock::now() + 5s;
    while (!r.token.is_cancelled() &&
           std::chrono::steady_clock::now() < give_up) {
      test::sleep_ms(2ms);
    }
    return WorkerResult{.success = false, .error = "interrupted"};
  });
  TaskOrchestrator orchestrator(make_context(worker));

  auto id = orchestrator.submit(task_id("task_1_ab"), "chained edits");
  ASSERT_TRUE(id);
  ASSERT_TRUE(orchestrator.set_plan(
      *id, {make_subtask("task_1_ab.a"),
            make_subtask("task_1_ab.b", {"task_1_ab.a"})}));

  std::optional<Result<Verdict>> verdict;
  std::thread runner([&] { verdict = orchestrator.execute(*id); });

  auto give_up = std::chrono::steady_clock::now() + 2s;
  while (worker->calls() == 0 && std::chrono::steady_clock::now() < give_up) {
    test::sleep_ms(1ms);
  }
  ASSERT_EQ(worker->calls(), 1);
  EXPECT_TRUE(orchestrator.cancel(*id));
  runner.join();

  ASSERT_TRUE(verdict.has_value());
  ASSERT_TRUE(*verdict);
  const auto& v = **verdict;
  EXPECT_EQ(v.stage, TaskStage::Failed);
  EXPECT_TRUE(v.cancelled);
  EXPECT_EQ(v.reason, "cancelled");
  EXPECT_EQ(v.failed, std::vector<SubtaskId>{subtask_id("task_1_ab.a")});
  EXPECT_EQ(v.skipped, std::vector<SubtaskId>{subtask_id("task_1_ab.b")});
  // The running attempt finished and was recorded, but not retried.
  EXPECT_EQ(worker->calls(), 1);
  EXPECT_EQ(orchestrator.tracker(*id)->state().attempts.size(), 1U);
}

TEST(OrchestratorTest, CancelBeforeExecuteClosesTask) {
  auto worker = std::make_shared<ScriptedWorker>(succeed());
  TaskOrchestrator orchestrator(make_context(worker));

  auto id = orchestrator.submit("fix typo in README line 10");
  ASSERT_TRUE(id);
  ASSERT_TRUE(orchestrator.cancel(*id));

  auto verdict = orchestrator.execute(*id);
  ASSERT_TRUE(verdict);
  EXPECT_EQ(verdict->stage, TaskStage::Failed);
  EXPECT_TRUE(verdict->cancelled);
  EXPECT_EQ(worker->calls(), 0);
}

TEST(OrchestratorTest, TimedOutAttemptCountsAsFailure) {
  std::atomic<int> n{0};
  auto worker = std::make_shared<ScriptedWorker>([&](const WorkerRequest&) {
    if (n.fetch_add(1) == 0) {
      test::sleep_ms(300ms);
      return WorkerResult{.success = true, .payload = "too late"};
    }
    return WorkerResult{.success = true, .payload = "in time"};
  });
  auto config = test_config();
  config.subtask_timeout = 50ms;
  TaskOrchestrator orchestrator(make_context(worker, config));

  auto id = orchestrator.submit("fix typo in README line 10");
  ASSERT_TRUE(id);
  auto verdict = orchestrator.execute(*id);
  ASSERT_TRUE(verdict);
  EXPECT_EQ(verdict->stage, TaskStage::Complete);

  const auto& attempts = orchestrator.tracker(*id)->state().attempts;
  ASSERT_EQ(attempts.size(), 2U);
  EXPECT_EQ(attempts[0].outcome, Outcome::Failure);
  EXPECT_EQ(attempts[0].signature, FailureSignature::Timeout);
  EXPECT_EQ(attempts[0].error, "timed out after 50ms");
  EXPECT_EQ(attempts[1].payload, "in time");
}

// A worker that blocks past its deadline must not hold the only dispatch
// slot: the retry runs while the first call is still stuck.
TEST(OrchestratorTest, HungWorkerDoesNotBlockRetryOnSingleSlot) {
  std::atomic<bool> release{false};
  std::atomic<int> n{0};
  auto worker = std::make_shared<ScriptedWorker>([&](const WorkerRequest&) {
    if (n.fetch_add(1) == 0) {
      for (int i = 0; i < 5000 && !release.load(); ++i) {
        test::sleep_ms(1ms);
      }
      return WorkerResult{.success = true, .payload = "too late"};
    }
    return WorkerResult{.success = true, .payload = "in time"};
  });
  auto config = test_config();
  config.max_parallelism = 1;
  config.subtask_timeout = 50ms;
  TaskOrchestrator orchestrator(make_context(worker, config));

  auto id = orchestrator.submit("fix typo in README line 10");
  ASSERT_TRUE(id);
  auto started = std::chrono::steady_clock::now();
  auto verdict = orchestrator.execute(*id);
  auto elapsed = std::chrono::steady_clock::now() - started;
  release.store(true);

  ASSERT_TRUE(verdict);
  EXPECT_EQ(verdict->stage, TaskStage::Complete);
  EXPECT_LT(elapsed, 2s);
  const auto& attempts = orchestrator.tracker(*id)->state().attempts;
  ASSERT_EQ(attempts.size(), 2U);
  EXPECT_EQ(attempts[0].signature, FailureSignature::Timeout);
  EXPECT_EQ(attempts[1].payload, "in time");
}

TEST(OrchestratorTest, WorkerThatNeverAnswersEscalates) {
  std::atomic<bool> release{false};
  auto worker = std::make_shared<ScriptedWorker>([&](const WorkerRequest&) {
    for (int i = 0; i < 5000 && !release.load(); ++i) {
      test::sleep_ms(1ms);
    }
    return WorkerResult{.success = true};
  });
  auto config = test_config();
  config.max_parallelism = 1;
  config.subtask_timeout = 30ms;
  TaskOrchestrator orchestrator(make_context(worker, config));

  auto id = orchestrator.submit("fix typo in README line 10");
  ASSERT_TRUE(id);
  auto started = std::chrono::steady_clock::now();
  auto verdict = orchestrator.execute(*id);
  auto elapsed = std::chrono::steady_clock::now() - started;
  release.store(true);

  ASSERT_TRUE(verdict);
  EXPECT_EQ(verdict->stage, TaskStage::Escalated);
  EXPECT_LT(elapsed, 2s);
  ASSERT_TRUE(verdict->escalation.has_value());
  ASSERT_EQ(verdict->escalation->attempts.size(), 3U);
  for (const auto& a : verdict->escalation->attempts) {
    EXPECT_EQ(a.signature, FailureSignature::Timeout);
  }
  EXPECT_EQ(worker->calls(), 3);
}

TEST(OrchestratorTest, ThrowingWorkerIsAFailedAttempt) {
  auto worker = std::make_shared<ScriptedWorker>(
      [](const WorkerRequest&) -> WorkerResult {
        throw std::runtime_error("backend unavailable");
      });
  TaskOrchestrator orchestrator(make_context(worker));

  auto id = orchestrator.submit("fix typo in README line 10");
  ASSERT_TRUE(id);
  auto verdict = orchestrator.execute(*id);
  ASSERT_TRUE(verdict);
  EXPECT_EQ(verdict->stage, TaskStage::Escalated);

  const auto& attempts = orchestrator.tracker(*id)->state().attempts;
  ASSERT_FALSE(attempts.empty());
  EXPECT_EQ(attempts[0].error, "worker raised: backend unavailable");
}

TEST(OrchestratorTest, MissingCapabilityFailsTask) {
  auto worker = std::make_shared<ScriptedWorker>(succeed());
  TaskOrchestrator orchestrator(make_context(worker));

  auto id = orchestrator.submit(task_id("task_1_ab"), "ship it");
  ASSERT_TRUE(id);
  ASSERT_TRUE(orchestrator.set_plan(
      *id, {make_subtask("task_1_ab.a"),
            make_subtask("task_1_ab.b", {"task_1_ab.a"}, "deploy")}));
  auto verdict = orchestrator.execute(*id);
  ASSERT_TRUE(verdict);

  EXPECT_EQ(verdict->stage, TaskStage::Failed);
  EXPECT_EQ(verdict->reason, "no worker for capability 'deploy'");
  EXPECT_EQ(worker->calls(), 0);
}

TEST(OrchestratorTest, RejectsInvalidSubmissions) {
  auto worker = std::make_shared<ScriptedWorker>(succeed());
  auto config = test_config();
  config.max_description_bytes = 16;
  TaskOrchestrator orchestrator(make_context(worker, config));

  EXPECT_EQ(orchestrator.submit("").error(), make_error_code(Error::InvalidTask));
  EXPECT_EQ(orchestrator.submit(" \n\t ").error(),
            make_error_code(Error::InvalidTask));
  EXPECT_EQ(orchestrator.submit(std::string(17, 'x')).error(),
            make_error_code(Error::InvalidTask));
  EXPECT_EQ(orchestrator.submit(TaskId{}, "valid").error(),
            make_error_code(Error::InvalidTask));

  ASSERT_TRUE(orchestrator.submit(task_id("task_1_ab"), "valid"));
  EXPECT_EQ(orchestrator.submit(task_id("task_1_ab"), "again").error(),
            make_error_code(Error::AlreadyExists));

  EXPECT_EQ(orchestrator.execute(task_id("task_9_zz")).error(),
            make_error_code(Error::NotFound));
  EXPECT_EQ(orchestrator.cancel(task_id("task_9_zz")).error(),
            make_error_code(Error::NotFound));
  EXPECT_EQ(orchestrator.tracker(task_id("task_9_zz")), nullptr);
}

TEST(OrchestratorTest, PlanIsInstalledOnce) {
  auto worker = std::make_shared<ScriptedWorker>(succeed());
  TaskOrchestrator orchestrator(make_context(worker));
  auto id = orchestrator.submit(task_id("task_1_ab"), "edit");
  ASSERT_TRUE(id);

  EXPECT_EQ(orchestrator.set_plan(*id, {}).error(),
            make_error_code(Error::InvalidArgument));
  EXPECT_EQ(orchestrator
                .set_plan(*id, {make_subtask("task_1_ab.a", {"task_1_ab.b"}),
                                make_subtask("task_1_ab.b", {"task_1_ab.a"})})
                .error(),
            make_error_code(Error::CycleDetected));

  ASSERT_TRUE(orchestrator.decompose(*id));
  EXPECT_EQ(orchestrator.tracker(*id)->stage(), TaskStage::Routing);
  EXPECT_EQ(orchestrator.decompose(*id).error(),
            make_error_code(Error::IllegalTransition));
  EXPECT_EQ(orchestrator.set_plan(*id, independent_pair()).error(),
            make_error_code(Error::IllegalTransition));

  auto subtasks = orchestrator.subtasks(*id);
  ASSERT_TRUE(subtasks);
  EXPECT_EQ(subtasks->size(), 1U);
}

TEST(OrchestratorTest, ExecuteTwiceReturnsSameVerdict) {
  auto worker = std::make_shared<ScriptedWorker>(succeed());
  TaskOrchestrator orchestrator(make_context(worker));
  auto id = orchestrator.submit("fix typo in README line 10");
  ASSERT_TRUE(id);

  auto first = orchestrator.execute(*id);
  auto second = orchestrator.execute(*id);
  ASSERT_TRUE(first && second);
  EXPECT_EQ(first->stage, second->stage);
  EXPECT_EQ(first->succeeded, second->succeeded);
  EXPECT_EQ(worker->calls(), 1);
}

TEST(OrchestratorTest, IndependentOrchestratorsShareNothing) {
  auto failing = std::make_shared<ScriptedWorker>(always_fail("timeout"));
  auto healthy = std::make_shared<ScriptedWorker>(succeed());
  TaskOrchestrator a(make_context(failing));
  TaskOrchestrator b(make_context(healthy));

  auto id_a = a.submit(task_id("task_1_ab"), "fix typo in README line 10");
  auto id_b = b.submit(task_id("task_1_ab"), "fix typo in README line 10");
  ASSERT_TRUE(id_a && id_b);

  EXPECT_EQ(a.execute(*id_a)->stage, TaskStage::Escalated);
  EXPECT_EQ(b.execute(*id_b)->stage, TaskStage::Complete);
  EXPECT_EQ(healthy->calls(), 1);
}

class OrchestratorPersistenceTest : public ::testing::Test {
protected:
  void SetUp() override {
    db_ = std::make_unique<Persistence>(path_.str());
    ASSERT_TRUE(db_->open());
  }

  auto make_context(const std::shared_ptr<IWorker>& worker)
      -> OrchestratorContext {
    auto ctx = ::make_context(worker);
    ctx.persistence = db_.get();
    return ctx;
  }

  // Leaves behind what a crash mid-implementation would: one failed
  // attempt and the implement subtask still marked running.
  auto seed_interrupted_task() -> TaskId {
    Task task;
    task.id = task_id("task_7_re");
    task.description = "Update parser.cpp and lexer.cpp";
    task.complexity = Complexity::Moderate;

    PipelineStateTracker tracker(task);
    EXPECT_TRUE(tracker.transition(TaskStage::Routing));
    EXPECT_TRUE(tracker.transition(TaskStage::Implementing));
    EXPECT_TRUE(tracker.record_attempt(test::failed_attempt(
        "task_7_re.implement", Strategy::Direct, "syntax error")));

    auto impl = make_subtask("task_7_re.implement");
    impl.status = SubtaskStatus::Running;
    auto review =
        make_subtask("task_7_re.review", {"task_7_re.implement"}, "review");
    EXPECT_TRUE(db_->save_snapshot(task, tracker.state(), {impl, review}));
    return task.id;
  }

  test::TempDbPath path_;
  std::unique_ptr<Persistence> db_;
};

TEST_F(OrchestratorPersistenceTest, ExecutionIsSnapshotted) {
  auto worker = std::make_shared<ScriptedWorker>(succeed({"README.md"}));
  TaskOrchestrator orchestrator(make_context(worker));

  auto id = orchestrator.submit("fix typo in README line 10");
  ASSERT_TRUE(id);
  ASSERT_TRUE(orchestrator.execute(*id));

  auto pipeline = db_->get_pipeline(id->str());
  ASSERT_TRUE(pipeline);
  EXPECT_EQ(pipeline->stage, "complete");

  auto attempts = db_->get_attempts(id->str());
  ASSERT_TRUE(attempts);
  ASSERT_EQ(attempts->size(), 1U);
  EXPECT_EQ((*attempts)[0].touched_files, R"(["README.md"])");

  auto subtasks = db_->get_subtasks(id->str());
  ASSERT_TRUE(subtasks);
  ASSERT_EQ(subtasks->size(), 1U);
  EXPECT_EQ((*subtasks)[0].status, "succeeded");
}

TEST_F(OrchestratorPersistenceTest, ResumeContinuesFromRecordedHistory) {
  auto id = seed_interrupted_task();
  auto worker = std::make_shared<ScriptedWorker>(succeed());
  TaskOrchestrator orchestrator(make_context(worker));

  ASSERT_TRUE(orchestrator.resume(id));
  EXPECT_EQ(orchestrator.tracker(id)->stage(), TaskStage::Implementing);

  auto verdict = orchestrator.execute(id);
  ASSERT_TRUE(verdict);
  EXPECT_EQ(verdict->stage, TaskStage::Complete);

  auto requests = worker->requests();
  ASSERT_EQ(requests.size(), 2U);
  EXPECT_EQ(requests[0].subtask_id, subtask_id("task_7_re.implement"));
  EXPECT_EQ(requests[0].strategy, Strategy::MechanicalFix);
  EXPECT_EQ(requests[0].attempt, 2);
  EXPECT_EQ(requests[0].prior_attempts.size(), 1U);
  EXPECT_EQ(requests[1].subtask_id, subtask_id("task_7_re.review"));

  EXPECT_EQ(db_->get_pipeline("task_7_re")->stage, "complete");
  EXPECT_TRUE(db_->get_incomplete_tasks()->empty());
}

TEST_F(OrchestratorPersistenceTest, ResumedFinishedTaskKeepsItsVerdict) {
  auto id = seed_interrupted_task();
  {
    auto worker = std::make_shared<ScriptedWorker>(succeed());
    TaskOrchestrator first(make_context(worker));
    ASSERT_TRUE(first.resume(id));
    ASSERT_TRUE(first.execute(id));
  }

  auto worker = std::make_shared<ScriptedWorker>(succeed());
  TaskOrchestrator second(make_context(worker));
  ASSERT_TRUE(second.resume(id));
  auto verdict = second.execute(id);
  ASSERT_TRUE(verdict);
  EXPECT_EQ(verdict->stage, TaskStage::Complete);
  EXPECT_EQ(verdict->succeeded.size(), 2U);
  EXPECT_EQ(worker->calls(), 0);
}

TEST_F(OrchestratorPersistenceTest, CorruptHistoryRefusesResume) {
  auto id = seed_interrupted_task();
  ASSERT_TRUE(db_->execute("UPDATE attempts SET strategy = 'guess';"));

  auto worker = std::make_shared<ScriptedWorker>(succeed());
  TaskOrchestrator orchestrator(make_context(worker));
  auto r = orchestrator.resume(id);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), make_error_code(Error::CorruptState));
  EXPECT_EQ(orchestrator.tracker(id), nullptr);
}

TEST_F(OrchestratorPersistenceTest, ResumeNeedsStoreAndFreshId) {
  auto worker = std::make_shared<ScriptedWorker>(succeed());
  TaskOrchestrator detached(::make_context(worker));
  EXPECT_EQ(detached.resume(task_id("task_7_re")).error(),
            make_error_code(Error::InvalidArgument));

  auto id = seed_interrupted_task();
  TaskOrchestrator orchestrator(make_context(worker));
  ASSERT_TRUE(orchestrator.submit(id, "already here"));
  EXPECT_EQ(orchestrator.resume(id).error(),
            make_error_code(Error::AlreadyExists));
}
