#include "conductor/orchestrator/orchestrator.hpp"

#include "conductor/model/state_strings.hpp"
#include "conductor/storage/recovery.hpp"
#include "conductor/util/log.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <map>

namespace conductor {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(20);

auto stage_for(std::string_view cap) -> TaskStage {
  if (cap == capability::kReview) {
    return TaskStage::Reviewing;
  }
  if (cap == capability::kValidate || cap == "test") {
    return TaskStage::Testing;
  }
  return TaskStage::Implementing;
}

auto is_blank(std::string_view text) -> bool {
  return std::ranges::all_of(
      text, [](unsigned char c) { return std::isspace(c) != 0; });
}

// min(base * 2^(deferrals - 1), cap)
auto backoff_delay(const OrchestratorConfig& config, int deferrals)
    -> std::chrono::milliseconds {
  auto delay = config.backoff_base;
  for (int i = 1; i < deferrals && delay < config.backoff_cap; ++i) {
    delay *= 2;
  }
  return std::min(delay, config.backoff_cap);
}

struct Completion {
  std::uint64_t ticket{0};
  WorkerResult result;
  TimePoint finished_at{};
};

struct Mailbox {
  std::mutex mu;
  std::condition_variable cv;
  std::deque<Completion> done;
};

}  // namespace

// One execute() call: the dispatch loop for a single task. Lives on the
// caller's thread; pool jobs only touch the mailbox.
class TaskOrchestrator::Execution {
public:
  Execution(TaskOrchestrator& owner, TaskEntry& entry)
      : owner_(owner),
        config_(owner.ctx_.config),
        entry_(entry),
        run_(*entry.run),
        tracker_(entry.tracker),
        mailbox_(std::make_shared<Mailbox>()),
        capacity_(owner.ctx_.config.effective_parallelism()) {
  }

  auto run() -> void {
    while (true) {
      auto now = owner_.ctx_.clock();
      observe_cancellation();
      drain_completions();
      expire_deadlines(now);

      if (halted_ || cancelled_) {
        skip_unstarted();
      } else {
        dispatch_ready(now);
      }

      if (in_flight_.empty()) {
        if (run_.is_complete() || halted_ || cancelled_) {
          break;
        }
        if (run_.ready().empty()) {
          log::error("Task[{}]: no runnable subtask left but graph is not "
                     "complete",
                     tracker_.task().id);
          stalled_ = true;
          skip_unstarted();
          break;
        }
      }
      wait(now);
    }
  }

  [[nodiscard]] auto halted() const noexcept -> bool {
    return halted_;
  }
  [[nodiscard]] auto halt_reason() const -> const std::string& {
    return halt_reason_;
  }
  [[nodiscard]] auto cancelled() const noexcept -> bool {
    return cancelled_;
  }
  [[nodiscard]] auto stalled() const noexcept -> bool {
    return stalled_;
  }

private:
  struct InFlight {
    NodeIndex node{kInvalidNode};
    Strategy strategy{Strategy::Direct};
    SteadyTime deadline{};
    TimePoint started_at{};
    ServiceKey service_key;
    Admission admission{Admission::Allowed};
    WorkerPool::JobHandle job;
  };

  struct Parked {
    SteadyTime until{};
    int deferrals{0};
  };

  auto observe_cancellation() -> void {
    if (!cancelled_ && entry_.cancellation.is_cancelled()) {
      cancelled_ = true;
      log::info("Task[{}]: cancelled, {} subtask(s) still in flight",
                tracker_.task().id, in_flight_.size());
    }
  }

  auto skip_unstarted() -> void {
    parked_.clear();
    auto skipped = run_.cancel();
    if (!skipped.empty()) {
      log::info("Task[{}]: skipped {} subtask(s) that had not started",
                tracker_.task().id, skipped.size());
      owner_.persist(entry_);
    }
  }

  auto dispatch_ready(SteadyTime now) -> void {
    for (auto idx : run_.ready()) {
      if (halted_) {
        return;
      }
      if (owner_.running_jobs_.load(std::memory_order_acquire) >= capacity_) {
        return;
      }
      if (auto it = parked_.find(idx); it != parked_.end() && it->second.until > now) {
        continue;
      }

      const auto& subtask = run_.graph().subtask(idx);
      const auto* binding = owner_.ctx_.registry.find(subtask.capability);
      if (binding == nullptr) {
        log::error("Task[{}]: no worker for capability '{}'",
                   tracker_.task().id, subtask.capability);
        fail_subtask(idx, true);
        continue;
      }

      auto strategy = tracker_.next_strategy(subtask.id);
      if (!strategy) {
        fail_subtask(idx, true);
        continue;
      }

      auto permit = owner_.ctx_.governor->admit(binding->service_key);
      if (!permit) {
        park(idx, now);
        continue;
      }
      launch(idx, *binding, *strategy, permit.admission, now);
    }
  }

  auto park(NodeIndex idx, SteadyTime now) -> void {
    auto& parked = parked_[idx];
    ++parked.deferrals;
    auto delay = backoff_delay(config_, parked.deferrals);
    parked.until = now + delay;
    log::info("Task[{}]: {} deferred by admission control, retry in {}ms",
              tracker_.task().id, run_.graph().get_key(idx), delay.count());
  }

  auto launch(NodeIndex idx, const WorkerBinding& binding, Strategy strategy,
              Admission admission, SteadyTime now) -> void {
    const auto& subtask = run_.graph().subtask(idx);
    if (auto r = run_.mark_started(idx); !r) {
      log::error("Task[{}]: cannot start {}: {}", tracker_.task().id,
                 subtask.id, r.error().message());
      if (admission == Admission::Probe) {
        // An unused probe would leave the circuit half-open forever.
        owner_.ctx_.governor->record(binding.service_key, Outcome::Failure,
                                     admission);
      }
      return;
    }
    parked_.erase(idx);
    advance(stage_for(subtask.capability));

    auto prior = tracker_.attempts_for(subtask.id);
    InFlight flight{
        .node = idx,
        .strategy = strategy,
        .deadline = now + config_.subtask_timeout,
        .started_at = std::chrono::system_clock::now(),
        .service_key = binding.service_key,
        .admission = admission,
    };

    WorkerRequest request{
        .subtask_id = subtask.id,
        .description = subtask.description,
        .capability = subtask.capability,
        .strategy = strategy,
        .attempt = static_cast<int>(prior.size()) + 1,
        .prior_attempts = std::move(prior),
        .token = entry_.cancellation.token(flight.deadline),
    };

    log::info("Task[{}]: dispatch {} attempt #{} ({}) to {}",
              tracker_.task().id, subtask.id, request.attempt,
              to_string_view(strategy), binding.service_key);

    std::uint64_t ticket = next_ticket_++;
    flight.job = owner_.pool_->submit(
        [mailbox = mailbox_, worker = binding.worker,
         request = std::move(request), ticket] {
          Completion done{.ticket = ticket};
          try {
            done.result = worker->execute(request);
          } catch (const std::exception& e) {
            done.result = WorkerResult{
                .success = false,
                .error = fmt::format("worker raised: {}", e.what())};
          } catch (...) {
            done.result = WorkerResult{
                .success = false, .error = "worker raised a non-standard exception"};
          }
          done.finished_at = std::chrono::system_clock::now();
          {
            std::lock_guard lock(mailbox->mu);
            mailbox->done.push_back(std::move(done));
          }
          mailbox->cv.notify_all();
        });

    if (!flight.job) {
      complete(flight,
               WorkerResult{.success = false,
                            .error = "worker pool is shut down"},
               std::chrono::system_clock::now());
      return;
    }
    owner_.running_jobs_.fetch_add(1, std::memory_order_acq_rel);
    in_flight_.emplace(ticket, std::move(flight));
  }

  auto drain_completions() -> void {
    std::deque<Completion> done;
    {
      std::lock_guard lock(mailbox_->mu);
      done.swap(mailbox_->done);
    }
    for (auto& c : done) {
      auto it = in_flight_.find(c.ticket);
      if (it == in_flight_.end()) {
        // Arrived after its deadline had already been recorded as a failure.
        log::debug("Task[{}]: ignoring late result for dispatch {}",
                   tracker_.task().id, c.ticket);
        continue;
      }
      auto flight = std::move(it->second);
      in_flight_.erase(it);
      owner_.running_jobs_.fetch_sub(1, std::memory_order_acq_rel);
      complete(flight, std::move(c.result), c.finished_at);
    }
  }

  auto expire_deadlines(SteadyTime now) -> void {
    for (auto it = in_flight_.begin(); it != in_flight_.end();) {
      if (it->second.deadline > now) {
        ++it;
        continue;
      }
      auto flight = std::move(it->second);
      it = in_flight_.erase(it);
      // The worker may never return; its slot goes to the retry.
      owner_.pool_->abandon(flight.job);
      owner_.running_jobs_.fetch_sub(1, std::memory_order_acq_rel);
      log::warn("Task[{}]: {} timed out after {}ms", tracker_.task().id,
                run_.graph().get_key(flight.node),
                config_.subtask_timeout.count());
      complete(flight,
               WorkerResult{.success = false,
                            .error = fmt::format("timed out after {}ms",
                                                 config_.subtask_timeout.count())},
               std::chrono::system_clock::now());
    }
  }

  auto complete(const InFlight& flight, WorkerResult result,
                TimePoint finished_at) -> void {
    const auto& subtask = run_.graph().subtask(flight.node);

    AgentAttempt attempt{
        .subtask_id = subtask.id,
        .attempt = 0,
        .strategy = flight.strategy,
        .started_at = flight.started_at,
        .finished_at = finished_at,
        .outcome = result.success ? Outcome::Success : Outcome::Failure,
        .signature = std::nullopt,
        .error = std::move(result.error),
        .payload = std::move(result.payload),
        .touched_files = std::move(result.touched_files),
    };
    if (auto r = tracker_.record_attempt(std::move(attempt)); !r) {
      log::error("Task[{}]: cannot record attempt of {}: {}",
                 tracker_.task().id, subtask.id, r.error().message());
    }
    owner_.ctx_.governor->record(flight.service_key, result.success,
                                 flight.admission);

    if (result.success) {
      if (auto r = run_.mark_succeeded(flight.node); !r) {
        log::error("Task[{}]: cannot mark {} succeeded: {}",
                   tracker_.task().id, subtask.id, r.error().message());
      }
    } else if (halted_ || cancelled_) {
      fail_subtask(flight.node, false);
    } else if (auto next = tracker_.next_strategy(subtask.id)) {
      log::info("Task[{}]: retrying {} with {}", tracker_.task().id,
                subtask.id, to_string_view(*next));
      if (auto r = run_.requeue(flight.node); !r) {
        log::error("Task[{}]: cannot requeue {}: {}", tracker_.task().id,
                   subtask.id, r.error().message());
      }
    } else {
      fail_subtask(flight.node, true);
    }
    owner_.persist(entry_);
  }

  // `exhausted`: no strategy is left, as opposed to a failure recorded
  // while the task was already stopping.
  auto fail_subtask(NodeIndex idx, bool exhausted) -> void {
    const auto& subtask = run_.graph().subtask(idx);
    auto skipped = run_.mark_failed(idx);
    if (!skipped) {
      log::error("Task[{}]: cannot mark {} failed: {}", tracker_.task().id,
                 subtask.id, skipped.error().message());
      return;
    }
    bool critical = run_.is_critical(idx);
    log::warn("Task[{}]: {} failed terminally ({}), {} dependent(s) skipped",
              tracker_.task().id, subtask.id,
              critical ? "critical" : "non-critical", skipped->size());

    if (!exhausted || halted_) {
      return;
    }
    if (critical) {
      halted_ = true;
      halt_reason_ = fmt::format(
          "critical subtask {} exhausted its retry strategies", subtask.id);
    } else if (config_.failure_policy == FailurePolicy::AllOrNothing) {
      halted_ = true;
      halt_reason_ = fmt::format(
          "subtask {} exhausted its retry strategies (all-or-nothing)",
          subtask.id);
    }
  }

  auto advance(TaskStage stage) -> void {
    if (is_terminal(tracker_.stage()) || stage <= tracker_.stage()) {
      return;
    }
    if (auto r = tracker_.transition(stage); !r) {
      log::error("Task[{}]: stage transition failed: {}", tracker_.task().id,
                 r.error().message());
      return;
    }
    owner_.persist(entry_);
  }

  auto wait(SteadyTime now) -> void {
    auto until = now + kPollInterval;
    for (const auto& [ticket, flight] : in_flight_) {
      until = std::min(until, flight.deadline);
    }
    for (const auto& [idx, parked] : parked_) {
      until = std::min(until, parked.until);
    }
    if (until <= now) {
      return;
    }
    std::unique_lock lock(mailbox_->mu);
    mailbox_->cv.wait_for(lock, until - now,
                          [this] { return !mailbox_->done.empty(); });
  }

  TaskOrchestrator& owner_;
  const OrchestratorConfig& config_;
  TaskEntry& entry_;
  GraphRun& run_;
  PipelineStateTracker& tracker_;
  std::shared_ptr<Mailbox> mailbox_;
  std::size_t capacity_;

  std::map<std::uint64_t, InFlight> in_flight_;
  std::map<NodeIndex, Parked> parked_;
  std::uint64_t next_ticket_{1};

  bool halted_{false};
  bool cancelled_{false};
  bool stalled_{false};
  std::string halt_reason_;
};

TaskOrchestrator::TaskOrchestrator(OrchestratorContext context)
    : ctx_(std::move(context)),
      decomposer_(DecomposerOptions{.max_fan_out = ctx_.config.max_fan_out}) {
  if (!ctx_.governor) {
    ctx_.governor =
        std::make_shared<ResilienceGovernor>(ResilienceConfig{}, ctx_.clock);
  }
  if (!ctx_.learner) {
    ctx_.learner = std::make_shared<FailurePatternLearner>();
  }
  pool_ = std::make_unique<WorkerPool>(ctx_.config.effective_parallelism());
  log::info("Orchestrator started: parallelism {}, {} capabilities",
            pool_->size(), ctx_.registry.size());
}

TaskOrchestrator::~TaskOrchestrator() {
  pool_->shutdown();
}

auto TaskOrchestrator::submit(std::string description,
                              std::optional<Complexity> complexity)
    -> Result<TaskId> {
  return submit(generate_task_id(), std::move(description), complexity);
}

auto TaskOrchestrator::submit(TaskId task_id, std::string description,
                              std::optional<Complexity> complexity)
    -> Result<TaskId> {
  if (task_id.empty() || is_blank(description)) {
    log::warn("Rejected task: empty description");
    return fail(Error::InvalidTask);
  }
  if (description.size() > ctx_.config.max_description_bytes) {
    log::warn("Rejected task: description of {} bytes exceeds {}",
              description.size(), ctx_.config.max_description_bytes);
    return fail(Error::InvalidTask);
  }

  auto tier = complexity.value_or(
      Decomposer::classify(Decomposer::analyze(description)));
  Task task{
      .id = task_id,
      .description = std::move(description),
      .complexity = tier,
      .created_at = std::chrono::system_clock::now(),
  };
  auto entry = std::make_shared<TaskEntry>(PipelineStateTracker(
      std::move(task), ctx_.config.max_retries, ctx_.config.strategy_order));

  {
    std::lock_guard lock(tasks_mu_);
    if (tasks_.contains(task_id)) {
      return fail(Error::AlreadyExists);
    }
    tasks_.emplace(task_id, entry);
  }
  persist(*entry);

  log::info("Submitted task {} ({}, {} bytes)", task_id, to_string_view(tier),
            entry->tracker.task().description.size());
  return task_id;
}

auto TaskOrchestrator::decompose(const TaskId& task_id)
    -> Result<DecompositionPlan> {
  auto entry = find(task_id);
  if (!entry) {
    return fail(Error::NotFound);
  }
  std::lock_guard lock(entry->mu);
  if (entry->executing) {
    return fail(Error::IllegalTransition);
  }
  return plan_task(*entry);
}

auto TaskOrchestrator::set_plan(const TaskId& task_id,
                                std::vector<Subtask> subtasks)
    -> Result<void> {
  auto entry = find(task_id);
  if (!entry) {
    return fail(Error::NotFound);
  }
  if (subtasks.empty()) {
    return fail(Error::InvalidArgument);
  }
  for (auto& s : subtasks) {
    s.task_id = task_id;
    s.status = SubtaskStatus::Pending;
  }
  auto graph = SubtaskGraph::from_subtasks(std::move(subtasks));
  if (!graph) {
    return fail(graph.error());
  }

  std::lock_guard lock(entry->mu);
  if (entry->executing) {
    return fail(Error::IllegalTransition);
  }
  return install_graph(*entry, std::move(*graph));
}

auto TaskOrchestrator::execute(const TaskId& task_id) -> Result<Verdict> {
  auto entry = find(task_id);
  if (!entry) {
    return fail(Error::NotFound);
  }
  {
    std::lock_guard lock(entry->mu);
    if (entry->verdict) {
      return *entry->verdict;
    }
    if (entry->executing) {
      return fail(Error::IllegalTransition);
    }
    entry->executing = true;
  }

  // The entry belongs to this thread until `executing` is cleared.
  auto verdict = [&]() -> Verdict {
    if (!entry->run) {
      auto plan = plan_task(*entry);
      if (!plan) {
        return finish(*entry, TaskStage::Failed,
                      fmt::format("decomposition failed: {}",
                                  plan.error().message()),
                      false);
      }
    }
    if (auto missing = missing_capability(*entry->run)) {
      entry->run->cancel();
      return finish(*entry, TaskStage::Failed,
                    fmt::format("no worker for capability '{}'", *missing),
                    false);
    }

    Execution execution(*this, *entry);
    execution.run();

    if (execution.halted()) {
      return finish(*entry, TaskStage::Escalated, execution.halt_reason(),
                    false);
    }
    if (execution.cancelled()) {
      return finish(*entry, TaskStage::Failed, "cancelled", true);
    }
    if (execution.stalled()) {
      return finish(*entry, TaskStage::Failed, "execution stalled", false);
    }

    const auto& run = *entry->run;
    auto sinks = run.graph().sinks();
    bool salvaged = std::ranges::any_of(sinks, [&](NodeIndex idx) {
      return run.status(idx) == SubtaskStatus::Succeeded;
    });
    if (!salvaged) {
      return finish(*entry, TaskStage::Failed, "no salvageable work", false);
    }
    auto failed = run.count(SubtaskStatus::Failed);
    auto skipped = run.count(SubtaskStatus::Skipped);
    return finish(*entry, TaskStage::Complete,
                  failed + skipped == 0
                      ? std::string{}
                      : fmt::format("completed with {} failed and {} skipped "
                                    "subtask(s)",
                                    failed, skipped),
                  false);
  }();

  std::lock_guard lock(entry->mu);
  entry->executing = false;
  entry->verdict = verdict;
  return verdict;
}

auto TaskOrchestrator::cancel(const TaskId& task_id) -> Result<void> {
  auto entry = find(task_id);
  if (!entry) {
    return fail(Error::NotFound);
  }
  std::lock_guard lock(entry->mu);
  entry->cancellation.cancel();
  if (entry->executing || entry->verdict) {
    return ok();
  }

  // Not running: nothing is in flight, so the task can be closed right away.
  if (entry->run) {
    entry->run->cancel();
  }
  entry->verdict = finish(*entry, TaskStage::Failed, "cancelled", true);
  return ok();
}

auto TaskOrchestrator::resume(const TaskId& task_id) -> Result<void> {
  if (ctx_.persistence == nullptr || !ctx_.persistence->is_open()) {
    log::error("Cannot resume {}: no database configured", task_id);
    return fail(Error::InvalidArgument);
  }
  if (find(task_id)) {
    return fail(Error::AlreadyExists);
  }

  Recovery recovery(*ctx_.persistence, ctx_.config.strategy_order);
  auto loaded = [&] {
    std::lock_guard lock(persist_mu_);
    return recovery.load(task_id);
  }();
  if (!loaded) {
    log::error("Cannot resume {}: {}", task_id, loaded.error().message());
    return fail(loaded.error());
  }

  auto entry = std::make_shared<TaskEntry>(std::move(loaded->tracker));
  if (!loaded->graph.empty()) {
    entry->run.emplace(std::move(loaded->graph));
  }
  if (is_terminal(entry->tracker.stage())) {
    entry->verdict = build_verdict(*entry, false);
  }

  {
    std::lock_guard lock(tasks_mu_);
    if (tasks_.contains(task_id)) {
      return fail(Error::AlreadyExists);
    }
    tasks_.emplace(task_id, entry);
  }
  log::info("Resumed {} at stage {}: {} attempt(s), {} subtask(s) requeued",
            task_id, to_string_view(entry->tracker.stage()),
            entry->tracker.state().attempts.size(), loaded->requeued);
  return ok();
}

auto TaskOrchestrator::tracker(const TaskId& task_id) const
    -> const PipelineStateTracker* {
  auto entry = find(task_id);
  return entry ? &entry->tracker : nullptr;
}

auto TaskOrchestrator::subtasks(const TaskId& task_id) const
    -> Result<std::vector<Subtask>> {
  auto entry = find(task_id);
  if (!entry) {
    return fail(Error::NotFound);
  }
  if (!entry->run) {
    return std::vector<Subtask>{};
  }
  return entry->run->snapshot();
}

auto TaskOrchestrator::find(const TaskId& task_id) const
    -> std::shared_ptr<TaskEntry> {
  std::lock_guard lock(tasks_mu_);
  auto it = tasks_.find(task_id);
  return it != tasks_.end() ? it->second : nullptr;
}

auto TaskOrchestrator::plan_task(TaskEntry& entry)
    -> Result<DecompositionPlan> {
  if (entry.run || is_terminal(entry.tracker.stage())) {
    return fail(Error::IllegalTransition);
  }
  auto plan = decomposer_.decompose(entry.tracker.task());
  if (!plan) {
    log::error("Task[{}]: decomposition failed: {}", entry.tracker.task().id,
               plan.error().message());
    return fail(plan.error());
  }
  if (auto r = install_graph(entry, plan->graph); !r) {
    return fail(r.error());
  }
  log::info("Task[{}]: {}", entry.tracker.task().id, plan->reasoning);
  return plan;
}

auto TaskOrchestrator::install_graph(TaskEntry& entry, SubtaskGraph graph)
    -> Result<void> {
  if (entry.run || is_terminal(entry.tracker.stage())) {
    return fail(Error::IllegalTransition);
  }
  if (auto r = entry.tracker.transition(TaskStage::Routing); !r) {
    return r;
  }
  entry.run.emplace(std::move(graph));
  persist(entry);
  return ok();
}

auto TaskOrchestrator::missing_capability(const GraphRun& run) const
    -> std::optional<std::string> {
  for (NodeIndex idx = 0; idx < run.graph().size(); ++idx) {
    const auto& subtask = run.graph().subtask(idx);
    if (!is_terminal(run.status(idx)) &&
        ctx_.registry.find(subtask.capability) == nullptr) {
      return subtask.capability;
    }
  }
  return std::nullopt;
}

auto TaskOrchestrator::finish(TaskEntry& entry, TaskStage stage,
                              std::string reason, bool cancelled) -> Verdict {
  auto& tracker = entry.tracker;
  if (auto r = tracker.transition(stage, std::move(reason)); !r) {
    log::error("Task[{}]: cannot move to {}: {}", tracker.task().id,
               to_string_view(stage), r.error().message());
  }

  ctx_.learner->observe(tracker.state().attempts);
  auto verdict = build_verdict(entry, cancelled);
  persist(entry);

  log::info("Task[{}]: {}{}", tracker.task().id,
            to_string_view(verdict.stage),
            verdict.reason.empty() ? "" : fmt::format(" ({})", verdict.reason));

  if (verdict.stage == TaskStage::Escalated) {
    auto record = with_learned_hint(tracker, tracker.escalate());
    if (ctx_.on_escalation) {
      ctx_.on_escalation(record);
    }
  } else if (verdict.stage == TaskStage::Complete &&
             ctx_.on_ready_for_integration) {
    ctx_.on_ready_for_integration(tracker.task().id, verdict.touched_files);
  }
  return verdict;
}

auto TaskOrchestrator::build_verdict(const TaskEntry& entry,
                                     bool cancelled) const -> Verdict {
  const auto& tracker = entry.tracker;
  Verdict verdict;
  verdict.task_id = tracker.task().id;
  verdict.stage = tracker.stage();
  verdict.reason = tracker.state().reason;
  verdict.cancelled = cancelled;

  if (entry.run) {
    const auto& run = *entry.run;
    for (NodeIndex idx = 0; idx < run.graph().size(); ++idx) {
      const auto& id = run.graph().get_key(idx);
      switch (run.status(idx)) {
        case SubtaskStatus::Succeeded:
          verdict.succeeded.push_back(id);
          break;
        case SubtaskStatus::Failed:
          verdict.failed.push_back(id);
          break;
        case SubtaskStatus::Skipped:
          verdict.skipped.push_back(id);
          break;
        default:
          break;
      }
    }
  }

  verdict.touched_files = tracker.touched_files();
  if (verdict.stage == TaskStage::Escalated) {
    verdict.escalation =
        with_learned_hint(tracker, tracker.build_escalation_record());
  }
  return verdict;
}

auto TaskOrchestrator::with_learned_hint(const PipelineStateTracker& tracker,
                                         EscalationRecord record) const
    -> EscalationRecord {
  auto signature = tracker.dominant_signature();
  if (!signature) {
    return record;
  }
  if (auto strategy = ctx_.learner->recommend(*signature)) {
    record.next_step_hint +=
        fmt::format("; {} failures have recovered with {} before",
                    to_string_view(*signature), to_string_view(*strategy));
  }
  return record;
}

auto TaskOrchestrator::persist(const TaskEntry& entry) -> void {
  if (ctx_.persistence == nullptr || !ctx_.persistence->is_open()) {
    return;
  }
  auto subtasks = entry.run ? entry.run->snapshot() : std::vector<Subtask>{};
  std::lock_guard lock(persist_mu_);
  if (auto r = ctx_.persistence->save_snapshot(entry.tracker.task(),
                                               entry.tracker.state(), subtasks);
      !r) {
    log::error("Task[{}]: snapshot failed: {}", entry.tracker.task().id,
               r.error().message());
  }
}

}  // namespace conductor
