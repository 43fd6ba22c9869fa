#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace conductor {

// Pool of threads draining a FIFO job queue. Jobs submitted after
// shutdown() are rejected; jobs already queued at shutdown still run.
class WorkerPool {
public:
  using Job = std::move_only_function<void()>;

  // Per-job bookkeeping, guarded by the pool's mutex.
  struct JobState {
    bool started{false};
    bool finished{false};
    bool abandoned{false};
  };
  using JobHandle = std::shared_ptr<JobState>;

  explicit WorkerPool(std::size_t num_threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  auto operator=(const WorkerPool&) -> WorkerPool& = delete;

  // Null after shutdown.
  [[nodiscard]] auto submit(Job job) -> JobHandle;

  // Gives up waiting for a job. A queued job is dropped. A running job keeps
  // its thread until it returns, then that thread exits; a replacement
  // thread starts now so the pool keeps its size.
  auto abandon(const JobHandle& handle) -> void;

  auto shutdown() -> void;

  // Threads serving the queue; threads stuck in abandoned jobs not counted.
  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto busy() const noexcept -> std::size_t {
    return busy_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto pending() const -> std::size_t;

private:
  struct Queued {
    Job job;
    JobHandle state;
  };

  auto worker_loop() -> void;

  std::vector<std::thread> threads_;
  std::deque<Queued> jobs_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool stopping_{false};
  std::size_t live_{0};
  std::atomic<std::size_t> busy_{0};
};

}  // namespace conductor
