#include "conductor/core/worker_pool.hpp"

#include "conductor/util/log.hpp"

#include <algorithm>
#include <exception>

namespace conductor {

WorkerPool::WorkerPool(std::size_t num_threads) {
  num_threads = std::max<std::size_t>(num_threads, 1);
  std::lock_guard lock(mu_);
  threads_.reserve(num_threads);
  for (std::size_t i = 0; i < num_threads; ++i) {
    threads_.emplace_back([this] { worker_loop(); });
  }
  live_ = num_threads;
}

WorkerPool::~WorkerPool() {
  shutdown();
}

auto WorkerPool::submit(Job job) -> JobHandle {
  auto state = std::make_shared<JobState>();
  {
    std::lock_guard lock(mu_);
    if (stopping_) {
      return nullptr;
    }
    jobs_.push_back(Queued{.job = std::move(job), .state = state});
  }
  cv_.notify_one();
  return state;
}

auto WorkerPool::abandon(const JobHandle& handle) -> void {
  if (!handle) {
    return;
  }
  std::lock_guard lock(mu_);
  if (handle->abandoned || handle->finished) {
    return;
  }
  handle->abandoned = true;
  if (!handle->started) {
    return;
  }
  if (stopping_) {
    --live_;
    return;
  }
  threads_.emplace_back([this] { worker_loop(); });
  log::warn("Worker pool: gave up on a running job, started a replacement "
            "thread ({} threads total)",
            threads_.size());
}

auto WorkerPool::shutdown() -> void {
  {
    std::lock_guard lock(mu_);
    if (stopping_) {
      return;
    }
    stopping_ = true;
  }
  cv_.notify_all();
  // threads_ no longer grows once stopping_ is set.
  for (auto& t : threads_) {
    if (t.joinable()) {
      t.join();
    }
  }
}

auto WorkerPool::size() const -> std::size_t {
  std::lock_guard lock(mu_);
  return live_;
}

auto WorkerPool::pending() const -> std::size_t {
  std::lock_guard lock(mu_);
  return static_cast<std::size_t>(std::ranges::count_if(
      jobs_, [](const Queued& q) { return !q.state->abandoned; }));
}

auto WorkerPool::worker_loop() -> void {
  while (true) {
    Queued queued;
    {
      std::unique_lock lock(mu_);
      cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
      if (jobs_.empty()) {
        --live_;
        return;
      }
      queued = std::move(jobs_.front());
      jobs_.pop_front();
      if (queued.state->abandoned) {
        continue;
      }
      queued.state->started = true;
    }

    busy_.fetch_add(1, std::memory_order_acq_rel);
    try {
      queued.job();
    } catch (const std::exception& e) {
      log::error("Worker pool job threw: {}", e.what());
    }
    busy_.fetch_sub(1, std::memory_order_acq_rel);

    std::lock_guard lock(mu_);
    queued.state->finished = true;
    if (queued.state->abandoned) {
      // The replacement started in abandon() has taken this slot.
      return;
    }
  }
}

}  // namespace conductor
