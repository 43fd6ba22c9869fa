#pragma once

#include "conductor/core/clock.hpp"

#include <atomic>
#include <memory>
#include <optional>

namespace conductor {

class CancellationToken;

// Shared cancellation flag for one task. Tokens handed to workers observe
// the flag and, optionally, a per-dispatch deadline.
class CancellationSource {
public:
  CancellationSource() : state_(std::make_shared<State>()) {
  }

  [[nodiscard]] auto token() const noexcept -> CancellationToken;
  [[nodiscard]] auto token(SteadyTime deadline) const noexcept
      -> CancellationToken;

  auto cancel() noexcept -> void {
    state_->cancelled.store(true, std::memory_order_release);
  }
  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_->cancelled.load(std::memory_order_acquire);
  }

private:
  struct State {
    std::atomic<bool> cancelled{false};
  };
  std::shared_ptr<State> state_;

  friend class CancellationToken;
};

class CancellationToken {
public:
  CancellationToken() = default;

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_ && state_->cancelled.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto deadline() const noexcept -> std::optional<SteadyTime> {
    return deadline_;
  }

  // Workers poll this between steps; the orchestrator enforces the
  // deadline on its side regardless.
  [[nodiscard]] auto should_stop(SteadyTime now) const noexcept -> bool {
    return is_cancelled() || (deadline_ && now >= *deadline_);
  }

  [[nodiscard]] static auto none() noexcept -> CancellationToken {
    return {};
  }

private:
  CancellationToken(std::shared_ptr<CancellationSource::State> state,
                    std::optional<SteadyTime> deadline)
      : state_(std::move(state)), deadline_(deadline) {
  }

  std::shared_ptr<CancellationSource::State> state_;
  std::optional<SteadyTime> deadline_;

  friend class CancellationSource;
};

inline auto CancellationSource::token() const noexcept -> CancellationToken {
  return CancellationToken{state_, std::nullopt};
}

inline auto CancellationSource::token(SteadyTime deadline) const noexcept
    -> CancellationToken {
  return CancellationToken{state_, deadline};
}

}  // namespace conductor
