#pragma once

#include "conductor/core/error.hpp"
#include "conductor/executor/cancellation.hpp"
#include "conductor/model/types.hpp"
#include "conductor/util/id.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace conductor {

struct WorkerRequest {
  SubtaskId subtask_id;
  std::string description;
  std::string capability;
  Strategy strategy{Strategy::Direct};
  int attempt{1};
  // Earlier attempts of the same subtask, oldest first.
  std::vector<AgentAttempt> prior_attempts;
  CancellationToken token;
};

struct WorkerResult {
  bool success{false};
  std::string payload;
  std::string error;
  std::vector<std::string> touched_files;
};

// An external executor for subtasks. Implementations may block, may be slow
// and may throw; the orchestrator calls execute() from a pool thread and
// treats an exception as a failed attempt.
class IWorker {
public:
  virtual ~IWorker() = default;

  virtual auto execute(const WorkerRequest& request) -> WorkerResult = 0;
};

struct WorkerBinding {
  ServiceKey service_key;
  std::shared_ptr<IWorker> worker;
};

// Capability tag -> worker. Populated explicitly before tasks run; lookups
// are read-only afterwards.
class CapabilityRegistry {
public:
  [[nodiscard]] auto register_worker(std::string capability,
                                     ServiceKey service_key,
                                     std::shared_ptr<IWorker> worker)
      -> Result<void>;

  [[nodiscard]] auto find(std::string_view capability) const
      -> const WorkerBinding*;

  [[nodiscard]] auto capabilities() const -> std::vector<std::string>;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return workers_.size();
  }

private:
  std::unordered_map<std::string, WorkerBinding, StringHash, StringEqual>
      workers_;
};

// Always succeeds and echoes the description back as the payload.
[[nodiscard]] auto create_noop_worker() -> std::shared_ptr<IWorker>;

}  // namespace conductor
