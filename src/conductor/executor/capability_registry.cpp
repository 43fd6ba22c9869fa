#include "conductor/executor/worker.hpp"
#include "conductor/util/log.hpp"

#include <algorithm>

namespace conductor {

auto CapabilityRegistry::register_worker(std::string capability,
                                         ServiceKey service_key,
                                         std::shared_ptr<IWorker> worker)
    -> Result<void> {
  if (capability.empty() || service_key.empty() || !worker) {
    return fail(Error::InvalidArgument);
  }
  if (workers_.contains(capability)) {
    log::warn("CapabilityRegistry: capability '{}' already registered",
              capability);
    return fail(Error::AlreadyExists);
  }

  log::debug("CapabilityRegistry: {} -> {}", capability, service_key);
  workers_.emplace(std::move(capability),
                   WorkerBinding{std::move(service_key), std::move(worker)});
  return ok();
}

auto CapabilityRegistry::find(std::string_view capability) const
    -> const WorkerBinding* {
  auto it = workers_.find(capability);
  return it != workers_.end() ? &it->second : nullptr;
}

auto CapabilityRegistry::capabilities() const -> std::vector<std::string> {
  std::vector<std::string> result;
  result.reserve(workers_.size());
  for (const auto& [name, _] : workers_) {
    result.push_back(name);
  }
  std::ranges::sort(result);
  return result;
}

}  // namespace conductor
