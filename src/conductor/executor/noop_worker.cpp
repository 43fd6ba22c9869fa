#include "conductor/executor/worker.hpp"

namespace conductor {

class NoopWorker : public IWorker {
public:
  ~NoopWorker() override = default;

  auto execute(const WorkerRequest& request) -> WorkerResult override {
    WorkerResult result;
    result.success = true;
    result.payload = request.description;
    return result;
  }
};

auto create_noop_worker() -> std::shared_ptr<IWorker> {
  return std::make_shared<NoopWorker>();
}

}  // namespace conductor
