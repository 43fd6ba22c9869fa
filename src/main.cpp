#include "conductor/config/config.hpp"
#include "conductor/executor/worker.hpp"
#include "conductor/model/serialization.hpp"
#include "conductor/model/state_strings.hpp"
#include "conductor/orchestrator/decomposer.hpp"
#include "conductor/orchestrator/orchestrator.hpp"
#include "conductor/storage/persistence.hpp"
#include "conductor/storage/recovery.hpp"
#include "conductor/util/log.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace {

void print_usage(const char* prog) {
  fmt::print("conductor - agent task orchestrator\n");
  fmt::print("Usage: {} [OPTIONS]\n\n", prog);
  fmt::print("Options:\n");
  fmt::print("  -c, --config <file>     Config file (YAML)\n");
  fmt::print("  --db <file>             Database file (overrides config)\n");
  fmt::print("  -t, --task <text>       Submit a task and run it\n");
  fmt::print("  --resume <task-id>      Resume a persisted task\n");
  fmt::print("  -l, --list-incomplete   List persisted tasks that did not "
             "finish\n");
  fmt::print("  --log-level <level>     trace|debug|info|warn|error\n");
  fmt::print("  -v, --version           Show version and exit\n");
  fmt::print("  -h, --help              Show this help message\n\n");
  fmt::print("Examples:\n");
  fmt::print("  {} -t \"fix typo in README line 10\"\n", prog);
  fmt::print("  {} -c conductor.yaml --db conductor.db --resume task_1_ab\n",
             prog);
}

void print_version() {
  fmt::print("conductor v0.1.0\n");
}

struct Options {
  std::string config_file;
  std::string db_file;
  std::string task;
  std::string resume_id;
  std::string log_level;
  bool list_incomplete = false;
};

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> std::string {
  if (++i >= argc) {
    fmt::print(stderr, "Error: {} requires an argument\n", flag);
    std::exit(1);
  }
  return argv[i];
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.config_file = require_value(i, argc, argv, arg);
    } else if (arg == "--db") {
      opts.db_file = require_value(i, argc, argv, arg);
    } else if (arg == "-t" || arg == "--task") {
      opts.task = require_value(i, argc, argv, arg);
    } else if (arg == "--resume") {
      opts.resume_id = require_value(i, argc, argv, arg);
    } else if (arg == "-l" || arg == "--list-incomplete") {
      opts.list_incomplete = true;
    } else if (arg == "--log-level") {
      opts.log_level = require_value(i, argc, argv, arg);
    } else {
      fmt::print(stderr, "Unknown option: {}\n", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

auto load_config(const Options& opts)
    -> std::optional<conductor::SystemConfig> {
  conductor::SystemConfig config;
  if (!opts.config_file.empty()) {
    if (!std::filesystem::exists(opts.config_file)) {
      fmt::print(stderr, "Error: Config file not found: {}\n",
                 opts.config_file);
      return std::nullopt;
    }
    auto loaded = conductor::ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      fmt::print(stderr, "Error: Failed to load config: {}\n",
                 loaded.error().message());
      return std::nullopt;
    }
    config = std::move(*loaded);
  }
  if (!opts.db_file.empty()) {
    config.storage.db_file = opts.db_file;
  }
  if (!opts.log_level.empty()) {
    config.logging.level = opts.log_level;
  }
  return config;
}

auto print_verdict(const conductor::Verdict& verdict) -> void {
  using conductor::to_string_view;
  fmt::print("task:      {}\n", verdict.task_id);
  fmt::print("stage:     {}\n", to_string_view(verdict.stage));
  if (!verdict.reason.empty()) {
    fmt::print("reason:    {}\n", verdict.reason);
  }
  if (verdict.cancelled) {
    fmt::print("cancelled: yes\n");
  }
  fmt::print("succeeded: {}\n", verdict.succeeded.size());
  fmt::print("failed:    {}\n", verdict.failed.size());
  fmt::print("skipped:   {}\n", verdict.skipped.size());
  if (!verdict.touched_files.empty()) {
    fmt::print("touched:   {}\n", fmt::join(verdict.touched_files, ", "));
  }
  if (verdict.escalation) {
    fmt::print("{}\n", conductor::escalation_to_json(*verdict.escalation));
  }
}

auto register_noop_workers(conductor::CapabilityRegistry& registry) -> bool {
  auto worker = conductor::create_noop_worker();
  for (auto cap :
       {conductor::capability::kPlan, conductor::capability::kImplement,
        conductor::capability::kReview, conductor::capability::kValidate}) {
    auto r = registry.register_worker(std::string(cap),
                                      conductor::ServiceKey{"worker.noop"},
                                      worker);
    if (!r) {
      fmt::print(stderr, "Error: cannot register worker for {}: {}\n", cap,
                 r.error().message());
      return false;
    }
  }
  return true;
}

auto list_incomplete(conductor::Persistence& persistence) -> int {
  conductor::Recovery recovery(persistence);
  auto ids = recovery.incomplete_tasks();
  if (!ids) {
    fmt::print(stderr, "Error: {}\n", ids.error().message());
    return 1;
  }
  for (const auto& id : *ids) {
    fmt::print("{}\n", id);
  }
  return 0;
}

auto run(const Options& opts, const conductor::SystemConfig& config) -> int {
  std::unique_ptr<conductor::Persistence> persistence;
  if (!config.storage.db_file.empty()) {
    persistence =
        std::make_unique<conductor::Persistence>(config.storage.db_file);
    if (auto r = persistence->open(); !r) {
      fmt::print(stderr, "Error: cannot open {}: {}\n", config.storage.db_file,
                 r.error().message());
      return 1;
    }
  }

  if (opts.list_incomplete) {
    if (!persistence) {
      fmt::print(stderr, "Error: --list-incomplete needs a database\n");
      return 1;
    }
    return list_incomplete(*persistence);
  }

  conductor::OrchestratorContext ctx;
  ctx.config = config.orchestrator;
  ctx.governor =
      std::make_shared<conductor::ResilienceGovernor>(config.resilience);
  ctx.persistence = persistence.get();
  if (!register_noop_workers(ctx.registry)) {
    return 1;
  }
  ctx.on_ready_for_integration =
      [](const conductor::TaskId& id, const std::vector<std::string>& files) {
        conductor::log::info("Task {} ready for integration ({} file(s))", id,
                             files.size());
      };

  conductor::TaskOrchestrator orchestrator(std::move(ctx));

  conductor::TaskId task_id;
  if (!opts.resume_id.empty()) {
    task_id = conductor::TaskId{opts.resume_id};
    if (auto r = orchestrator.resume(task_id); !r) {
      fmt::print(stderr, "Error: cannot resume {}: {}\n", task_id,
                 r.error().message());
      return 1;
    }
  } else {
    auto submitted = orchestrator.submit(opts.task);
    if (!submitted) {
      fmt::print(stderr, "Error: task rejected: {}\n",
                 submitted.error().message());
      return 1;
    }
    task_id = *submitted;
  }

  auto verdict = orchestrator.execute(task_id);
  if (!verdict) {
    fmt::print(stderr, "Error: {}\n", verdict.error().message());
    return 1;
  }
  print_verdict(*verdict);
  return verdict->stage == conductor::TaskStage::Complete ? 0 : 2;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);
  if (opts.task.empty() && opts.resume_id.empty() && !opts.list_incomplete) {
    print_usage(argv[0]);
    return 1;
  }

  auto config = load_config(opts);
  if (!config) {
    return 1;
  }
  if (auto r = conductor::ConfigLoader::validate(*config); !r) {
    fmt::print(stderr, "Error: invalid configuration: {}\n",
               r.error().message());
    return 1;
  }

  conductor::log::set_level(config->logging.level);
  conductor::log::start();
  int rc = run(opts, *config);
  conductor::log::stop();
  return rc;
}
