#include "conductor/config/config.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>

#include "gtest/gtest.h"

using namespace conductor;
using namespace std::chrono_literals;

TEST(ConfigTest, DefaultsMatchDocumentedValues) {
  SystemConfig config;
  const auto& o = config.orchestrator;
  EXPECT_EQ(o.max_retries, 3);
  EXPECT_EQ(o.subtask_timeout, 120s);
  EXPECT_EQ(o.failure_policy, FailurePolicy::GracefulDegradation);
  EXPECT_EQ(o.strategy_order,
            (std::vector<Strategy>{Strategy::Direct, Strategy::MechanicalFix,
                                   Strategy::Regenerate, Strategy::Simplify}));
  EXPECT_GE(o.effective_parallelism(), 1U);

  const auto& l = config.resilience.defaults;
  EXPECT_EQ(l.failure_threshold, 5);
  EXPECT_EQ(l.failure_window, 60s);
  EXPECT_EQ(l.recovery_timeout, 30s);
  EXPECT_EQ(l.bucket_capacity, 10);
  EXPECT_DOUBLE_EQ(l.refill_per_minute, 10.0);

  EXPECT_TRUE(config.storage.db_file.empty());
  EXPECT_EQ(config.logging.level, "info");
  EXPECT_TRUE(ConfigLoader::validate(config));
}

TEST(ConfigTest, LoadsOverrides) {
  auto config = ConfigLoader::load_from_string(R"(
orchestrator:
  max_parallelism: 4
  subtask_timeout_ms: 5000
  max_retries: 5
  failure_policy: all_or_nothing
  strategy_order: [simplify, direct]
  backoff_base_ms: 10
  backoff_cap_ms: 100
resilience:
  default:
    failure_threshold: 2
    refill_per_minute: 30
  services:
    worker.llm:
      bucket_capacity: 3
storage:
  db_file: /var/lib/conductor/state.db
logging:
  level: debug
)");
  ASSERT_TRUE(config) << config.error().message();

  const auto& o = config->orchestrator;
  EXPECT_EQ(o.max_parallelism, 4);
  EXPECT_EQ(o.effective_parallelism(), 4U);
  EXPECT_EQ(o.subtask_timeout, 5s);
  EXPECT_EQ(o.max_retries, 5);
  EXPECT_EQ(o.failure_policy, FailurePolicy::AllOrNothing);
  EXPECT_EQ(o.strategy_order,
            (std::vector<Strategy>{Strategy::Simplify, Strategy::Direct}));
  EXPECT_EQ(o.backoff_base, 10ms);
  EXPECT_EQ(o.backoff_cap, 100ms);

  const auto& r = config->resilience;
  EXPECT_EQ(r.defaults.failure_threshold, 2);
  EXPECT_DOUBLE_EQ(r.defaults.refill_per_minute, 30.0);
  const auto& llm = r.limits_for("worker.llm");
  EXPECT_EQ(llm.bucket_capacity, 3);
  // Service overrides inherit from the configured defaults.
  EXPECT_EQ(llm.failure_threshold, 2);
  EXPECT_EQ(r.limits_for("worker.other").bucket_capacity, 10);

  EXPECT_EQ(config->storage.db_file, "/var/lib/conductor/state.db");
  EXPECT_EQ(config->logging.level, "debug");
}

TEST(ConfigTest, MissingSectionsKeepDefaults) {
  auto config = ConfigLoader::load_from_string("logging:\n  level: warn\n");
  ASSERT_TRUE(config);
  EXPECT_EQ(config->orchestrator.max_retries, 3);
  EXPECT_EQ(config->resilience.defaults.failure_threshold, 5);
  EXPECT_EQ(config->logging.level, "warn");
}

TEST(ConfigTest, UnknownStrategyIsParseError) {
  auto config = ConfigLoader::load_from_string(
      "orchestrator:\n  strategy_order: [direct, pray]\n");
  ASSERT_FALSE(config);
  EXPECT_EQ(config.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, UnknownPolicyIsParseError) {
  auto config = ConfigLoader::load_from_string(
      "orchestrator:\n  failure_policy: best_effort\n");
  ASSERT_FALSE(config);
  EXPECT_EQ(config.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, MalformedYamlIsParseError) {
  EXPECT_EQ(ConfigLoader::load_from_string("orchestrator: [unclosed").error(),
            make_error_code(Error::ParseError));
  EXPECT_EQ(ConfigLoader::load_from_string("").error(),
            make_error_code(Error::ParseError));
}

TEST(ConfigTest, OutOfRangeValuesAreInvalid) {
  for (const char* yaml : {
           "orchestrator:\n  max_retries: -1\n",
           "orchestrator:\n  subtask_timeout_ms: 0\n",
           "orchestrator:\n  strategy_order: [direct, direct]\n",
           "orchestrator:\n  backoff_base_ms: 50\n  backoff_cap_ms: 10\n",
           "orchestrator:\n  max_fan_out: 1\n",
           "resilience:\n  default:\n    failure_threshold: 0\n",
           "resilience:\n  services:\n    w:\n      bucket_capacity: 0\n",
           "logging:\n  level: loud\n",
       }) {
    auto config = ConfigLoader::load_from_string(yaml);
    ASSERT_FALSE(config) << yaml;
    EXPECT_EQ(config.error(), make_error_code(Error::InvalidArgument)) << yaml;
  }
}

TEST(ConfigTest, ToYamlEmitsOnlyNonDefaults) {
  SystemConfig config;
  config.orchestrator.max_retries = 7;
  config.orchestrator.failure_policy = FailurePolicy::AllOrNothing;
  config.resilience.services["worker.llm"].bucket_capacity = 2;

  auto yaml = ConfigLoader::to_yaml(config);
  EXPECT_NE(yaml.find("max_retries: 7"), std::string::npos);
  EXPECT_NE(yaml.find("all_or_nothing"), std::string::npos);
  EXPECT_NE(yaml.find("worker.llm"), std::string::npos);
  EXPECT_EQ(yaml.find("subtask_timeout_ms"), std::string::npos);
  EXPECT_EQ(yaml.find("strategy_order"), std::string::npos);
  EXPECT_EQ(yaml.find("db_file"), std::string::npos);

  auto reloaded = ConfigLoader::load_from_string(yaml);
  ASSERT_TRUE(reloaded) << yaml;
  EXPECT_EQ(reloaded->orchestrator.max_retries, 7);
  EXPECT_EQ(reloaded->orchestrator.failure_policy, FailurePolicy::AllOrNothing);
  EXPECT_EQ(reloaded->resilience.limits_for("worker.llm").bucket_capacity, 2);
}

TEST(ConfigTest, LoadsFromFile) {
  auto path = std::filesystem::temp_directory_path() / "conductor_config_test.yaml";
  {
    std::ofstream out(path);
    out << "orchestrator:\n  max_retries: 1\n";
  }
  auto config = ConfigLoader::load_from_file(path.string());
  std::filesystem::remove(path);

  ASSERT_TRUE(config);
  EXPECT_EQ(config->orchestrator.max_retries, 1);
}

TEST(ConfigTest, MissingFileIsFileNotFound) {
  auto config = ConfigLoader::load_from_file("/nonexistent/conductor.yaml");
  ASSERT_FALSE(config);
  EXPECT_EQ(config.error(), make_error_code(Error::FileNotFound));
}
