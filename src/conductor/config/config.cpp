#include "conductor/config/config.hpp"

#include "conductor/config/yaml_utils.hpp"
#include "conductor/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <span>
#include <sstream>
#include <thread>

namespace conductor {

auto OrchestratorConfig::effective_parallelism() const -> std::size_t {
  if (max_parallelism > 0) {
    return static_cast<std::size_t>(max_parallelism);
  }
  return std::max(1u, std::thread::hardware_concurrency());
}

namespace {

auto decode_limits(const YAML::Node& node, const ServiceLimits& base)
    -> ServiceLimits {
  ServiceLimits l = base;
  if (!node || !node.IsMap()) {
    return l;
  }
  l.failure_threshold =
      yaml_get_or(node, "failure_threshold", base.failure_threshold);
  l.failure_window = yaml_get_ms_or(node, "failure_window_ms", base.failure_window);
  l.recovery_timeout =
      yaml_get_ms_or(node, "recovery_timeout_ms", base.recovery_timeout);
  l.bucket_capacity = yaml_get_or(node, "bucket_capacity", base.bucket_capacity);
  l.refill_per_minute =
      yaml_get_or(node, "refill_per_minute", base.refill_per_minute);
  return l;
}

}  // namespace

}  // namespace conductor

namespace YAML {

template <>
struct convert<conductor::OrchestratorConfig> {
  static bool decode(const Node& node, conductor::OrchestratorConfig& o) {
    if (!node.IsMap()) {
      return false;
    }
    const conductor::OrchestratorConfig d;
    o.max_parallelism = conductor::yaml_get_or(node, "max_parallelism", d.max_parallelism);
    o.subtask_timeout =
        conductor::yaml_get_ms_or(node, "subtask_timeout_ms", d.subtask_timeout);
    o.max_retries = conductor::yaml_get_or(node, "max_retries", d.max_retries);
    o.max_description_bytes = conductor::yaml_get_or<std::size_t>(
        node, "max_description_bytes", d.max_description_bytes);
    o.failure_policy =
        conductor::yaml_get_or(node, "failure_policy", d.failure_policy);
    o.strategy_order = conductor::yaml_get_or(node, "strategy_order", d.strategy_order);
    o.backoff_base = conductor::yaml_get_ms_or(node, "backoff_base_ms", d.backoff_base);
    o.backoff_cap = conductor::yaml_get_ms_or(node, "backoff_cap_ms", d.backoff_cap);
    o.max_fan_out =
        conductor::yaml_get_or<std::size_t>(node, "max_fan_out", d.max_fan_out);
    return true;
  }
};

template <>
struct convert<conductor::ResilienceConfig> {
  static bool decode(const Node& node, conductor::ResilienceConfig& r) {
    if (!node.IsMap()) {
      return false;
    }
    r.defaults = conductor::decode_limits(node["default"], conductor::ServiceLimits{});
    if (auto services = node["services"]) {
      if (!services.IsMap()) {
        return false;
      }
      for (const auto& entry : services) {
        r.services[entry.first.as<std::string>()] =
            conductor::decode_limits(entry.second, r.defaults);
      }
    }
    return true;
  }
};

template <>
struct convert<conductor::StorageConfig> {
  static bool decode(const Node& node, conductor::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.db_file = conductor::yaml_get_or<std::string>(node, "db_file", "");
    return true;
  }
};

template <>
struct convert<conductor::LoggingConfig> {
  static bool decode(const Node& node, conductor::LoggingConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = conductor::yaml_get_or<std::string>(node, "level", "info");
    return true;
  }
};

template <>
struct convert<conductor::SystemConfig> {
  static bool decode(const Node& node, conductor::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto orchestrator = node["orchestrator"]) {
      c.orchestrator = orchestrator.as<conductor::OrchestratorConfig>();
    }
    if (auto resilience = node["resilience"]) {
      c.resilience = resilience.as<conductor::ResilienceConfig>();
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<conductor::StorageConfig>();
    }
    if (auto logging = node["logging"]) {
      c.logging = logging.as<conductor::LoggingConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace conductor {

namespace {

void to_yaml(YAML::Emitter& out, const OrchestratorConfig& o) {
  const OrchestratorConfig d;
  out << YAML::BeginMap;
  if (o.max_parallelism != d.max_parallelism) {
    yaml_emit(out, "max_parallelism", o.max_parallelism);
  }
  if (o.subtask_timeout != d.subtask_timeout) {
    yaml_emit(out, "subtask_timeout_ms", o.subtask_timeout.count());
  }
  if (o.max_retries != d.max_retries) {
    yaml_emit(out, "max_retries", o.max_retries);
  }
  if (o.max_description_bytes != d.max_description_bytes) {
    yaml_emit(out, "max_description_bytes", o.max_description_bytes);
  }
  if (o.failure_policy != d.failure_policy) {
    yaml_emit(out, "failure_policy",
              std::string(to_string_view(o.failure_policy)));
  }
  if (o.strategy_order != d.strategy_order) {
    out << YAML::Key << "strategy_order" << YAML::Value << YAML::Flow
        << YAML::BeginSeq;
    for (Strategy s : o.strategy_order) {
      out << std::string(to_string_view(s));
    }
    out << YAML::EndSeq;
  }
  if (o.backoff_base != d.backoff_base) {
    yaml_emit(out, "backoff_base_ms", o.backoff_base.count());
  }
  if (o.backoff_cap != d.backoff_cap) {
    yaml_emit(out, "backoff_cap_ms", o.backoff_cap.count());
  }
  if (o.max_fan_out != d.max_fan_out) {
    yaml_emit(out, "max_fan_out", o.max_fan_out);
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const ServiceLimits& l,
             const ServiceLimits& base) {
  out << YAML::BeginMap;
  if (l.failure_threshold != base.failure_threshold) {
    yaml_emit(out, "failure_threshold", l.failure_threshold);
  }
  if (l.failure_window != base.failure_window) {
    yaml_emit(out, "failure_window_ms", l.failure_window.count());
  }
  if (l.recovery_timeout != base.recovery_timeout) {
    yaml_emit(out, "recovery_timeout_ms", l.recovery_timeout.count());
  }
  if (l.bucket_capacity != base.bucket_capacity) {
    yaml_emit(out, "bucket_capacity", l.bucket_capacity);
  }
  if (l.refill_per_minute != base.refill_per_minute) {
    yaml_emit(out, "refill_per_minute", l.refill_per_minute);
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const ResilienceConfig& r) {
  out << YAML::BeginMap;
  if (r.defaults != ServiceLimits{}) {
    out << YAML::Key << "default" << YAML::Value;
    to_yaml(out, r.defaults, ServiceLimits{});
  }
  if (!r.services.empty()) {
    std::vector<std::string> keys;
    for (const auto& [key, _] : r.services) {
      keys.push_back(key);
    }
    std::ranges::sort(keys);

    out << YAML::Key << "services" << YAML::Value << YAML::BeginMap;
    for (const auto& key : keys) {
      out << YAML::Key << key << YAML::Value;
      to_yaml(out, r.services.at(key), r.defaults);
    }
    out << YAML::EndMap;
  }
  out << YAML::EndMap;
}

auto check(bool condition, std::string_view what) -> Result<void> {
  if (!condition) {
    log::error("Invalid config: {}", what);
    return fail(Error::InvalidArgument);
  }
  return ok();
}

auto validate_limits(const ServiceLimits& l) -> Result<void> {
  if (auto r = check(l.failure_threshold > 0, "failure_threshold must be > 0");
      !r) {
    return r;
  }
  if (auto r = check(l.failure_window.count() > 0,
                     "failure_window_ms must be > 0");
      !r) {
    return r;
  }
  if (auto r = check(l.recovery_timeout.count() >= 0,
                     "recovery_timeout_ms must be >= 0");
      !r) {
    return r;
  }
  if (auto r = check(l.bucket_capacity > 0, "bucket_capacity must be > 0");
      !r) {
    return r;
  }
  return check(l.refill_per_minute > 0.0, "refill_per_minute must be > 0");
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  SystemConfig config;
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    config = root.as<SystemConfig>();
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }

  if (auto r = validate(config); !r) {
    return fail(r.error());
  }
  return ok(std::move(config));
}

auto ConfigLoader::validate(const SystemConfig& config) -> Result<void> {
  const auto& o = config.orchestrator;
  if (auto r = check(o.max_parallelism >= 0, "max_parallelism must be >= 0");
      !r) {
    return r;
  }
  if (auto r = check(o.subtask_timeout.count() > 0,
                     "subtask_timeout_ms must be > 0");
      !r) {
    return r;
  }
  if (auto r = check(o.max_retries >= 0, "max_retries must be >= 0"); !r) {
    return r;
  }
  if (auto r = check(o.max_description_bytes > 0,
                     "max_description_bytes must be > 0");
      !r) {
    return r;
  }
  if (auto r = check(!o.strategy_order.empty(), "strategy_order is empty");
      !r) {
    return r;
  }
  for (std::size_t i = 0; i < o.strategy_order.size(); ++i) {
    auto rest = std::span(o.strategy_order).subspan(i + 1);
    if (auto r = check(std::ranges::find(rest, o.strategy_order[i]) ==
                           rest.end(),
                       "strategy_order has duplicates");
        !r) {
      return r;
    }
  }
  if (auto r = check(o.backoff_base.count() > 0 &&
                         o.backoff_cap >= o.backoff_base,
                     "backoff_cap_ms must be >= backoff_base_ms > 0");
      !r) {
    return r;
  }
  if (auto r = check(o.max_fan_out >= 2, "max_fan_out must be >= 2"); !r) {
    return r;
  }

  if (auto r = validate_limits(config.resilience.defaults); !r) {
    return r;
  }
  for (const auto& [key, limits] : config.resilience.services) {
    if (auto r = validate_limits(limits); !r) {
      log::error("Invalid limits for service '{}'", key);
      return r;
    }
  }

  return check(log::level_name(log::parse_level(config.logging.level)) ==
                   config.logging.level,
               "unknown logging.level");
}

auto ConfigLoader::to_yaml(const SystemConfig& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;

  out << YAML::Key << "orchestrator" << YAML::Value;
  conductor::to_yaml(out, config.orchestrator);

  out << YAML::Key << "resilience" << YAML::Value;
  conductor::to_yaml(out, config.resilience);

  out << YAML::Key << "storage" << YAML::Value << YAML::BeginMap;
  yaml_emit_if_not_empty(out, "db_file", config.storage.db_file);
  out << YAML::EndMap;

  out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
  if (config.logging.level != "info") {
    yaml_emit(out, "level", config.logging.level);
  }
  out << YAML::EndMap;

  out << YAML::EndMap;
  return out.c_str();
}

}  // namespace conductor
