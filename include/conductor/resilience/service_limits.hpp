#pragma once

#include <chrono>
#include <string>
#include <unordered_map>

namespace conductor {

struct ServiceLimits {
  int failure_threshold{5};
  std::chrono::milliseconds failure_window{std::chrono::seconds(60)};
  std::chrono::milliseconds recovery_timeout{std::chrono::seconds(30)};
  int bucket_capacity{10};
  double refill_per_minute{10.0};

  auto operator==(const ServiceLimits&) const -> bool = default;
};

struct ResilienceConfig {
  ServiceLimits defaults;
  // Per service-key overrides; keys not listed use `defaults`.
  std::unordered_map<std::string, ServiceLimits> services;

  [[nodiscard]] auto limits_for(const std::string& service_key) const
      -> const ServiceLimits& {
    auto it = services.find(service_key);
    return it != services.end() ? it->second : defaults;
  }
};

}  // namespace conductor
