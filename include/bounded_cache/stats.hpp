#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace bounded_cache {

struct CacheStatistics {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t insertions{0};
  std::uint64_t evictions{0};
  std::uint64_t expirations{0};
  std::size_t entry_count{0};
  std::size_t size_bytes{0};
  std::size_t memory_limit_bytes{0};

  double hit_rate() const;
  double utilization() const;
};

enum class HealthStatus { Healthy, Warning, Critical };

struct HealthReport {
  HealthStatus status{HealthStatus::Healthy};
  std::vector<std::string> issues;
};

constexpr std::uint64_t kMinLookupsForHitRate = 20;

HealthReport evaluate_health(const CacheStatistics &s);
const char *to_string(HealthStatus status);

// name:value lines, one per field.
std::string format_info(const CacheStatistics &s);
std::string format_json(const CacheStatistics &s);

} // namespace bounded_cache
