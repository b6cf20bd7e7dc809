#pragma once

#include "bounded_cache/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace bounded_cache {

constexpr Millis kMinSweepInterval{100};
constexpr Millis kMaxSweepInterval{5 * 60 * 1000};
// Longest accepted TTL (one year); keeps now + ttl inside the clock's range.
constexpr Millis kMaxTtl{365LL * 24 * 60 * 60 * 1000};
constexpr double kDefaultSoftThresholdRatio = 0.8;

struct CacheConfig {
  std::size_t memory_limit_bytes{64 * 1024 * 1024};
  std::unordered_map<std::string, Millis> category_ttls;
  Millis default_ttl{5 * 60 * 1000};
  // Unset: derived from the smallest configured TTL.
  std::optional<Millis> sweep_interval;
  double soft_threshold_ratio{kDefaultSoftThresholdRatio};
  bool sweep_enabled{true};
  std::string estimator{"payload"};

  bool validate(std::string *err = nullptr) const;
  Millis ttl_for(const std::string &category) const;
  Millis resolved_sweep_interval() const;
  std::size_t soft_limit_bytes() const;
};

CacheConfig default_config();

bool load_config_file(const std::string &path, CacheConfig &out,
                      std::string *err = nullptr);

} // namespace bounded_cache
