#pragma once

#include "bounded_cache/config.hpp"
#include "bounded_cache/types.hpp"

namespace bounded_cache::testing {

// Deterministic time source; only for caches built with sweep_enabled=false.
struct ManualClock {
  TimePoint t{};
  void advance(Millis d) { t += d; }
  TimeSource source() {
    return [this] { return t; };
  }
};

inline CacheConfig manual_config(std::size_t memory_limit_bytes) {
  CacheConfig cfg;
  cfg.memory_limit_bytes = memory_limit_bytes;
  cfg.sweep_enabled = false;
  return cfg;
}

} // namespace bounded_cache::testing
