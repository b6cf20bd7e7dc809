#pragma once

#include "bounded_cache/config.hpp"
#include "bounded_cache/size_estimator.hpp"
#include "bounded_cache/stats.hpp"
#include "bounded_cache/sweeper.hpp"
#include "bounded_cache/types.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bounded_cache {

using StatsSink = std::function<void(const CacheStatistics &)>;
using Loader = std::function<Value()>;

class BoundedCache {
public:
  // Throws std::invalid_argument if cfg fails validation or names an
  // unknown estimator. A null estimator selects the one named in cfg.
  explicit BoundedCache(CacheConfig cfg,
                        std::unique_ptr<ISizeEstimator> estimator = nullptr,
                        TimeSource now = {});
  ~BoundedCache();

  BoundedCache(const BoundedCache &) = delete;
  BoundedCache &operator=(const BoundedCache &) = delete;

  void set(const std::string &key, Value value,
           const std::string &category = "default");
  std::optional<Value> get(const std::string &key);
  Value get_or_load(const std::string &key, const std::string &category,
                    const Loader &loader);
  bool erase(const std::string &key);
  void clear();

  // One expiry pass plus a trim to the soft limit. Returns the number of
  // expired entries removed.
  std::size_t sweep();
  void shutdown();

  CacheStatistics stats() const;
  HealthReport health() const;
  std::string info() const;
  bool dump_stats(const std::string &path, std::string *err = nullptr) const;
  void set_stats_sink(StatsSink sink);

  const CacheConfig &config() const { return cfg_; }
  const ISizeEstimator &estimator() const { return *estimator_; }
  bool sweeper_running() const;

private:
  using LruKey = std::pair<TimePoint, std::uint64_t>;

  struct ExpiryNode {
    TimePoint deadline;
    std::string key;
    std::uint64_t generation;
    bool operator>(const ExpiryNode &other) const {
      return deadline > other.deadline;
    }
  };

  TimePoint now() const;
  bool is_expired(const Entry &e, TimePoint at) const {
    return e.expires_at <= at;
  }
  void erase_internal(const std::string &key, bool eviction, bool expiration);
  std::size_t expire_due(TimePoint at);
  std::size_t evict_until(std::size_t target);
  void rebuild_accounting();
  void touch(Entry &e, TimePoint at);
  void compact_expiry_index();
  void background_sweep();
  CacheStatistics snapshot_locked() const;

  CacheConfig cfg_;
  std::unique_ptr<ISizeEstimator> estimator_;
  TimeSource now_;
  std::unordered_map<std::string, Entry> entries_;
  std::map<LruKey, std::string> lru_;
  std::priority_queue<ExpiryNode, std::vector<ExpiryNode>,
                      std::greater<ExpiryNode>>
      expiry_heap_;
  CacheStatistics stats_;
  std::size_t memory_used_{0};
  std::uint64_t seq_{0};
  mutable std::mutex mu_;

  std::mutex sink_mu_;
  StatsSink sink_;
  std::unique_ptr<Sweeper> sweeper_;
};

} // namespace bounded_cache
