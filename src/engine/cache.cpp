#include "bounded_cache/cache.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <fstream>
#include <stdexcept>

namespace bounded_cache {

BoundedCache::BoundedCache(CacheConfig cfg,
                           std::unique_ptr<ISizeEstimator> estimator,
                           TimeSource now)
    : cfg_(std::move(cfg)), estimator_(std::move(estimator)),
      now_(std::move(now)) {
  std::string err;
  if (!cfg_.validate(&err))
    throw std::invalid_argument("invalid cache config: " + err);
  if (!estimator_)
    estimator_ = make_estimator_by_name(cfg_.estimator);
  if (!now_)
    now_ = [] { return Clock::now(); };
  stats_.memory_limit_bytes = cfg_.memory_limit_bytes;

  if (cfg_.sweep_enabled) {
    sweeper_ = std::make_unique<Sweeper>(cfg_.resolved_sweep_interval(),
                                         [this] { background_sweep(); });
    sweeper_->start();
  }
  spdlog::info("bounded_cache: created memory_limit={}B soft_limit={}B "
               "categories={} default_ttl={}ms estimator={} sweep={}",
               cfg_.memory_limit_bytes, cfg_.soft_limit_bytes(),
               cfg_.category_ttls.size(), cfg_.default_ttl.count(),
               estimator_->name(),
               sweeper_ ? std::to_string(sweeper_->interval().count()) + "ms"
                        : std::string("disabled"));
}

BoundedCache::~BoundedCache() { shutdown(); }

void BoundedCache::set(const std::string &key, Value value,
                       const std::string &category) {
  if (key.empty())
    throw std::invalid_argument("cache key must not be empty");
  const std::size_t size = estimator_->estimate(value);
  const bool known = cfg_.category_ttls.contains(category);
  const Millis ttl = cfg_.ttl_for(category);

  std::lock_guard<std::mutex> lock(mu_);
  const auto at = now();
  if (entries_.contains(key))
    erase_internal(key, false, false);

  Entry e;
  e.value = std::move(value);
  e.category = known ? category : "default";
  e.size_bytes = size;
  e.expires_at = at + ttl;
  e.last_access = at;
  e.seq = ++seq_;

  lru_.emplace(LruKey{e.last_access, e.seq}, key);
  expiry_heap_.push({e.expires_at, key, e.seq});
  memory_used_ += size;
  entries_.emplace(key, std::move(e));
  ++stats_.insertions;

  if (memory_used_ <= cfg_.memory_limit_bytes)
    return;
  // Expired entries are not eviction candidates.
  expire_due(at);
  if (size > cfg_.memory_limit_bytes) {
    spdlog::debug("bounded_cache: entry '{}' ({}B) exceeds the budget", key,
                  size);
    erase_internal(key, true, false);
  }
  evict_until(cfg_.memory_limit_bytes);
}

std::optional<Value> BoundedCache::get(const std::string &key) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto at = now();
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    ++stats_.misses;
    return std::nullopt;
  }
  if (is_expired(it->second, at)) {
    erase_internal(key, false, true);
    ++stats_.misses;
    return std::nullopt;
  }
  auto &e = it->second;
  touch(e, at);
  ++stats_.hits;
  return e.value;
}

Value BoundedCache::get_or_load(const std::string &key,
                                const std::string &category,
                                const Loader &loader) {
  if (auto hit = get(key))
    return std::move(*hit);
  Value v = loader();
  set(key, v, category);
  return v;
}

bool BoundedCache::erase(const std::string &key) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!entries_.contains(key))
    return false;
  erase_internal(key, false, false);
  return true;
}

void BoundedCache::clear() {
  std::lock_guard<std::mutex> lock(mu_);
  entries_.clear();
  lru_.clear();
  expiry_heap_ = decltype(expiry_heap_)();
  memory_used_ = 0;
}

std::size_t BoundedCache::sweep() {
  std::lock_guard<std::mutex> lock(mu_);
  const auto at = now();
  const std::size_t expired = expire_due(at);
  std::size_t trimmed = 0;
  if (memory_used_ > cfg_.soft_limit_bytes())
    trimmed = evict_until(cfg_.soft_limit_bytes());
  compact_expiry_index();
  if (expired > 0 || trimmed > 0)
    spdlog::debug("bounded_cache: sweep removed {} expired, trimmed {} "
                  "({} entries, {}B left)",
                  expired, trimmed, entries_.size(), memory_used_);
  return expired;
}

void BoundedCache::shutdown() {
  if (!sweeper_ || !sweeper_->running())
    return;
  sweeper_->stop();
  spdlog::info("bounded_cache: sweeper stopped after {} runs",
               sweeper_->runs());
}

bool BoundedCache::sweeper_running() const {
  return sweeper_ && sweeper_->running();
}

CacheStatistics BoundedCache::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return snapshot_locked();
}

HealthReport BoundedCache::health() const { return evaluate_health(stats()); }

std::string BoundedCache::info() const { return format_info(stats()); }

bool BoundedCache::dump_stats(const std::string &path,
                              std::string *err) const {
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    if (err)
      *err = "cannot open " + path;
    return false;
  }
  out << format_json(stats()) << "\n";
  if (!out) {
    if (err)
      *err = "write failed";
    return false;
  }
  return true;
}

void BoundedCache::set_stats_sink(StatsSink sink) {
  std::lock_guard<std::mutex> lock(sink_mu_);
  sink_ = std::move(sink);
}

TimePoint BoundedCache::now() const { return now_(); }

void BoundedCache::erase_internal(const std::string &key, bool eviction,
                                  bool expiration) {
  auto it = entries_.find(key);
  if (it == entries_.end())
    return;
  const std::size_t size = it->second.size_bytes;
  lru_.erase(LruKey{it->second.last_access, it->second.seq});
  entries_.erase(it);

  const bool consistent = size <= memory_used_;
  if (consistent)
    memory_used_ -= size;
  if (eviction)
    ++stats_.evictions;
  if (expiration)
    ++stats_.expirations;
  if (!consistent) {
    spdlog::error("bounded_cache: size accounting underflow ({}B tracked, "
                  "{}B released), rescanning",
                  memory_used_, size);
    rebuild_accounting();
  }
}

std::size_t BoundedCache::expire_due(TimePoint at) {
  std::size_t removed = 0;
  while (!expiry_heap_.empty() && expiry_heap_.top().deadline <= at) {
    const auto key = expiry_heap_.top().key;
    const auto gen = expiry_heap_.top().generation;
    expiry_heap_.pop();
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.seq != gen)
      continue;
    erase_internal(key, false, true);
    ++removed;
  }
  return removed;
}

std::size_t BoundedCache::evict_until(std::size_t target) {
  std::size_t evicted = 0;
  while (memory_used_ > target && !lru_.empty()) {
    const std::string victim = lru_.begin()->second;
    erase_internal(victim, true, false);
    ++evicted;
  }
  return evicted;
}

void BoundedCache::rebuild_accounting() {
  std::size_t total = 0;
  for (const auto &[k, e] : entries_)
    total += e.size_bytes;
  memory_used_ = total;
}

void BoundedCache::touch(Entry &e, TimePoint at) {
  if (at <= e.last_access)
    return;
  auto node = lru_.extract(LruKey{e.last_access, e.seq});
  e.last_access = at;
  if (node.empty())
    return;
  node.key() = LruKey{e.last_access, e.seq};
  lru_.insert(std::move(node));
}

void BoundedCache::compact_expiry_index() {
  if (expiry_heap_.size() <= 2 * entries_.size() + 64)
    return;
  decltype(expiry_heap_) rebuilt;
  for (const auto &[k, e] : entries_)
    rebuilt.push({e.expires_at, k, e.seq});
  expiry_heap_ = std::move(rebuilt);
}

void BoundedCache::background_sweep() {
  sweep();
  StatsSink sink;
  {
    std::lock_guard<std::mutex> lock(sink_mu_);
    sink = sink_;
  }
  if (!sink)
    return;
  try {
    sink(stats());
  } catch (const std::exception &ex) {
    spdlog::warn("bounded_cache: stats sink failed: {}", ex.what());
  }
}

CacheStatistics BoundedCache::snapshot_locked() const {
  CacheStatistics s = stats_;
  s.entry_count = entries_.size();
  s.size_bytes = memory_used_;
  return s;
}

} // namespace bounded_cache
