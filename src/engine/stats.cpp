#include "bounded_cache/stats.hpp"

#include <sstream>

namespace bounded_cache {

double CacheStatistics::hit_rate() const {
  const auto lookups = hits + misses;
  if (lookups == 0)
    return 0.0;
  return static_cast<double>(hits) / static_cast<double>(lookups);
}

double CacheStatistics::utilization() const {
  if (memory_limit_bytes == 0)
    return 0.0;
  return static_cast<double>(size_bytes) /
         static_cast<double>(memory_limit_bytes);
}

HealthReport evaluate_health(const CacheStatistics &s) {
  HealthReport r;
  if (s.hits + s.misses >= kMinLookupsForHitRate && s.hit_rate() < 0.5) {
    r.status = HealthStatus::Warning;
    r.issues.push_back("low hit rate");
  }
  if (s.utilization() > 0.9) {
    r.status = HealthStatus::Warning;
    r.issues.push_back("high memory utilization");
  }
  if (s.evictions > s.hits) {
    r.status = HealthStatus::Critical;
    r.issues.push_back("excessive evictions");
  }
  return r;
}

const char *to_string(HealthStatus status) {
  switch (status) {
  case HealthStatus::Healthy:
    return "healthy";
  case HealthStatus::Warning:
    return "warning";
  case HealthStatus::Critical:
    return "critical";
  }
  return "unknown";
}

std::string format_info(const CacheStatistics &s) {
  std::ostringstream os;
  os << "keys:" << s.entry_count << "\n";
  os << "memory_used_bytes:" << s.size_bytes << "\n";
  os << "memory_limit_bytes:" << s.memory_limit_bytes << "\n";
  os << "hits:" << s.hits << "\n";
  os << "misses:" << s.misses << "\n";
  os << "hit_rate:" << s.hit_rate() << "\n";
  os << "insertions:" << s.insertions << "\n";
  os << "evictions:" << s.evictions << "\n";
  os << "expirations:" << s.expirations << "\n";
  os << "health:" << to_string(evaluate_health(s).status) << "\n";
  return os.str();
}

std::string format_json(const CacheStatistics &s) {
  std::ostringstream os;
  os << "{\"hits\":" << s.hits << ",\"misses\":" << s.misses
     << ",\"hit_rate\":" << s.hit_rate() << ",\"insertions\":" << s.insertions
     << ",\"evictions\":" << s.evictions
     << ",\"expirations\":" << s.expirations
     << ",\"entry_count\":" << s.entry_count
     << ",\"size_bytes\":" << s.size_bytes
     << ",\"memory_limit_bytes\":" << s.memory_limit_bytes << "}";
  return os.str();
}

} // namespace bounded_cache
