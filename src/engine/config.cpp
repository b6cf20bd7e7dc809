#include "bounded_cache/config.hpp"
#include "bounded_cache/size_estimator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace bounded_cache {
namespace {
enum class Field { Absent, Found, Invalid };

bool parse_u64(const std::string &s, std::uint64_t &out) {
  try {
    out = static_cast<std::uint64_t>(std::stoull(s));
    return true;
  } catch (const std::out_of_range &) {
    return false;
  } catch (const std::invalid_argument &) {
    return false;
  }
}
bool parse_double(const std::string &s, double &out) {
  try {
    out = std::stod(s);
    return true;
  } catch (const std::out_of_range &) {
    return false;
  } catch (const std::invalid_argument &) {
    return false;
  }
}

Field extract_double(const std::string &text, const std::string &key,
                     double &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(-?[0-9]+(?:\\.[0-9]+)?)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return Field::Absent;
  return parse_double(m[1].str(), out) ? Field::Found : Field::Invalid;
}
Field extract_u64(const std::string &text, const std::string &key,
                  std::uint64_t &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return Field::Absent;
  return parse_u64(m[1].str(), out) ? Field::Found : Field::Invalid;
}
bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}
bool extract_bool(const std::string &text, const std::string &key,
                  bool &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*(true|false)");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str() == "true";
  return true;
}
// Flat {"name": millis, ...} object nested under `key`. Values are capped at
// kMaxTtl.
Field extract_ttl_table(const std::string &text, const std::string &key,
                        std::unordered_map<std::string, Millis> &out) {
  std::regex block("\"" + key + "\"\\s*:\\s*\\{([^}]*)\\}");
  std::smatch m;
  if (!std::regex_search(text, m, block))
    return Field::Absent;
  const std::string body = m[1].str();
  std::regex item("\"([^\"]*)\"\\s*:\\s*([0-9]+)");
  std::unordered_map<std::string, Millis> parsed;
  for (auto it = std::sregex_iterator(body.begin(), body.end(), item);
       it != std::sregex_iterator(); ++it) {
    std::uint64_t ms = 0;
    if (!parse_u64((*it)[2].str(), ms))
      return Field::Invalid;
    ms = std::min<std::uint64_t>(ms, kMaxTtl.count());
    parsed[(*it)[1].str()] = Millis(static_cast<Millis::rep>(ms));
  }
  for (auto &[name, ttl] : parsed)
    out[name] = ttl;
  return Field::Found;
}
} // namespace

bool CacheConfig::validate(std::string *err) const {
  auto fail = [err](const std::string &msg) {
    if (err)
      *err = msg;
    return false;
  };
  if (memory_limit_bytes == 0)
    return fail("memory_limit_bytes must be positive");
  if (default_ttl.count() <= 0)
    return fail("default_ttl must be positive");
  if (default_ttl > kMaxTtl)
    return fail("default_ttl exceeds one year");
  for (const auto &[name, ttl] : category_ttls) {
    if (name.empty())
      return fail("category name must not be empty");
    if (ttl.count() <= 0)
      return fail("ttl for category '" + name + "' must be positive");
    if (ttl > kMaxTtl)
      return fail("ttl for category '" + name + "' exceeds one year");
  }
  if (sweep_interval.has_value() && sweep_interval->count() <= 0)
    return fail("sweep_interval must be positive");
  if (sweep_interval.has_value() && *sweep_interval > kMaxSweepInterval)
    return fail("sweep_interval exceeds five minutes");
  if (!(soft_threshold_ratio > 0.0 && soft_threshold_ratio <= 1.0))
    return fail("soft_threshold_ratio must be in (0, 1]");
  if (!make_estimator_by_name(estimator))
    return fail("unknown size estimator '" + estimator + "'");
  return true;
}

Millis CacheConfig::ttl_for(const std::string &category) const {
  auto it = category_ttls.find(category);
  if (it == category_ttls.end())
    return default_ttl;
  return it->second;
}

Millis CacheConfig::resolved_sweep_interval() const {
  if (sweep_interval.has_value())
    return *sweep_interval;
  Millis smallest = default_ttl;
  for (const auto &[name, ttl] : category_ttls)
    smallest = std::min(smallest, ttl);
  return std::clamp(smallest, kMinSweepInterval, kMaxSweepInterval);
}

std::size_t CacheConfig::soft_limit_bytes() const {
  return static_cast<std::size_t>(static_cast<double>(memory_limit_bytes) *
                                  soft_threshold_ratio);
}

CacheConfig default_config() {
  CacheConfig cfg;
  cfg.default_ttl = Millis(5 * 60 * 1000);
  cfg.category_ttls["kpis"] = Millis(5 * 60 * 1000);
  cfg.category_ttls["charts"] = Millis(10 * 60 * 1000);
  cfg.category_ttls["fleet"] = Millis(30 * 60 * 1000);
  cfg.category_ttls["inspections"] = Millis(5 * 60 * 1000);
  cfg.category_ttls["ports"] = Millis(60 * 60 * 1000);
  return cfg;
}

bool load_config_file(const std::string &path, CacheConfig &out,
                      std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found";
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  const std::string text = ss.str();
  auto reject = [&](const std::string &msg) {
    if (err)
      *err = msg;
    spdlog::warn("bounded_cache: rejected config {}: {}", path, msg);
    return false;
  };

  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos)
    return reject("invalid schema");

  CacheConfig cfg = out;
  double d;
  std::uint64_t u;
  std::string s;
  bool b;
  switch (extract_u64(text, "memory_limit_bytes", u)) {
  case Field::Invalid:
    return reject("invalid value for memory_limit_bytes");
  case Field::Found:
    cfg.memory_limit_bytes = static_cast<std::size_t>(
        std::min<std::uint64_t>(u, 1ULL << 40));
    break;
  case Field::Absent:
    break;
  }
  switch (extract_u64(text, "default_ttl_ms", u)) {
  case Field::Invalid:
    return reject("invalid value for default_ttl_ms");
  case Field::Found:
    cfg.default_ttl = Millis(static_cast<Millis::rep>(
        std::min<std::uint64_t>(u, kMaxTtl.count())));
    break;
  case Field::Absent:
    break;
  }
  switch (extract_u64(text, "sweep_interval_ms", u)) {
  case Field::Invalid:
    return reject("invalid value for sweep_interval_ms");
  case Field::Found:
    cfg.sweep_interval = Millis(static_cast<Millis::rep>(
        std::min<std::uint64_t>(u, kMaxSweepInterval.count())));
    break;
  case Field::Absent:
    break;
  }
  switch (extract_double(text, "soft_threshold_ratio", d)) {
  case Field::Invalid:
    return reject("invalid value for soft_threshold_ratio");
  case Field::Found:
    cfg.soft_threshold_ratio = std::clamp(d, 0.1, 1.0);
    break;
  case Field::Absent:
    break;
  }
  if (extract_bool(text, "sweep_enabled", b))
    cfg.sweep_enabled = b;
  if (extract_string(text, "estimator", s))
    cfg.estimator = s;
  if (extract_ttl_table(text, "category_ttl_ms", cfg.category_ttls) ==
      Field::Invalid)
    return reject("invalid value for category_ttl_ms");

  std::string verr;
  if (!cfg.validate(&verr))
    return reject(verr);
  out = std::move(cfg);
  return true;
}

} // namespace bounded_cache
