#include "bounded_cache/cache.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>

using namespace bounded_cache;

int main() {
  spdlog::set_level(spdlog::level::warn);
  const std::vector<std::string> presets = {"hotset", "uniform", "writeheavy",
                                            "loader"};
  const std::vector<std::size_t> budgets = {16 * 1024, 64 * 1024,
                                            256 * 1024};

  for (const auto &preset : presets) {
    std::cout << "workload=" << preset << "\n";
    for (const auto budget : budgets) {
      CacheConfig cfg = default_config();
      cfg.memory_limit_bytes = budget;
      cfg.sweep_enabled = false;
      BoundedCache cache(cfg);
      std::mt19937_64 rng(42);
      std::uniform_int_distribution<int> u(0, 999);
      const int ops = 10000;
      auto start = std::chrono::steady_clock::now();
      int hits = 0;
      std::vector<double> lat;
      lat.reserve(ops);
      for (int i = 0; i < ops; ++i) {
        auto t0 = std::chrono::steady_clock::now();
        int k = u(rng);
        if (preset == "hotset")
          k = static_cast<int>(std::pow((u(rng) % 100) + 1, 1.4));
        std::string key = "k" + std::to_string(k % 1000);
        if (preset == "loader") {
          bool loaded = false;
          cache.get_or_load(key, "charts", [&] {
            loaded = true;
            return Value(64, static_cast<std::uint8_t>(i % 255));
          });
          if (!loaded)
            ++hits;
        } else {
          const bool do_write =
              preset == "writeheavy" ? (i % 2 == 0) : (i % 5 == 0);
          if (do_write)
            cache.set(key, Value(64, static_cast<std::uint8_t>(i % 255)),
                      "kpis");
          else if (cache.get(key).has_value())
            ++hits;
        }
        auto t1 = std::chrono::steady_clock::now();
        lat.push_back(
            std::chrono::duration<double, std::micro>(t1 - t0).count());
      }
      auto end = std::chrono::steady_clock::now();
      std::sort(lat.begin(), lat.end());
      auto pct = [&](double p) {
        return lat[static_cast<std::size_t>(p * (lat.size() - 1))];
      };
      double seconds = std::chrono::duration<double>(end - start).count();
      const auto s = cache.stats();
      std::cout << "budget=" << budget << " ops/s=" << std::fixed
                << std::setprecision(2) << (ops / seconds)
                << " p50_us=" << pct(0.50) << " p95_us=" << pct(0.95)
                << " p99_us=" << pct(0.99)
                << " hit_rate=" << (static_cast<double>(hits) / ops)
                << " evictions=" << s.evictions
                << " memory_used=" << s.size_bytes << "\n";
    }
  }
  return 0;
}
