#include "bounded_cache/cache.hpp"
#include "manual_clock.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace bounded_cache;
using bounded_cache::testing::ManualClock;
using bounded_cache::testing::manual_config;

namespace {
CacheConfig short_ttl_config() {
  auto cfg = manual_config(1024 * 1024);
  cfg.category_ttls["short"] = Millis(100);
  cfg.category_ttls["long"] = Millis(10000);
  cfg.default_ttl = Millis(1000);
  return cfg;
}
} // namespace

TEST_CASE("short category expires lazily on read", "[ttl][lazy]") {
  ManualClock clock;
  BoundedCache c(short_ttl_config(), nullptr, clock.source());
  c.set("x", Value{'v'}, "short");

  clock.advance(Millis(50));
  REQUIRE(c.get("x").has_value());
  REQUIRE(c.stats().entry_count == 1);

  clock.advance(Millis(100));
  CHECK_FALSE(c.get("x").has_value());
  const auto s = c.stats();
  CHECK(s.entry_count == 0);
  CHECK(s.size_bytes == 0);
  CHECK(s.expirations == 1);
  CHECK(s.hits == 1);
  CHECK(s.misses == 1);
}

TEST_CASE("expiry boundary is exclusive", "[ttl][boundary]") {
  ManualClock clock;
  BoundedCache c(short_ttl_config(), nullptr, clock.source());
  c.set("x", Value{'v'}, "short");
  clock.advance(Millis(99));
  CHECK(c.get("x").has_value());
  clock.advance(Millis(1));
  CHECK_FALSE(c.get("x").has_value());
}

TEST_CASE("reads do not extend the lifetime", "[ttl][boundary]") {
  ManualClock clock;
  BoundedCache c(short_ttl_config(), nullptr, clock.source());
  c.set("x", Value{'v'}, "short");
  for (int i = 0; i < 9; ++i) {
    clock.advance(Millis(10));
    REQUIRE(c.get("x").has_value());
  }
  clock.advance(Millis(10));
  CHECK_FALSE(c.get("x").has_value());
}

TEST_CASE("unknown categories use the default ttl", "[ttl][category]") {
  ManualClock clock;
  BoundedCache c(short_ttl_config(), nullptr, clock.source());
  c.set("a", Value{'v'}, "nonexistent");
  c.set("b", Value{'v'}, "");
  c.set("c", Value{'v'}, "long");
  clock.advance(Millis(999));
  CHECK(c.get("a").has_value());
  CHECK(c.get("b").has_value());
  clock.advance(Millis(1));
  CHECK_FALSE(c.get("a").has_value());
  CHECK_FALSE(c.get("b").has_value());
  CHECK(c.get("c").has_value());
}

TEST_CASE("replacing an entry restarts its ttl", "[ttl][replace]") {
  ManualClock clock;
  BoundedCache c(short_ttl_config(), nullptr, clock.source());
  c.set("x", Value{'1'}, "short");
  clock.advance(Millis(80));
  c.set("x", Value{'2'}, "short");
  clock.advance(Millis(50));
  auto v = c.get("x");
  REQUIRE(v.has_value());
  CHECK(*v == Value{'2'});

  // The first version's expiry is stale and must not remove the second.
  CHECK(c.sweep() == 0);
  CHECK(c.stats().entry_count == 1);

  clock.advance(Millis(50));
  CHECK(c.sweep() == 1);
  CHECK(c.stats().entry_count == 0);
}

TEST_CASE("sweep removes every expired entry", "[ttl][sweep]") {
  ManualClock clock;
  BoundedCache c(short_ttl_config(), nullptr, clock.source());
  c.set("s1", Value(10, 0), "short");
  c.set("s2", Value(10, 0), "short");
  c.set("s3", Value(10, 0), "short");
  c.set("keep", Value(10, 0), "long");
  clock.advance(Millis(100));

  CHECK(c.sweep() == 3);
  const auto s = c.stats();
  CHECK(s.entry_count == 1);
  CHECK(s.size_bytes == 10);
  CHECK(s.expirations == 3);
  CHECK(s.misses == 0);
  CHECK(c.sweep() == 0);
}

TEST_CASE("expiry index survives heavy key churn", "[ttl][sweep]") {
  ManualClock clock;
  BoundedCache c(short_ttl_config(), nullptr, clock.source());
  for (int round = 0; round < 50; ++round)
    for (int k = 0; k < 20; ++k)
      c.set("k" + std::to_string(k), Value(4, 0), "long");
  c.sweep();
  CHECK(c.stats().entry_count == 20);

  clock.advance(Millis(10000));
  CHECK(c.sweep() == 20);
  CHECK(c.stats().entry_count == 0);
}
