#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace bounded_cache {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Millis = std::chrono::milliseconds;
using TimeSource = std::function<TimePoint()>;

using Value = std::vector<std::uint8_t>;

struct Entry {
  Value value;
  std::string category{"default"};
  std::size_t size_bytes{0};
  TimePoint expires_at{};
  TimePoint last_access{};
  std::uint64_t seq{0};
};

} // namespace bounded_cache
