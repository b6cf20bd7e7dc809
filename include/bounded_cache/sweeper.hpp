#pragma once

#include "bounded_cache/types.hpp"

#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace bounded_cache {

// Runs a task on a dedicated thread every `interval` until stopped. The
// task is invoked without any of the sweeper's locks held.
class Sweeper {
public:
  Sweeper(Millis interval, std::function<void()> task);
  ~Sweeper();

  Sweeper(const Sweeper &) = delete;
  Sweeper &operator=(const Sweeper &) = delete;

  void start();
  void stop();
  bool running() const;
  Millis interval() const { return interval_; }
  std::uint64_t runs() const;

private:
  void run();

  Millis interval_;
  std::function<void()> task_;
  std::thread thread_;
  std::mutex lifecycle_mu_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool stop_requested_{false};
  bool running_{false};
  std::uint64_t runs_{0};
};

} // namespace bounded_cache
