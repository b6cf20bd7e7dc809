#include "bounded_cache/sweeper.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace bounded_cache {

Sweeper::Sweeper(Millis interval, std::function<void()> task)
    : interval_(interval), task_(std::move(task)) {}

Sweeper::~Sweeper() { stop(); }

void Sweeper::start() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
  std::lock_guard<std::mutex> lock(mu_);
  if (running_)
    return;
  stop_requested_ = false;
  running_ = true;
  thread_ = std::thread([this] { run(); });
  spdlog::debug("sweeper: started, interval {}ms", interval_.count());
}

void Sweeper::stop() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!running_)
      return;
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
  std::lock_guard<std::mutex> lock(mu_);
  running_ = false;
}

bool Sweeper::running() const {
  std::lock_guard<std::mutex> lock(mu_);
  return running_;
}

std::uint64_t Sweeper::runs() const {
  std::lock_guard<std::mutex> lock(mu_);
  return runs_;
}

void Sweeper::run() {
  std::unique_lock<std::mutex> lock(mu_);
  while (!stop_requested_) {
    if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; }))
      break;
    lock.unlock();
    try {
      task_();
    } catch (const std::exception &ex) {
      spdlog::error("sweeper: task failed: {}", ex.what());
    }
    lock.lock();
    ++runs_;
  }
}

} // namespace bounded_cache
