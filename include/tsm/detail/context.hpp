#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace tsm {

using Clock = std::chrono::steady_clock;

// Execution context handed to guards and hooks. The engine forwards it
// unchanged and never looks at it; cancellation and deadline are for the
// caller's own code.
struct Context {
  Context() = default;
  explicit Context(Clock::time_point deadline) : deadline_(deadline) {}
  ~Context() = default;

  // Not movable: waiters hold references to the mutex/condition variable.
  Context(Context&&) = delete;
  Context& operator=(Context&&) = delete;
  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  void cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_.store(true, std::memory_order_release);
    cv_.notify_all();
  }

  bool is_cancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

  // Blocks until cancel() is called.
  void wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock,
             [this] { return cancelled_.load(std::memory_order_acquire); });
  }

  // Blocks until cancel() or the deadline, whichever comes first. Returns
  // true when cancelled.
  bool wait_until_deadline() {
    std::unique_lock<std::mutex> lock(mutex_);
    auto cancelled = [this] {
      return cancelled_.load(std::memory_order_acquire);
    };
    if (!deadline_) {
      cv_.wait(lock, cancelled);
      return true;
    }
    return cv_.wait_until(lock, *deadline_, cancelled);
  }

  void reset() { cancelled_.store(false, std::memory_order_release); }

  const std::optional<Clock::time_point>& deadline() const {
    return deadline_;
  }

  bool expired() const { return deadline_ && Clock::now() >= *deadline_; }

  // Cancelled or past the deadline.
  bool done() const { return is_cancelled() || expired(); }

 private:
  std::atomic_bool cancelled_{false};
  std::optional<Clock::time_point> deadline_;
  std::condition_variable cv_;
  std::mutex mutex_;
};

}  // namespace tsm
