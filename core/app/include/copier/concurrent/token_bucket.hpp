#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

namespace copier {

// -----------------------------------------------------------------------------
// TokenBucket
// -----------------------------------------------------------------------------
//
// @brief  Blocking rate limiter: at most `capacity` acquisitions within any
//         rolling `window`.
//
// @details
// The bucket holds `capacity` tokens. Every token taken is refilled exactly
// one window after it was taken, so the guarantee holds for every rolling
// window, including the first second after an idle period.
//
// Callers over the limit are queued, not rejected. Waiters are served in
// arrival order (ticket based), so requests issued by one worker keep their
// submission order. cancel() releases all waiters with false; used at
// shutdown.
//
// Thread model: All methods are thread-safe.
// -----------------------------------------------------------------------------
class TokenBucket {
 public:
  using Clock = std::chrono::steady_clock;

  TokenBucket(std::string name, std::size_t capacity,
              std::chrono::milliseconds window = std::chrono::seconds(1));

  TokenBucket(const TokenBucket&) = delete;
  TokenBucket& operator=(const TokenBucket&) = delete;

  // Blocks until a token is available. Returns false only if cancelled.
  bool acquire();

  // Releases every waiter with false; later acquire() calls fail at once.
  void cancel();

  std::size_t capacity() const { return capacity_; }
  std::chrono::milliseconds window() const { return window_; }

  // Number of acquire() calls that had to wait.
  std::uint64_t delayedCount() const { return delayed_count_.load(); }

 private:
  // Drops issue times older than one window. Caller holds mutex_.
  void expire(Clock::time_point now);

  std::string name_;
  const std::size_t capacity_;
  const std::chrono::milliseconds window_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Clock::time_point> issued_;  // Times of tokens still "out"
  std::uint64_t next_ticket_{0};
  std::uint64_t serving_{0};
  bool cancelled_{false};

  std::atomic<std::uint64_t> delayed_count_{0};
};

}  // namespace copier
