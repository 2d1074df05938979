#include "copier/concurrent/token_bucket.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace copier {

TokenBucket::TokenBucket(std::string name, std::size_t capacity,
                         std::chrono::milliseconds window)
    : name_(std::move(name)),
      capacity_(std::max<std::size_t>(capacity, 1)),
      window_(window) {}

// -----------------------------------------------------------------------------
// acquire(): wait for our turn, then for a free token
// -----------------------------------------------------------------------------
bool TokenBucket::acquire() {
  std::unique_lock lock(mutex_);
  const std::uint64_t ticket = next_ticket_++;

  cv_.wait(lock, [&] { return cancelled_ || serving_ == ticket; });
  if (cancelled_) {
    return false;
  }

  bool waited = false;
  for (;;) {
    const auto now = Clock::now();
    expire(now);
    if (issued_.size() < capacity_) {
      issued_.push_back(now);
      break;
    }
    if (!waited) {
      waited = true;
      delayed_count_.fetch_add(1);
    }
    // The oldest outstanding token comes back one window after issue.
    const auto refill_at = issued_.front() + window_;
    cv_.wait_until(lock, refill_at, [this] { return cancelled_; });
    if (cancelled_) {
      return false;
    }
  }

  ++serving_;
  lock.unlock();
  cv_.notify_all();
  return true;
}

void TokenBucket::cancel() {
  {
    std::lock_guard lock(mutex_);
    if (cancelled_) {
      return;
    }
    cancelled_ = true;
  }
  cv_.notify_all();
  std::cout << "[RateLimit:" << name_ << "] cancelled; delayed requests="
            << delayed_count_.load() << "\n";
}

void TokenBucket::expire(Clock::time_point now) {
  while (!issued_.empty() && now - issued_.front() >= window_) {
    issued_.pop_front();
  }
}

}  // namespace copier
