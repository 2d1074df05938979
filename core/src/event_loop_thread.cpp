#include "copier/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <utility>

namespace copier {

namespace {

// Idle wait between queue checks. Bounds how long stop() takes on an idle
// loop without spinning.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

// Join before the queue and bus are destroyed.
EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::requestStop() {
  running_.store(false);
  stop_cv_.notify_all();
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }

  requestStop();

  // No lock held here; the worker may need stop_mutex_ to leave wait_for().
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
// running_ is checked before every pop, so once stop() is called no further
// event is started; the remainder is left for takePending().
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.try_pop();

    if (event) {
      bus_.publish(*event);
      continue;
    }

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kIdleWaitTimeout,
                      [this] { return !running_.load(); });
  }
}

}  // namespace copier
