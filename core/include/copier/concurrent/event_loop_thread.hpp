#pragma once

#include "copier/concurrent/thread_safe_queue.hpp"
#include "copier/eventbus/event_bus.hpp"
#include "copier/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace copier {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: One worker thread that drains a ThreadSafeQueue<Event> and
// publishes each event on its own EventBus. Every subscriber of the bus runs
// on this thread, so everything pushed into one loop is handled strictly in
// push order.
//
// The copier runs one loop per worker shard; all events for an instrument go
// to the same loop, which is what keeps OPEN -> ADJUST -> CLOSE causal for a
// position.
//
// Thread model: start(), stop() and push() may be called from any thread.
// Subscribers run on the loop thread only.
//
// Shutdown: stop() lets the event currently being handled finish, then
// exits. Anything still queued stays queued; takePending() hands it to the
// owner so it can be logged as dropped.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "EventLoop");

  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Idempotent.
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Signals the worker and joins it. Blocks for as long as the in-flight
  // handler takes; handlers are expected to bound their own waits.
  // Idempotent; start() may be called again afterwards.
  // -------------------------------------------------------------------------
  void stop();

  // Signals the worker without joining. No event is started after this
  // returns; the in-flight one may still be running. stop() joins.
  void requestStop();

  void push(Event event) { queue_.push(std::move(event)); }

  // -------------------------------------------------------------------------
  // takePending()
  // -------------------------------------------------------------------------
  // Removes and returns everything still queued. Meant to be called after
  // stop(); calling it on a running loop races with the worker.
  // -------------------------------------------------------------------------
  std::vector<Event> takePending() { return queue_.drain(); }

  std::size_t pendingCount() const { return queue_.size(); }

  bool running() const { return running_.load(); }

  const std::string& name() const { return name_; }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

 private:
  // Worker loop: try_pop and publish, otherwise wait briefly on stop_cv_.
  void run();

  std::string name_;

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::atomic<bool> running_{false};

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;  // Wakes an idle worker on stop()

  std::thread thread_;
};

}  // namespace copier
