#pragma once

#include "copier/events/event.hpp"

#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace copier {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Synchronous publish-subscribe channel for one worker. The
// classifier stage publishes CopyDecisions here, the dispatch stage consumes
// them and publishes DispatchReportEvents, and the engine listens for the
// reports.
//
// Stages are wired once when the pool is built and stay for the life of the
// worker; there is no unsubscribe.
//
// Thread model: subscribe/publish are safe from any thread. Callbacks run on
// the publishing thread before publish() returns. The subscriber list is
// copied under the lock and invoked without it, so a callback may publish
// re-entrantly.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Callback for every event regardless of alternative.
  void subscribe(GenericCallback callback);

  // Callback only for events holding EventType.
  template <typename EventType>
  void subscribe(std::function<void(const EventType&)> callback);

  void publish(const Event& event);

 private:
  std::mutex mutex_;  // Protects subscribers_
  std::vector<GenericCallback> subscribers_;
};

template <typename EventType>
void EventBus::subscribe(std::function<void(const EventType&)> callback) {
  subscribe(GenericCallback{[cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  }});
}

}  // namespace copier
