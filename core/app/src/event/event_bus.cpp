#include "copier/eventbus/event_bus.hpp"

namespace copier {

void EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  subscribers_.push_back(std::move(callback));
}

// -----------------------------------------------------------------------------
// publish(event)
// -----------------------------------------------------------------------------
// Snapshot the subscribers under the lock, invoke outside it. A subscriber
// added during this call does not see the current event.
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  std::vector<GenericCallback> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = subscribers_;
  }

  for (const auto& callback : snapshot) {
    callback(event);
  }
}

}  // namespace copier
