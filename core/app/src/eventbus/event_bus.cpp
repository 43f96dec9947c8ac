#include "park/eventbus/event_bus.hpp"

#include <exception>
#include <iostream>

namespace park {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  const SubscriptionId id = next_id_++;
  subscribers_.emplace(id, std::move(callback));
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(id);
}

// -----------------------------------------------------------------------------
// publish(event): dispatch on a snapshot, outside the lock
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  Subscribers snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot = subscribers_;
  }

  for (const auto& entry : snapshot) {
    try {
      entry.second(event);
    } catch (const std::exception& e) {
      std::cerr << "[EventBus] Subscriber " << entry.first
                << " failed on event index " << event.index() << ": "
                << e.what() << "\n";
    }
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace park
