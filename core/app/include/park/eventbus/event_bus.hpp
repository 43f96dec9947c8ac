#pragma once

#include "park/events/event.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <utility>

namespace park {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
// Responsibility: Publish-subscribe channel for engine notifications.
// Subscribers register callbacks; publish() invokes each of them with the
// event.
//
// Thread model: subscribe, unsubscribe and publish are safe from any thread.
// Callbacks run synchronously on the publishing thread, which in the engine
// is always the notification EventLoopThread. A callback that throws is
// logged and skipped; it does not stop delivery to the others.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Callback receives every event.
  SubscriptionId subscribe(GenericCallback callback);

  // Callback receives only events holding EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // A publish() already in progress may still call the removed callback.
  void unsubscribe(SubscriptionId id);

  // -------------------------------------------------------------------------
  // publish(event)
  // -------------------------------------------------------------------------
  // Copies the subscriber list under the lock, then invokes the callbacks
  // with the lock released so a callback may subscribe, unsubscribe or
  // publish without deadlocking.
  // -------------------------------------------------------------------------
  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  // Ordered by id, so callbacks run in subscription order.
  using Subscribers = std::map<SubscriptionId, GenericCallback>;

  mutable std::mutex mutex_;  // Protects subscribers_ and next_id_
  SubscriptionId next_id_{0};
  Subscribers subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return subscribe(std::move(wrapped));
}

}  // namespace park
