#pragma once

#include "park/events/booking_update_event.hpp"
#include "park/events/event_types.hpp"
#include "park/events/occupancy_update_event.hpp"
#include "park/events/payment_update_event.hpp"

#include <functional>
#include <variant>

namespace park {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The envelope carried by the notification EventBus. One
// variant lets a single bus fan out every notification kind to the
// telemetry publisher and any other subscriber.
//
// Adding a kind means adding it here; std::visit call sites then fail to
// compile until they handle it.
// -----------------------------------------------------------------------------
using Event = std::variant<OccupancyUpdateEvent,
                           BookingUpdateEvent,
                           PaymentUpdateEvent,
                           HeartbeatEvent>;

// Where core components hand notifications; the engine binds it to the
// notification loop's push(). An empty sink drops notifications.
using EventSink = std::function<void(Event)>;

}  // namespace park
