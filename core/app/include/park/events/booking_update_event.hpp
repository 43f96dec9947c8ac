#pragma once

#include "park/domain/booking.hpp"
#include "park/domain/booking_status.hpp"
#include "park/events/event_types.hpp"

#include <optional>

namespace park {

// -----------------------------------------------------------------------------
// BookingUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Published whenever a booking changes lifecycle stage. Carries a
//         copy of the booking after the change and the stage it left.
//
// @details
// previous_stage is empty for the hold that created the booking. The copy
// is taken under the ledger lock, so it is a consistent view even if the
// booking moves on before a subscriber sees the event.
// -----------------------------------------------------------------------------
struct BookingUpdateEvent {
  domain::Booking booking;
  std::optional<domain::BookingStage> previous_stage;
  Timestamp timestamp{};
};

}  // namespace park
