#pragma once

#include "park/domain/occupancy.hpp"
#include "park/events/event_types.hpp"

namespace park {

// -----------------------------------------------------------------------------
// OccupancyUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Published after OccupancyStore accepted an event. Carries the event
//         as recorded (with its log sequence id) and the snapshot it produced.
//
// @details
// previous_occupied lets subscribers tell a real transition (free ->
// occupied) from a repeated observation of the same state.
//
// Thread model:
//   Pushed by whichever thread recorded the event; delivered on the
//   notification loop thread.
// -----------------------------------------------------------------------------
struct OccupancyUpdateEvent {
  domain::OccupancyEvent event;
  domain::OccupancySnapshot snapshot;
  bool previous_occupied{false};
  Timestamp timestamp{};
};

}  // namespace park
