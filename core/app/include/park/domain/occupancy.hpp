#pragma once

#include "park/domain/parking_space.hpp"
#include "park/domain/vehicle_type.hpp"
#include "park/events/event_types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace park {
namespace domain {

// -----------------------------------------------------------------------------
// OccupancyEventType
// -----------------------------------------------------------------------------
// Enter/Exit come from booking check-in/out. DetectedOccupied/DetectedEmpty
// come from the external detector. Enter and DetectedOccupied mark the stall
// occupied; Exit and DetectedEmpty mark it free.
// -----------------------------------------------------------------------------
enum class OccupancyEventType {
  Enter,
  Exit,
  DetectedOccupied,
  DetectedEmpty,
};

inline bool marksOccupied(OccupancyEventType type) {
  return type == OccupancyEventType::Enter ||
         type == OccupancyEventType::DetectedOccupied;
}

inline const char* toString(OccupancyEventType type) {
  switch (type) {
    case OccupancyEventType::Enter:            return "enter";
    case OccupancyEventType::Exit:             return "exit";
    case OccupancyEventType::DetectedOccupied: return "detected_occupied";
    case OccupancyEventType::DetectedEmpty:    return "detected_empty";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// OccupancyEvent
// -----------------------------------------------------------------------------
// Responsibility: One timestamped observation or action that changes (or
// re-asserts) the physical state of a stall.
//
// @details
// Append-only. Once OccupancyStore has accepted an event, the copy in the log
// is never modified. sequence_id is assigned by the store at append time and
// gives the total order of the log; callers leave it at 0.
//
// confidence is only meaningful for detector events (1.0 for check-in/out
// and manual updates).
// -----------------------------------------------------------------------------
struct OccupancyEvent {
  SpaceId space_id;
  OccupancyEventType type{OccupancyEventType::DetectedEmpty};
  Timestamp timestamp{};
  std::optional<VehicleType> vehicle_type;
  double confidence{1.0};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// OccupancySnapshot
// -----------------------------------------------------------------------------
// Latest fold of the event log for one stall. is_occupied always equals the
// effect of the most recent accepted event for space_id; a stall with no
// events yet is free and has last_updated == Timestamp{}.
// -----------------------------------------------------------------------------
struct OccupancySnapshot {
  SpaceId space_id;
  bool is_occupied{false};
  Timestamp last_updated{};
  std::optional<VehicleType> vehicle_type;
};

// -----------------------------------------------------------------------------
// OccupancyCounts
// -----------------------------------------------------------------------------
// Aggregate view used by the status query. occupancy_rate is in [0,1].
// -----------------------------------------------------------------------------
struct OccupancyCounts {
  std::size_t total{0};
  std::size_t occupied{0};
  std::size_t available{0};

  double occupancyRate() const {
    return total == 0 ? 0.0
                      : static_cast<double>(occupied) /
                            static_cast<double>(total);
  }
};

// -----------------------------------------------------------------------------
// OccupancyBucket
// -----------------------------------------------------------------------------
// Occupancy over one fixed window [window_start, window_end), reporting the
// state at the end of the window. occupied_count + available_count equals the
// number of spaces in the registry. Produced by HistoryAggregator.
// -----------------------------------------------------------------------------
struct OccupancyBucket {
  Timestamp window_start{};
  Timestamp window_end{};
  std::size_t occupied_count{0};
  std::size_t available_count{0};

  double occupancyRate() const {
    const std::size_t total = occupied_count + available_count;
    return total == 0 ? 0.0
                      : static_cast<double>(occupied_count) /
                            static_cast<double>(total);
  }
};

// -----------------------------------------------------------------------------
// ForecastPoint
// -----------------------------------------------------------------------------
// One forecast step. predicted_occupancy_rate is clamped to [0,1] by every
// IForecaster implementation. Derived on demand, never persisted.
// -----------------------------------------------------------------------------
struct ForecastPoint {
  Timestamp timestamp{};
  double predicted_occupancy_rate{0.0};
};

}  // namespace domain
}  // namespace park
