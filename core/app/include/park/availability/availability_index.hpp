#pragma once

#include "park/booking/booking_ledger.hpp"
#include "park/domain/parking_space.hpp"
#include "park/domain/time_interval.hpp"
#include "park/domain/vehicle_type.hpp"
#include "park/occupancy/occupancy_store.hpp"
#include "park/registry/space_registry.hpp"

#include <optional>
#include <vector>

namespace park {

// -----------------------------------------------------------------------------
// AvailabilityIndex: which spaces can take a booking for an interval
// -----------------------------------------------------------------------------
//
// @brief  Joins the registry, live occupancy and the booking ledger.
//
// @details
// A space is available for [start, end) iff
//   1. its snapshot is not occupied at call time,
//   2. no pending/confirmed booking on it overlaps [start, end),
//   3. it accepts the requested vehicle type (when one is given).
//
// Condition 1 is a point-in-time read of a sensor and is advisory only: a
// search result is a hint for the customer, not a promise. The
// authoritative check is the ledger recheck inside BookingEngine::hold().
//
// Thread model: const, safe from any thread. Reads each space's occupancy
// lane and booking lane independently; holds no lock across spaces.
// -----------------------------------------------------------------------------
class AvailabilityIndex {
 public:
  AvailabilityIndex(const SpaceRegistry& registry, const OccupancyStore& store,
                    const BookingLedger& ledger);

  // -------------------------------------------------------------------------
  // search(start, end, vehicle_type)
  // -------------------------------------------------------------------------
  // @return Available spaces ordered by id.
  // @throws InvalidIntervalError if end <= start.
  // -------------------------------------------------------------------------
  std::vector<domain::ParkingSpace> search(
      Timestamp start, Timestamp end,
      const std::optional<domain::VehicleType>& vehicle_type =
          std::nullopt) const;

  // Same three conditions for one space.
  // @throws InvalidSpaceError, InvalidIntervalError
  bool isAvailable(const domain::SpaceId& space_id, Timestamp start,
                   Timestamp end,
                   const std::optional<domain::VehicleType>& vehicle_type =
                       std::nullopt) const;

 private:
  bool admits(const domain::ParkingSpace& space,
              const domain::TimeInterval& interval,
              const std::optional<domain::VehicleType>& vehicle_type) const;

  const SpaceRegistry& registry_;
  const OccupancyStore& store_;
  const BookingLedger& ledger_;
};

}  // namespace park
