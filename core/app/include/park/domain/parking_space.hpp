#pragma once

#include "park/domain/vehicle_type.hpp"

#include <optional>
#include <string>

namespace park {
namespace domain {

// -----------------------------------------------------------------------------
// SpaceId
// -----------------------------------------------------------------------------
// Human-readable stall identifier ("P001", "P002", ...). A plain alias keeps
// signatures self-documenting without a wrapper type.
// -----------------------------------------------------------------------------
using SpaceId = std::string;

// -----------------------------------------------------------------------------
// ParkingSpace
// -----------------------------------------------------------------------------
// Responsibility: Static descriptor of one physical stall.
//
// @details
// Created when the SpaceRegistry is provisioned and never mutated at runtime.
// Copies handed out by the registry or by AvailabilityIndex::search() are
// plain values, safe to move between threads.
//
// vehicle_restriction empty means "any vehicle".
// -----------------------------------------------------------------------------
struct ParkingSpace {
  SpaceId id;
  int row{0};
  int column{0};
  double hourly_rate{0.0};
  std::optional<VehicleType> vehicle_restriction;

  // True if a vehicle of the given type may use this stall.
  bool accepts(VehicleType type) const {
    return !vehicle_restriction || *vehicle_restriction == type;
  }
};

}  // namespace domain
}  // namespace park
