#pragma once

#include "park/domain/parking_space.hpp"
#include "park/domain/vehicle_type.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace park {

// Per-space deviation from the lot defaults.
struct SpaceOverride {
  domain::SpaceId id;
  std::optional<double> hourly_rate;
  std::optional<domain::VehicleType> vehicle_restriction;
};

// Rectangular lot provisioned row-major as P001, P002, ...
struct LotLayout {
  int rows{5};
  int columns{10};
  double default_hourly_rate{5.0};
  std::vector<SpaceOverride> overrides;
};

// -----------------------------------------------------------------------------
// SpaceRegistry: static catalog of parking spaces
// -----------------------------------------------------------------------------
//
// @brief  Immutable set of ParkingSpace records, fixed at construction.
//
// @details
// Every other component validates space ids against this catalog. Because
// the catalog never changes after construction, all accessors are const and
// need no locking.
//
// Ordering: spaces() returns spaces sorted by id. With the generated
// P001..Pnnn ids this is also row-major grid order.
//
// Thread model:
//   Immutable after construction, safe to read from any thread.
//
// Ownership:
//   Owned by ParkingEngine via std::unique_ptr; the stores, the availability
//   index and the booking engine hold const references.
// -----------------------------------------------------------------------------
class SpaceRegistry {
 public:
  // -------------------------------------------------------------------------
  // SpaceRegistry(layout)
  // -------------------------------------------------------------------------
  // @brief  Provisions rows * columns spaces named P001.. in row-major order
  //         at the default rate, then applies overrides.
  //
  // @throws InvalidSpaceError  If an override names a space that is not in
  //                            the generated grid.
  // @throws std::invalid_argument  If rows/columns are not positive or a
  //                                rate is negative.
  // -------------------------------------------------------------------------
  explicit SpaceRegistry(const LotLayout& layout);

  // Explicit catalog (tests, non-grid lots). Ids must be unique.
  explicit SpaceRegistry(std::vector<domain::ParkingSpace> spaces);

  SpaceRegistry(const SpaceRegistry&) = delete;
  SpaceRegistry& operator=(const SpaceRegistry&) = delete;

  // nullptr if unknown.
  const domain::ParkingSpace* find(const domain::SpaceId& id) const;

  // @throws InvalidSpaceError if unknown.
  const domain::ParkingSpace& at(const domain::SpaceId& id) const;

  bool contains(const domain::SpaceId& id) const;

  const std::vector<domain::ParkingSpace>& spaces() const { return spaces_; }

  std::vector<domain::SpaceId> ids() const;

  std::size_t size() const { return spaces_.size(); }

  // "P" + zero-padded 1-based index, e.g. spaceIdFor(7) == "P007".
  static domain::SpaceId spaceIdFor(int index);

 private:
  void buildIndex();

  std::vector<domain::ParkingSpace> spaces_;  // Sorted by id
  std::unordered_map<domain::SpaceId, std::size_t> index_;
};

}  // namespace park
