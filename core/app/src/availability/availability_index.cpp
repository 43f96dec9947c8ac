#include "park/availability/availability_index.hpp"

#include "park/common/errors.hpp"

namespace park {

namespace {

domain::TimeInterval checkedInterval(Timestamp start, Timestamp end) {
  domain::TimeInterval interval{start, end};
  if (!interval.valid()) {
    throw InvalidIntervalError("end_time must be after start_time");
  }
  return interval;
}

}  // namespace

AvailabilityIndex::AvailabilityIndex(const SpaceRegistry& registry,
                                     const OccupancyStore& store,
                                     const BookingLedger& ledger)
    : registry_(registry), store_(store), ledger_(ledger) {}

bool AvailabilityIndex::admits(
    const domain::ParkingSpace& space, const domain::TimeInterval& interval,
    const std::optional<domain::VehicleType>& vehicle_type) const {
  if (vehicle_type && !space.accepts(*vehicle_type)) {
    return false;
  }
  if (store_.currentSnapshot(space.id).is_occupied) {
    return false;
  }
  return !ledger_.findOverlap(space.id, interval).has_value();
}

std::vector<domain::ParkingSpace> AvailabilityIndex::search(
    Timestamp start, Timestamp end,
    const std::optional<domain::VehicleType>& vehicle_type) const {
  const domain::TimeInterval interval = checkedInterval(start, end);

  std::vector<domain::ParkingSpace> out;
  for (const auto& space : registry_.spaces()) {
    if (admits(space, interval, vehicle_type)) {
      out.push_back(space);
    }
  }
  return out;
}

bool AvailabilityIndex::isAvailable(
    const domain::SpaceId& space_id, Timestamp start, Timestamp end,
    const std::optional<domain::VehicleType>& vehicle_type) const {
  const domain::TimeInterval interval = checkedInterval(start, end);
  return admits(registry_.at(space_id), interval, vehicle_type);
}

}  // namespace park
