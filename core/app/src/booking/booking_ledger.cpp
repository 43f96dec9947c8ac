#include "park/booking/booking_ledger.hpp"

#include "park/common/errors.hpp"

#include <stdexcept>

namespace park {

BookingLedger::BookingLedger(const SpaceRegistry& registry) {
  lanes_.reserve(registry.size());
  for (const auto& space : registry.spaces()) {
    lanes_.emplace(space.id, std::make_unique<Lane>());
  }
}

BookingLedger::Lane& BookingLedger::laneFor(
    const domain::SpaceId& space_id) const {
  auto it = lanes_.find(space_id);
  if (it == lanes_.end()) {
    throw InvalidSpaceError(space_id);
  }
  return *it->second;
}

// -----------------------------------------------------------------------------
// overlapLocked: predecessor-of-end lookup
// -----------------------------------------------------------------------------
const BookingLedger::HeldInterval* BookingLedger::overlapLocked(
    const Lane& lane, const domain::TimeInterval& interval) {
  // First entry starting at or after interval.end cannot overlap; the one
  // before it is the only candidate.
  auto it = lane.held.lower_bound(interval.end);
  if (it == lane.held.begin()) {
    return nullptr;
  }
  --it;
  return it->second.end > interval.start ? &it->second : nullptr;
}

// -----------------------------------------------------------------------------
// reserve(): recheck + insert as one critical section per space
// -----------------------------------------------------------------------------
void BookingLedger::reserve(const domain::Booking& booking) {
  if (!booking.interval.valid()) {
    throw std::invalid_argument("Booking interval is empty: " +
                                booking.reference);
  }
  if (!domain::holdsInterval(booking.status)) {
    throw std::invalid_argument("Booking " + booking.reference +
                                " does not hold its interval");
  }

  Lane& lane = laneFor(booking.space_id);
  std::lock_guard lane_lock(lane.mutex);

  if (const HeldInterval* conflict =
          overlapLocked(lane, booking.interval)) {
    throw SlotTakenError(booking.space_id, conflict->reference);
  }

  {
    std::unique_lock records_lock(records_mutex_);
    if (!records_.emplace(booking.reference, booking).second) {
      throw std::invalid_argument("Duplicate booking reference: " +
                                  booking.reference);
    }
  }
  lane.held.emplace(booking.interval.start,
                    HeldInterval{booking.interval.end, booking.reference});
}

// -----------------------------------------------------------------------------
// apply(): mutate one booking, release its interval if it stopped holding
// -----------------------------------------------------------------------------
domain::Booking BookingLedger::apply(const domain::BookingReference& reference,
                                     const Mutator& mutator) {
  // space_id is immutable, so reading it before taking the lane is safe.
  domain::SpaceId space_id;
  {
    std::shared_lock records_lock(records_mutex_);
    auto it = records_.find(reference);
    if (it == records_.end()) {
      throw BookingNotFoundError(reference);
    }
    space_id = it->second.space_id;
  }

  Lane& lane = laneFor(space_id);
  std::lock_guard lane_lock(lane.mutex);

  domain::Booking updated;
  {
    std::shared_lock records_lock(records_mutex_);
    updated = records_.at(reference);
  }
  const bool held_before = domain::holdsInterval(updated.status);

  mutator(updated);

  {
    std::unique_lock records_lock(records_mutex_);
    records_[reference] = updated;
  }

  if (held_before && !domain::holdsInterval(updated.status)) {
    auto it = lane.held.find(updated.interval.start);
    if (it != lane.held.end() && it->second.reference == reference) {
      lane.held.erase(it);
    }
  }
  return updated;
}

std::optional<domain::Booking> BookingLedger::find(
    const domain::BookingReference& reference) const {
  std::shared_lock lock(records_mutex_);
  auto it = records_.find(reference);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

domain::Booking BookingLedger::get(
    const domain::BookingReference& reference) const {
  std::optional<domain::Booking> booking = find(reference);
  if (!booking) {
    throw BookingNotFoundError(reference);
  }
  return *booking;
}

std::optional<domain::BookingReference> BookingLedger::findOverlap(
    const domain::SpaceId& space_id,
    const domain::TimeInterval& interval) const {
  const Lane& lane = laneFor(space_id);
  std::lock_guard lock(lane.mutex);
  if (const HeldInterval* conflict = overlapLocked(lane, interval)) {
    return conflict->reference;
  }
  return std::nullopt;
}

std::vector<domain::Booking> BookingLedger::list() const {
  std::shared_lock lock(records_mutex_);
  std::vector<domain::Booking> out;
  out.reserve(records_.size());
  for (const auto& entry : records_) {
    out.push_back(entry.second);
  }
  return out;
}

std::size_t BookingLedger::size() const {
  std::shared_lock lock(records_mutex_);
  return records_.size();
}

}  // namespace park
