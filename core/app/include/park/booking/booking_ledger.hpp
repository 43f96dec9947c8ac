#pragma once

#include "park/domain/booking.hpp"
#include "park/domain/time_interval.hpp"
#include "park/events/event_types.hpp"
#include "park/registry/space_registry.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace park {

// -----------------------------------------------------------------------------
// BookingLedger: booking rows plus the per-space interval sets
// -----------------------------------------------------------------------------
//
// @brief  Stores every Booking and, per space, the set of intervals held by
//         bookings whose status is pending or confirmed.
//
// @details
// Invariant: within one space's interval set no two intervals overlap
// (half-open [start, end), so back-to-back bookings coexist). The set is
// a std::map keyed by start; because entries never overlap, ends are
// sorted too and the only entry that can overlap a candidate [s, e) is the
// last one starting before e.
//
// reserve() performs the overlap recheck and the insert under the space's
// lane mutex, as one step: two concurrent reserve() calls on the same space
// with overlapping intervals cannot both succeed. Different spaces have
// different lanes and proceed in parallel.
//
// apply() runs a mutation on one booking under its space's lane. If the
// mutation moves the booking out of pending/confirmed its interval leaves
// the set in the same critical section, so a cancelled interval is free
// for the very next reserve().
//
// Locking:
//   lane.mutex      (std::mutex, one per space, fixed at construction)
//   records_mutex_  (std::shared_mutex over records_)
//   Order: lane -> records_mutex_. Readers take only records_mutex_ shared.
//
// Thread model:
//   All methods are safe to call concurrently from any thread.
//
// Ownership:
//   Owned by ParkingEngine via std::unique_ptr. BookingEngine mutates it;
//   AvailabilityIndex reads it.
// -----------------------------------------------------------------------------
class BookingLedger {
 public:
  using Mutator = std::function<void(domain::Booking&)>;

  explicit BookingLedger(const SpaceRegistry& registry);

  BookingLedger(const BookingLedger&) = delete;
  BookingLedger& operator=(const BookingLedger&) = delete;

  // -------------------------------------------------------------------------
  // reserve(booking)
  // -------------------------------------------------------------------------
  // @brief  Atomically rechecks the space's interval set and inserts the
  //         booking row and its interval.
  //
  // @throws InvalidSpaceError    Unknown space_id.
  // @throws SlotTakenError       Overlaps a pending/confirmed booking. No
  //                              row is written.
  // @throws std::invalid_argument  Duplicate reference, invalid interval,
  //                              or a status that does not hold an interval.
  // -------------------------------------------------------------------------
  void reserve(const domain::Booking& booking);

  // -------------------------------------------------------------------------
  // apply(reference, mutator)
  // -------------------------------------------------------------------------
  // @brief  Runs mutator on a copy of the booking under the space lane and
  //         commits the copy if the mutator returns normally.
  //
  // @return The booking as committed.
  //
  // @throws BookingNotFoundError  Unknown reference.
  // @throws whatever mutator throws; nothing is committed in that case.
  //
  // The mutator must not change reference, space_id or interval, and must
  // not call back into the ledger (the lane mutex is not recursive).
  // -------------------------------------------------------------------------
  domain::Booking apply(const domain::BookingReference& reference,
                        const Mutator& mutator);

  std::optional<domain::Booking> find(
      const domain::BookingReference& reference) const;

  // @throws BookingNotFoundError
  domain::Booking get(const domain::BookingReference& reference) const;

  // Reference of a pending/confirmed booking on space_id overlapping
  // interval, if any. Point-in-time read.
  std::optional<domain::BookingReference> findOverlap(
      const domain::SpaceId& space_id,
      const domain::TimeInterval& interval) const;

  // Copy of every booking, in no particular order.
  std::vector<domain::Booking> list() const;

  std::size_t size() const;

 private:
  struct HeldInterval {
    Timestamp end;
    domain::BookingReference reference;
  };

  struct Lane {
    mutable std::mutex mutex;
    std::map<Timestamp, HeldInterval> held;  // Keyed by start
  };

  Lane& laneFor(const domain::SpaceId& space_id) const;

  // Caller holds lane.mutex.
  static const HeldInterval* overlapLocked(
      const Lane& lane, const domain::TimeInterval& interval);

  std::unordered_map<domain::SpaceId, std::unique_ptr<Lane>> lanes_;

  mutable std::shared_mutex records_mutex_;
  std::unordered_map<domain::BookingReference, domain::Booking> records_;
};

}  // namespace park
