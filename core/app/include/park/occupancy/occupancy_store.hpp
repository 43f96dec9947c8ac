#pragma once

#include "park/domain/occupancy.hpp"
#include "park/events/event_types.hpp"
#include "park/registry/space_registry.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace park {

// Result of one accepted recordEvent() call.
struct RecordedEvent {
  domain::OccupancyEvent event;        // As appended, sequence_id assigned
  domain::OccupancySnapshot snapshot;  // Snapshot after the fold
  bool previous_occupied{false};
};

// -----------------------------------------------------------------------------
// OccupancyStore: authoritative physical-occupancy state
// -----------------------------------------------------------------------------
//
// @brief  Append-only log of OccupancyEvents plus one OccupancySnapshot per
//         space holding the fold of that space's events.
//
// @details
// recordEvent() appends to the log and then folds the event into the
// space's snapshot. Both steps happen while holding the space's lane mutex,
// so for a given space the log order and the fold order are the same and a
// reader of the snapshot never sees a state that a replay of the log would
// not produce. Each recorded event is visible to every read that starts
// after recordEvent() returns.
//
// Validation (per event, nothing is written on failure):
//   - unknown space_id                         -> InvalidSpaceError
//   - confidence outside [0, 1]                -> InvalidEventError
//   - timestamp older than the space's latest  -> InvalidEventError
// Equal timestamps are accepted and applied in arrival order.
//
// Locking:
//   lanes_   : fixed at construction, one std::mutex per space. Writers to
//              different spaces never contend on a lane.
//   log_     : guarded by log_mutex_ (shared_mutex). Writers take it
//              exclusively only for the push_back; history and forecast
//              readers copy slices under a shared lock.
//   Lock order is always lane -> log_mutex_.
//
// Thread model:
//   All methods are safe to call concurrently from any thread.
//
// Ownership:
//   Owned by ParkingEngine via std::unique_ptr. Holds a const reference to
//   the SpaceRegistry, which must outlive it.
// -----------------------------------------------------------------------------
class OccupancyStore {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  registry        Catalog of valid spaces. One lane per space is
  //                         created here and never added or removed.
  // @param  initialized_at  last_updated of every snapshot until its first
  //                         event. Every space starts available.
  // -------------------------------------------------------------------------
  explicit OccupancyStore(const SpaceRegistry& registry,
                          Timestamp initialized_at = Timestamp{});

  OccupancyStore(const OccupancyStore&) = delete;
  OccupancyStore& operator=(const OccupancyStore&) = delete;

  // -------------------------------------------------------------------------
  // recordEvent(event)
  // -------------------------------------------------------------------------
  // @brief  Validates, appends and folds one event.
  //
  // @return The appended event (with its log sequence_id) and the new
  //         snapshot.
  //
  // @throws InvalidSpaceError, InvalidEventError (see class comment).
  //
  // Thread-safety: Safe from any thread; serialized per space.
  // -------------------------------------------------------------------------
  RecordedEvent recordEvent(domain::OccupancyEvent event);

  // @throws NotFoundError if space_id is unknown.
  domain::OccupancySnapshot currentSnapshot(const domain::SpaceId& space_id) const;

  // One snapshot per space, ordered by space id.
  std::vector<domain::OccupancySnapshot> allSnapshots() const;

  domain::OccupancyCounts counts() const;

  // Copy of the full log in append order.
  std::vector<domain::OccupancyEvent> eventLog() const;

  // Events with from <= timestamp < to, ordered by (timestamp, sequence_id).
  std::vector<domain::OccupancyEvent> eventsBetween(Timestamp from,
                                                    Timestamp to) const;

  // Newest first (highest sequence_id), at most limit, optionally one space.
  std::vector<domain::OccupancyEvent> recentEvents(
      std::size_t limit,
      const std::optional<domain::SpaceId>& space_id = std::nullopt) const;

  std::size_t eventCount() const;

  // Earliest event timestamp in the log, empty if nothing was recorded.
  std::optional<Timestamp> firstEventTime() const;

  // -------------------------------------------------------------------------
  // fold(snapshot, event)
  // -------------------------------------------------------------------------
  // @brief  The snapshot transition function. Occupied-marking events set
  //         is_occupied and take the event's vehicle_type; freeing events
  //         clear both. last_updated becomes the event timestamp.
  //
  // Exposed so the history aggregator and tests can replay a log with the
  // exact rule the store applies.
  // -------------------------------------------------------------------------
  static void fold(domain::OccupancySnapshot& snapshot,
                   const domain::OccupancyEvent& event);

 private:
  struct Lane {
    mutable std::mutex mutex;
    domain::OccupancySnapshot snapshot;
    bool has_events{false};
  };

  const Lane* findLane(const domain::SpaceId& space_id) const;

  const SpaceRegistry& registry_;
  std::unordered_map<domain::SpaceId, std::unique_ptr<Lane>> lanes_;

  mutable std::shared_mutex log_mutex_;
  std::vector<domain::OccupancyEvent> log_;
  std::uint64_t next_sequence_{1};
  std::optional<Timestamp> first_event_time_;
};

}  // namespace park
