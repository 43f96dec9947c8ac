#pragma once

#include "park/domain/occupancy.hpp"
#include "park/events/event_types.hpp"
#include "park/occupancy/occupancy_store.hpp"

#include <chrono>
#include <vector>

namespace park {

// -----------------------------------------------------------------------------
// HistoryAggregator: occupancy log -> fixed-width bucket series
// -----------------------------------------------------------------------------
//
// @brief  Rolls the occupancy event log into OccupancyBuckets of a fixed
//         window width.
//
// @details
// Algorithm (bucketize):
//   1. Every space starts available. This is the cold-start policy: a space
//      with no event before the range is counted as available, the same
//      state OccupancyStore gives a space it has never heard about.
//   2. Events before range_start are replayed to establish the state at the
//      range start.
//   3. For each window [ws, ws + window) from range_start to range_end,
//      events with timestamp < ws + window are folded in, then one bucket
//      is emitted carrying the tally at the END of the window. State is
//      carried forward; an event never changes a bucket whose window ended
//      before it.
//
// The last window may extend past range_end; it is still emitted so the
// window containing "now" shows the latest state.
//
// Every bucket satisfies occupied_count + available_count == space count.
// Events for spaces not in space_ids are ignored.
//
// Thread model:
//   bucketize() is a pure function. history() takes a point-in-time copy of
//   the log under the store's shared lock and never blocks writers for
//   longer than that copy.
// -----------------------------------------------------------------------------
class HistoryAggregator {
 public:
  // Longest span trailing() serves, 31 days.
  static constexpr double kMaxTrailingHours = 24.0 * 31;

  HistoryAggregator(const OccupancyStore& store, const SpaceRegistry& registry,
                    std::chrono::minutes window);

  // -------------------------------------------------------------------------
  // bucketize(events, space_ids, range_start, range_end, window)
  // -------------------------------------------------------------------------
  // @param  events  Log slice ending before range_end, in timestamp order
  //                 (OccupancyStore::eventsBetween order). Anything at or
  //                 after range_end is ignored.
  //
  // @throws InvalidIntervalError if window <= 0 or range_end <= range_start.
  // -------------------------------------------------------------------------
  static std::vector<domain::OccupancyBucket> bucketize(
      const std::vector<domain::OccupancyEvent>& events,
      const std::vector<domain::SpaceId>& space_ids, Timestamp range_start,
      Timestamp range_end, std::chrono::milliseconds window);

  // Buckets covering [range_start, range_end) using the configured window.
  std::vector<domain::OccupancyBucket> history(Timestamp range_start,
                                               Timestamp range_end) const;

  // -------------------------------------------------------------------------
  // trailing(now, hours)
  // -------------------------------------------------------------------------
  // @brief  The last `hours` hours, aligned to window boundaries and ending
  //         with the window that contains now.
  //
  // @throws InvalidIntervalError if hours is not finite, not positive or
  //         above kMaxTrailingHours.
  // -------------------------------------------------------------------------
  std::vector<domain::OccupancyBucket> trailing(Timestamp now,
                                                double hours) const;

  std::chrono::minutes window() const { return window_; }

 private:
  const OccupancyStore& store_;
  const SpaceRegistry& registry_;
  std::chrono::minutes window_;
};

}  // namespace park
