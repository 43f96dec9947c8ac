#include "park/history/history_aggregator.hpp"

#include "park/common/errors.hpp"
#include "park/time/time_utils.hpp"

#include <cmath>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace park {

HistoryAggregator::HistoryAggregator(const OccupancyStore& store,
                                     const SpaceRegistry& registry,
                                     std::chrono::minutes window)
    : store_(store), registry_(registry), window_(window) {
  if (window_.count() <= 0) {
    throw InvalidIntervalError("History window must be positive");
  }
}

// -----------------------------------------------------------------------------
// bucketize()
// -----------------------------------------------------------------------------
std::vector<domain::OccupancyBucket> HistoryAggregator::bucketize(
    const std::vector<domain::OccupancyEvent>& events,
    const std::vector<domain::SpaceId>& space_ids, Timestamp range_start,
    Timestamp range_end, std::chrono::milliseconds window) {
  if (window.count() <= 0) {
    throw InvalidIntervalError("History window must be positive");
  }
  if (range_end <= range_start) {
    throw InvalidIntervalError("History range end must be after its start");
  }

  // Cold start: every known space available.
  std::unordered_map<domain::SpaceId, bool> occupied;
  occupied.reserve(space_ids.size());
  for (const auto& id : space_ids) {
    occupied.emplace(id, false);
  }
  std::size_t occupied_count = 0;

  auto apply = [&](const domain::OccupancyEvent& event) {
    auto it = occupied.find(event.space_id);
    if (it == occupied.end()) {
      return;
    }
    const bool now_occupied = domain::marksOccupied(event.type);
    if (now_occupied != it->second) {
      it->second = now_occupied;
      if (now_occupied) {
        ++occupied_count;
      } else {
        --occupied_count;
      }
    }
  };

  std::size_t next = 0;
  while (next < events.size() && events[next].timestamp < range_start) {
    apply(events[next++]);
  }

  std::vector<domain::OccupancyBucket> buckets;
  for (Timestamp window_start = range_start; window_start < range_end;
       window_start += window) {
    const Timestamp window_end = window_start + window;
    while (next < events.size() && events[next].timestamp < window_end &&
           events[next].timestamp < range_end) {
      apply(events[next++]);
    }

    domain::OccupancyBucket bucket;
    bucket.window_start = window_start;
    bucket.window_end = window_end;
    bucket.occupied_count = occupied_count;
    bucket.available_count = space_ids.size() - occupied_count;
    buckets.push_back(bucket);
  }
  return buckets;
}

std::vector<domain::OccupancyBucket> HistoryAggregator::history(
    Timestamp range_start, Timestamp range_end) const {
  return bucketize(store_.eventsBetween(Timestamp::min(), range_end),
                   registry_.ids(), range_start, range_end, window_);
}

std::vector<domain::OccupancyBucket> HistoryAggregator::trailing(
    Timestamp now, double hours) const {
  if (!std::isfinite(hours) || hours <= 0.0) {
    throw InvalidIntervalError("History hours must be positive");
  }
  if (hours > kMaxTrailingHours) {
    throw InvalidIntervalError(
        "History hours must be at most " +
        std::to_string(static_cast<int>(kMaxTrailingHours)));
  }
  const auto window_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(window_);
  const Timestamp range_end = floor_to(now, window_ms) + window_ms;

  // Round the span up to whole windows.
  const auto windows = static_cast<std::int64_t>(std::ceil(
      hours * 3'600'000.0 / static_cast<double>(window_ms.count())));
  const Timestamp range_start = range_end - window_ms * windows;
  return history(range_start, range_end);
}

}  // namespace park
