#include "park/occupancy/occupancy_store.hpp"

#include "park/common/errors.hpp"
#include "park/time/time_utils.hpp"

#include <algorithm>

namespace park {

OccupancyStore::OccupancyStore(const SpaceRegistry& registry,
                               Timestamp initialized_at)
    : registry_(registry) {
  lanes_.reserve(registry_.size());
  for (const auto& space : registry_.spaces()) {
    auto lane = std::make_unique<Lane>();
    lane->snapshot.space_id = space.id;
    lane->snapshot.is_occupied = false;
    lane->snapshot.last_updated = initialized_at;
    lanes_.emplace(space.id, std::move(lane));
  }
}

const OccupancyStore::Lane* OccupancyStore::findLane(
    const domain::SpaceId& space_id) const {
  auto it = lanes_.find(space_id);
  return it == lanes_.end() ? nullptr : it->second.get();
}

void OccupancyStore::fold(domain::OccupancySnapshot& snapshot,
                          const domain::OccupancyEvent& event) {
  snapshot.is_occupied = domain::marksOccupied(event.type);
  snapshot.vehicle_type =
      snapshot.is_occupied ? event.vehicle_type : std::nullopt;
  snapshot.last_updated = event.timestamp;
}

// -----------------------------------------------------------------------------
// recordEvent()
// -----------------------------------------------------------------------------
RecordedEvent OccupancyStore::recordEvent(domain::OccupancyEvent event) {
  auto it = lanes_.find(event.space_id);
  if (it == lanes_.end()) {
    throw InvalidSpaceError(event.space_id);
  }
  if (!(event.confidence >= 0.0 && event.confidence <= 1.0)) {
    throw InvalidEventError("Confidence out of range for " + event.space_id +
                            ": " + std::to_string(event.confidence));
  }

  Lane& lane = *it->second;
  std::lock_guard lane_lock(lane.mutex);

  if (lane.has_events && event.timestamp < lane.snapshot.last_updated) {
    throw InvalidEventError("Stale event for " + event.space_id + " at " +
                            format_iso8601(event.timestamp) +
                            " (latest is " +
                            format_iso8601(lane.snapshot.last_updated) + ")");
  }

  {
    std::unique_lock log_lock(log_mutex_);
    event.sequence_id = next_sequence_++;
    log_.push_back(event);
    if (!first_event_time_ || event.timestamp < *first_event_time_) {
      first_event_time_ = event.timestamp;
    }
  }

  RecordedEvent recorded;
  recorded.previous_occupied = lane.snapshot.is_occupied;
  fold(lane.snapshot, event);
  lane.has_events = true;
  recorded.snapshot = lane.snapshot;
  recorded.event = std::move(event);
  return recorded;
}

domain::OccupancySnapshot OccupancyStore::currentSnapshot(
    const domain::SpaceId& space_id) const {
  const Lane* lane = findLane(space_id);
  if (lane == nullptr) {
    throw NotFoundError("Parking space not found: " + space_id);
  }
  std::lock_guard lock(lane->mutex);
  return lane->snapshot;
}

std::vector<domain::OccupancySnapshot> OccupancyStore::allSnapshots() const {
  std::vector<domain::OccupancySnapshot> out;
  out.reserve(registry_.size());
  // Registry order is id order. Each lane is read under its own lock; the
  // result is per-space consistent, not a global cut.
  for (const auto& space : registry_.spaces()) {
    const Lane* lane = findLane(space.id);
    std::lock_guard lock(lane->mutex);
    out.push_back(lane->snapshot);
  }
  return out;
}

domain::OccupancyCounts OccupancyStore::counts() const {
  domain::OccupancyCounts counts;
  counts.total = registry_.size();
  for (const auto& entry : lanes_) {
    std::lock_guard lock(entry.second->mutex);
    if (entry.second->snapshot.is_occupied) {
      ++counts.occupied;
    }
  }
  counts.available = counts.total - counts.occupied;
  return counts;
}

std::vector<domain::OccupancyEvent> OccupancyStore::eventLog() const {
  std::shared_lock lock(log_mutex_);
  return log_;
}

std::vector<domain::OccupancyEvent> OccupancyStore::eventsBetween(
    Timestamp from, Timestamp to) const {
  std::vector<domain::OccupancyEvent> out;
  {
    std::shared_lock lock(log_mutex_);
    for (const auto& event : log_) {
      if (event.timestamp >= from && event.timestamp < to) {
        out.push_back(event);
      }
    }
  }
  std::sort(out.begin(), out.end(),
            [](const domain::OccupancyEvent& a,
               const domain::OccupancyEvent& b) {
              if (a.timestamp != b.timestamp) {
                return a.timestamp < b.timestamp;
              }
              return a.sequence_id < b.sequence_id;
            });
  return out;
}

std::vector<domain::OccupancyEvent> OccupancyStore::recentEvents(
    std::size_t limit, const std::optional<domain::SpaceId>& space_id) const {
  std::vector<domain::OccupancyEvent> out;
  std::shared_lock lock(log_mutex_);
  for (auto it = log_.rbegin(); it != log_.rend() && out.size() < limit;
       ++it) {
    if (!space_id || it->space_id == *space_id) {
      out.push_back(*it);
    }
  }
  return out;
}

std::size_t OccupancyStore::eventCount() const {
  std::shared_lock lock(log_mutex_);
  return log_.size();
}

std::optional<Timestamp> OccupancyStore::firstEventTime() const {
  std::shared_lock lock(log_mutex_);
  return first_event_time_;
}

}  // namespace park
