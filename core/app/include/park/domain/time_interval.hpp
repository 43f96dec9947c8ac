#pragma once

#include "park/events/event_types.hpp"

#include <chrono>

namespace park {
namespace domain {

// -----------------------------------------------------------------------------
// TimeInterval: half-open [start, end)
// -----------------------------------------------------------------------------
//
// @brief  The unit of space-time allocation. The end instant is excluded so
//         back-to-back bookings (10:00-12:00, 12:00-14:00) do not overlap.
//
// @details
// Validity (end > start) is checked by the component that accepts the
// interval (AvailabilityIndex, BookingEngine, PricingCalculator), which
// throws InvalidIntervalError. The struct itself does not enforce it so it
// can be default-constructed inside records.
// -----------------------------------------------------------------------------
struct TimeInterval {
  Timestamp start{};
  Timestamp end{};

  bool valid() const { return end > start; }

  // [a1,a2) and [b1,b2) overlap iff a1 < b2 && b1 < a2.
  bool overlaps(const TimeInterval& other) const {
    return start < other.end && other.start < end;
  }

  bool contains(Timestamp t) const { return start <= t && t < end; }

  std::chrono::milliseconds duration() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
  }
};

}  // namespace domain
}  // namespace park
