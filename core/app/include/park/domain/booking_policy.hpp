#pragma once

#include <string>

namespace park {
namespace domain {

// -----------------------------------------------------------------------------
// BookingPolicy: lot-wide reservation rules
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of parameters that govern which reservation
//         requests the BookingEngine accepts.
//
// @details
// Applied by BookingEngine::hold() (duration and advance-booking window) and
// BookingEngine::cancel() (cancellation notice). Passed by value to the
// engine at construction and constant for its lifetime. Loaded from the
// "booking" section of the engine configuration file.
//
// A zero cancellation_hours disables the notice check; cancellations are
// then accepted right up to (and after) start_time while the booking is
// still live.
//
// Thread model:
//   Plain data with value semantics. No shared mutable state.
// -----------------------------------------------------------------------------
struct BookingPolicy {
  /// Shortest bookable interval, in hours.
  double min_booking_hours{1.0};

  /// Longest bookable interval, in hours.
  double max_booking_hours{24.0};

  /// How far ahead of "now" a booking may start, in days.
  double advance_booking_days{7.0};

  /// Minimum notice, in hours before start_time, for a cancellation.
  double cancellation_hours{2.0};

  /// ISO-4217 code attached to quotes and payments.
  std::string currency{"USD"};
};

}  // namespace domain
}  // namespace park
