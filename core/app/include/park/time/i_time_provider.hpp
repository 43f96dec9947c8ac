#pragma once

#include <cstdint>

namespace park {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  The engine's only source of "now".
//
// @details
// The cancellation notice, the advance-booking window, reconciliation of
// elapsed bookings, the trailing range of a history query and every
// created_at/updated_at read the clock through this interface:
//   - LiveTimeProvider       → std::chrono::system_clock.
//   - SimulationTimeProvider → a value set by tests or replay.
//
// Milliseconds since the Unix epoch, matching the detector wire format;
// time_utils converts to Timestamp where records need one.
//
// Thread-safety contract:
//   Implementations must allow concurrent now_ms() from any thread.
//
// Ownership:
//   Components hold a const reference. The provider outlives them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since 1970-01-01T00:00:00Z. No side effects.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace park
