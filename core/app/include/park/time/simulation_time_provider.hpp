#pragma once

#include "park/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace park {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider implementation whose "current time" is set explicitly
//         rather than read from the system clock.
//
// @details
// Tests advance the clock to reproduce scenarios such as "a booking whose
// end_time has passed" or "a cancellation one hour before start" without
// sleeping. Replay tools advance it to each detector batch's timestamp.
//
// Internal storage: std::atomic<int64_t> current_time_ms_.
//
// Thread model:
//   - advance_time() is intended for a single writer.
//   - now_ms() may be called concurrently from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // Starts at 0 ms (epoch) unless an initial time is given.
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t initial_time_ms)
      : current_time_ms_(initial_time_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the simulation clock to the given timestamp.
  //
  // @param  new_time_ms  Epoch milliseconds. Monotonicity is the caller's
  //                      responsibility; tests occasionally rewind on
  //                      purpose.
  //
  // Thread-safety: Safe to call from any thread.
  // Side-effects:  Changes the value returned by now_ms() globally.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace park
