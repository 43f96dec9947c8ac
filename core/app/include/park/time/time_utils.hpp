#pragma once

#include "park/events/event_types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace park {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions that convert between the engine's Timestamp type
//         (std::chrono::system_clock::time_point), int64_t epoch
//         milliseconds and ISO-8601 text, plus the UTC calendar fields the
//         forecasters use.
//
// @details
// ITimeProvider returns int64_t milliseconds while domain records carry a
// Timestamp; the boundary speaks ISO-8601. All calendar arithmetic is UTC so
// results do not depend on the host's time zone.
//
// Thread-safety: Stateless, safe to call from any thread.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// Fractional hours between two instants (negative if to < from).
inline double hours_between(Timestamp from, Timestamp to) {
  return std::chrono::duration<double, std::ratio<3600>>(to - from).count();
}

// -------------------------------------------------------------------------
// floor_to(tp, step)
// -------------------------------------------------------------------------
// @brief  Rounds tp down to a multiple of step since the epoch.
//
// @details
// Used to align history windows ("5-minute buckets start on :00, :05, ...")
// and forecast steps. step must be positive.
// -------------------------------------------------------------------------
inline Timestamp floor_to(Timestamp tp, std::chrono::milliseconds step) {
  const std::int64_t ms = timestamp_to_ms(tp);
  const std::int64_t s = step.count();
  std::int64_t q = ms / s;
  if (ms % s != 0 && ms < 0) {
    --q;
  }
  return ms_to_timestamp(q * s);
}

// -------------------------------------------------------------------------
// parse_iso8601(text)
// -------------------------------------------------------------------------
// @brief  Parses "YYYY-MM-DDTHH:MM", "YYYY-MM-DDTHH:MM:SS" and
//         "YYYY-MM-DDTHH:MM:SS.fff", each optionally followed by "Z".
//         A space may replace the 'T'.
//
// @return std::nullopt on any syntax or range error. Times without a zone
//         designator are taken as UTC.
// -------------------------------------------------------------------------
std::optional<Timestamp> parse_iso8601(const std::string& text);

// "YYYY-MM-DDTHH:MM:SSZ", with ".fff" when the millisecond part is non-zero.
std::string format_iso8601(Timestamp tp);

// 0..23, UTC.
int utc_hour(Timestamp tp);

// 0 = Monday .. 6 = Sunday, UTC.
int utc_weekday(Timestamp tp);

// Midnight UTC of the day containing tp.
Timestamp utc_day_start(Timestamp tp);

}  // namespace park
