#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace park {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Type alias for wall-clock time. Used by every domain record and event for
// ordering and auditing. std::chrono::system_clock::time_point is preferred
// over raw time_t because it is type-safe and has well-defined resolution.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// HeartbeatEvent
// -----------------------------------------------------------------------------
// Responsibility: Periodic status message from a long-running component
// (maintenance thread, detection gateway).
// A subscriber that stops seeing them knows the component has stalled.
// -----------------------------------------------------------------------------
struct HeartbeatEvent {
  std::string component_id;  // Which component sent this (e.g. "maintenance")
  std::string status;        // Free-form status string (e.g. "ok")
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace park
