#pragma once

#include "park/domain/parking_space.hpp"
#include "park/domain/vehicle_type.hpp"
#include "park/events/event_types.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace park {

// One per-space verdict from the detector.
struct Detection {
  domain::SpaceId space_id;
  bool is_occupied{false};
  double confidence{0.0};
  std::optional<domain::VehicleType> vehicle_type;
};

// Detector output for one captured frame.
struct DetectionBatch {
  Timestamp captured_at{};
  std::vector<Detection> detections;
};

// Raw camera frame handed to the detector; the engine never looks inside.
struct Frame {
  int width{0};
  int height{0};
  std::vector<std::uint8_t> pixels;
  Timestamp captured_at{};
};

// -----------------------------------------------------------------------------
// IOccupancyDetector: external image classifier capability
// -----------------------------------------------------------------------------
//
// @brief  detect(frame) -> one Detection per space it could see.
//
// @details
// The model behind it is opaque. Its output is trusted as an observation
// but still validated per entry by DetectionIngestor (known space,
// confidence range and threshold) before it reaches the store.
// -----------------------------------------------------------------------------
class IOccupancyDetector {
 public:
  virtual ~IOccupancyDetector() = default;

  virtual std::vector<Detection> detect(const Frame& frame) = 0;
};

}  // namespace park
