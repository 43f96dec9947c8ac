#pragma once

#include "park/events/event.hpp"
#include "park/occupancy/i_occupancy_detector.hpp"
#include "park/occupancy/occupancy_store.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace park {

struct IngestRejection {
  domain::SpaceId space_id;
  std::string reason;
};

struct IngestReport {
  std::size_t accepted{0};
  std::size_t rejected{0};
  std::vector<IngestRejection> rejections;
  std::vector<RecordedEvent> recorded;
};

// -----------------------------------------------------------------------------
// DetectionIngestor: detector output -> occupancy events
// -----------------------------------------------------------------------------
//
// @brief  Turns each Detection of a batch into one detected_occupied or
//         detected_empty event stamped with the batch's capture time and
//         records it in the OccupancyStore.
//
// @details
// Atomicity is per event, not per batch. An entry is rejected (logged to
// std::cerr, counted in the report, nothing written for it) when
//   - its space is unknown,
//   - its confidence is outside [0, 1] or below confidence_threshold,
//   - it is older than the space's latest event.
// All other entries of the same batch are still recorded.
//
// Thread model:
//   ingest() may be called concurrently (the detection thread and command
//   handlers). Each entry is serialized by the store's per-space lane.
// -----------------------------------------------------------------------------
class DetectionIngestor {
 public:
  DetectionIngestor(OccupancyStore& store, double confidence_threshold,
                    EventSink sink = {});

  IngestReport ingest(const DetectionBatch& batch);

  // Runs the detector on frame and ingests its output at frame.captured_at.
  IngestReport ingestFrame(IOccupancyDetector& detector, const Frame& frame);

  double confidenceThreshold() const { return confidence_threshold_; }

 private:
  OccupancyStore& store_;
  double confidence_threshold_;
  EventSink sink_;
};

}  // namespace park
