#include "park/occupancy/detection_ingestor.hpp"

#include "park/common/errors.hpp"
#include "park/events/occupancy_update_event.hpp"
#include "park/time/time_utils.hpp"

#include <iostream>
#include <stdexcept>

namespace park {

DetectionIngestor::DetectionIngestor(OccupancyStore& store,
                                     double confidence_threshold,
                                     EventSink sink)
    : store_(store),
      confidence_threshold_(confidence_threshold),
      sink_(std::move(sink)) {
  if (!(confidence_threshold_ >= 0.0 && confidence_threshold_ <= 1.0)) {
    throw std::invalid_argument("Confidence threshold must be in [0, 1]");
  }
}

// -----------------------------------------------------------------------------
// ingest(): one event per detection, rejected individually
// -----------------------------------------------------------------------------
IngestReport DetectionIngestor::ingest(const DetectionBatch& batch) {
  IngestReport report;

  for (const auto& detection : batch.detections) {
    auto reject = [&](const std::string& reason) {
      std::cerr << "[DetectionIngestor] Rejected " << detection.space_id
                << " at " << format_iso8601(batch.captured_at) << ": "
                << reason << "\n";
      report.rejections.push_back(IngestRejection{detection.space_id, reason});
      ++report.rejected;
    };

    if (detection.confidence >= 0.0 && detection.confidence <= 1.0 &&
        detection.confidence < confidence_threshold_) {
      reject("confidence " + std::to_string(detection.confidence) +
             " below threshold " + std::to_string(confidence_threshold_));
      continue;
    }

    domain::OccupancyEvent event;
    event.space_id = detection.space_id;
    event.type = detection.is_occupied
                     ? domain::OccupancyEventType::DetectedOccupied
                     : domain::OccupancyEventType::DetectedEmpty;
    event.timestamp = batch.captured_at;
    event.vehicle_type = detection.vehicle_type;
    event.confidence = detection.confidence;

    try {
      RecordedEvent recorded = store_.recordEvent(std::move(event));
      if (sink_) {
        sink_(OccupancyUpdateEvent{recorded.event, recorded.snapshot,
                                   recorded.previous_occupied,
                                   recorded.event.timestamp});
      }
      report.recorded.push_back(std::move(recorded));
      ++report.accepted;
    } catch (const InvalidSpaceError& e) {
      reject(e.what());
    } catch (const InvalidEventError& e) {
      reject(e.what());
    }
  }

  if (report.accepted > 0 || report.rejected > 0) {
    std::cout << "[DetectionIngestor] Batch at "
              << format_iso8601(batch.captured_at) << ": " << report.accepted
              << " accepted, " << report.rejected << " rejected\n";
  }
  return report;
}

IngestReport DetectionIngestor::ingestFrame(IOccupancyDetector& detector,
                                            const Frame& frame) {
  DetectionBatch batch;
  batch.captured_at = frame.captured_at;
  batch.detections = detector.detect(frame);
  return ingest(batch);
}

}  // namespace park
