// =============================================================================
// detection_ingestor_test.cpp
// =============================================================================
// Tests for park::DetectionIngestor.
//
// Validates:
//   - Each detection becomes one detected_occupied / detected_empty event
//     stamped with the batch capture time
//   - Bad entries (unknown space, low or invalid confidence, stale) are
//     rejected individually; the rest of the batch is recorded
//   - One OccupancyUpdateEvent per accepted entry reaches the sink
//   - ingestFrame() routes detector output through the same path
// =============================================================================

#include "park/occupancy/detection_ingestor.hpp"
#include "park/occupancy/i_occupancy_detector.hpp"
#include "park/occupancy/occupancy_store.hpp"
#include "park/registry/space_registry.hpp"
#include "park/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using park::domain::OccupancyEventType;
using park::domain::VehicleType;

namespace {

// 2025-03-01T10:00:00Z
constexpr std::int64_t kT0 = 1'740'823'200'000;

park::Detection detection(const std::string& space, bool occupied,
                          double confidence,
                          std::optional<VehicleType> type = std::nullopt) {
  return park::Detection{space, occupied, confidence, type};
}

park::DetectionBatch batchAt(std::int64_t ms,
                             std::vector<park::Detection> detections) {
  park::DetectionBatch batch;
  batch.captured_at = park::ms_to_timestamp(ms);
  batch.detections = std::move(detections);
  return batch;
}

// Canned detector: returns a fixed verdict list and remembers the frame size.
class FakeDetector final : public park::IOccupancyDetector {
 public:
  explicit FakeDetector(std::vector<park::Detection> output)
      : output_(std::move(output)) {}

  std::vector<park::Detection> detect(const park::Frame& frame) override {
    last_width = frame.width;
    return output_;
  }

  int last_width{0};

 private:
  std::vector<park::Detection> output_;
};

park::LotLayout lot() {
  park::LotLayout layout;
  layout.rows = 1;
  layout.columns = 5;
  return layout;
}

}  // namespace

class DetectionIngestorTest : public ::testing::Test {
 protected:
  park::SpaceRegistry registry{lot()};
  park::OccupancyStore store{registry, park::ms_to_timestamp(kT0)};
  std::vector<park::Event> published;
  park::DetectionIngestor ingestor{
      store, 0.5, [this](park::Event e) { published.push_back(std::move(e)); }};
};

TEST_F(DetectionIngestorTest, AcceptedDetectionsBecomeEvents) {
  const auto report = ingestor.ingest(batchAt(
      kT0 + 1000, {detection("P001", true, 0.8, VehicleType::Truck),
                   detection("P002", false, 0.9)}));

  EXPECT_EQ(report.accepted, 2u);
  EXPECT_EQ(report.rejected, 0u);
  ASSERT_EQ(report.recorded.size(), 2u);
  EXPECT_EQ(report.recorded[0].event.type, OccupancyEventType::DetectedOccupied);
  EXPECT_EQ(report.recorded[1].event.type, OccupancyEventType::DetectedEmpty);
  EXPECT_EQ(park::timestamp_to_ms(report.recorded[0].event.timestamp), kT0 + 1000);
  EXPECT_DOUBLE_EQ(report.recorded[0].event.confidence, 0.8);

  const auto p1 = store.currentSnapshot("P001");
  EXPECT_TRUE(p1.is_occupied);
  ASSERT_TRUE(p1.vehicle_type.has_value());
  EXPECT_EQ(*p1.vehicle_type, VehicleType::Truck);
  EXPECT_FALSE(store.currentSnapshot("P002").is_occupied);

  ASSERT_EQ(published.size(), 2u);
  const auto* update = std::get_if<park::OccupancyUpdateEvent>(&published[0]);
  ASSERT_NE(update, nullptr);
  EXPECT_EQ(update->snapshot.space_id, "P001");
  EXPECT_FALSE(update->previous_occupied);
}

// -----------------------------------------------------------------------------
// One bad entry of each kind in a batch with two good ones.
// -----------------------------------------------------------------------------
TEST_F(DetectionIngestorTest, BadEntriesRejectedIndividually) {
  store.recordEvent([] {
    park::domain::OccupancyEvent e;
    e.space_id = "P005";
    e.type = OccupancyEventType::Enter;
    e.timestamp = park::ms_to_timestamp(kT0 + 60'000);
    return e;
  }());

  const auto report = ingestor.ingest(batchAt(
      kT0 + 30'000, {detection("P001", true, 0.95),
                     detection("Z999", true, 0.95),   // unknown space
                     detection("P002", true, 0.2),    // below threshold
                     detection("P003", true, 1.7),    // invalid confidence
                     detection("P005", false, 0.99),  // older than latest
                     detection("P004", true, 0.5)}));  // at threshold: kept

  EXPECT_EQ(report.accepted, 2u);
  EXPECT_EQ(report.rejected, 4u);
  ASSERT_EQ(report.rejections.size(), 4u);
  EXPECT_EQ(report.rejections[0].space_id, "Z999");
  EXPECT_EQ(report.rejections[1].space_id, "P002");
  EXPECT_EQ(report.rejections[2].space_id, "P003");
  EXPECT_EQ(report.rejections[3].space_id, "P005");
  for (const auto& r : report.rejections) {
    EXPECT_FALSE(r.reason.empty());
  }

  EXPECT_TRUE(store.currentSnapshot("P001").is_occupied);
  EXPECT_TRUE(store.currentSnapshot("P004").is_occupied);
  EXPECT_FALSE(store.currentSnapshot("P002").is_occupied);
  EXPECT_TRUE(store.currentSnapshot("P005").is_occupied);
  EXPECT_EQ(published.size(), 2u);
  EXPECT_EQ(store.eventCount(), 3u);
}

TEST_F(DetectionIngestorTest, EmptyBatchIsNoOp) {
  const auto report = ingestor.ingest(batchAt(kT0, {}));
  EXPECT_EQ(report.accepted, 0u);
  EXPECT_EQ(report.rejected, 0u);
  EXPECT_TRUE(published.empty());
}

TEST_F(DetectionIngestorTest, IngestFrameUsesCaptureTime) {
  FakeDetector detector({detection("P003", true, 0.7)});
  park::Frame frame;
  frame.width = 640;
  frame.height = 480;
  frame.captured_at = park::ms_to_timestamp(kT0 + 5000);

  const auto report = ingestor.ingestFrame(detector, frame);
  EXPECT_EQ(detector.last_width, 640);
  ASSERT_EQ(report.accepted, 1u);
  EXPECT_EQ(park::timestamp_to_ms(report.recorded[0].event.timestamp),
            kT0 + 5000);
  EXPECT_TRUE(store.currentSnapshot("P003").is_occupied);
}

TEST(DetectionIngestorConstructionTest, RejectsBadThreshold) {
  park::SpaceRegistry registry{lot()};
  park::OccupancyStore store{registry};
  EXPECT_THROW(park::DetectionIngestor(store, 1.5), std::invalid_argument);
  EXPECT_THROW(park::DetectionIngestor(store, -0.1), std::invalid_argument);
}
