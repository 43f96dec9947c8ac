// =============================================================================
// detection_gateway_test.cpp
// =============================================================================
// Tests for park::DetectionGateway.
//
// Validates:
//   - handleMessage() decodes a batch and forwards it to the sink
//   - Batches without a timestamp are stamped with the provider's now
//   - Malformed payloads are counted and skipped, never forwarded
//   - run() receives batches from a live PUB socket and stop() ends it
//
// The decoding tests connect to an endpoint nobody binds; ZeroMQ connects
// lazily, so the gateway constructs fine and simply never receives.
// =============================================================================

#include "park/network/detection_gateway.hpp"
#include "park/time/simulation_time_provider.hpp"
#include "park/time/time_utils.hpp"

#include <gtest/gtest.h>
#include <zmq.hpp>

#include <chrono>
#include <cstdint>
#include <future>
#include <string>
#include <thread>
#include <vector>

namespace {

// 2025-03-01T10:00:00Z
constexpr std::int64_t kT0 = 1'740'823'200'000;

constexpr const char* kUnusedEndpoint = "tcp://127.0.0.1:15599";

}  // namespace

class DetectionGatewayTest : public ::testing::Test {
 protected:
  park::SimulationTimeProvider clock{kT0};
  std::vector<park::DetectionBatch> batches;
  park::DetectionGateway gateway{
      clock,
      [this](park::DetectionBatch b) { batches.push_back(std::move(b)); },
      kUnusedEndpoint};
};

TEST_F(DetectionGatewayTest, DecodesBatch) {
  EXPECT_TRUE(gateway.handleMessage(R"({
    "timestamp_ms": 1740823260000,
    "detections": [
      {"space_id": "P001", "is_occupied": true, "confidence": 0.91,
       "vehicle_type": "car"},
      {"space_id": "P002", "is_occupied": false, "confidence": 0.88}
    ]})"));

  ASSERT_EQ(batches.size(), 1u);
  EXPECT_EQ(park::timestamp_to_ms(batches[0].captured_at), kT0 + 60'000);
  ASSERT_EQ(batches[0].detections.size(), 2u);
  EXPECT_EQ(batches[0].detections[0].space_id, "P001");
  EXPECT_TRUE(batches[0].detections[0].is_occupied);
  ASSERT_TRUE(batches[0].detections[0].vehicle_type.has_value());
  EXPECT_EQ(*batches[0].detections[0].vehicle_type,
            park::domain::VehicleType::Car);
  EXPECT_FALSE(batches[0].detections[1].vehicle_type.has_value());
  EXPECT_EQ(gateway.receivedCount(), 1u);
  EXPECT_EQ(gateway.malformedCount(), 0u);
}

TEST_F(DetectionGatewayTest, MissingTimestampUsesProviderNow) {
  clock.advance_by(5'000);
  ASSERT_TRUE(gateway.handleMessage(
      R"({"detections": [{"space_id": "P003", "is_occupied": true}]})"));
  ASSERT_EQ(batches.size(), 1u);
  EXPECT_EQ(park::timestamp_to_ms(batches[0].captured_at), kT0 + 5'000);
}

TEST_F(DetectionGatewayTest, MalformedPayloadsAreSkipped) {
  EXPECT_FALSE(gateway.handleMessage("{not json"));
  EXPECT_FALSE(gateway.handleMessage(R"({"detections": 3})"));
  EXPECT_FALSE(gateway.handleMessage(
      R"({"detections": [{"space_id": "P001", "is_occupied": "maybe"}]})"));
  EXPECT_TRUE(gateway.handleMessage(R"({"detections": []})"));

  EXPECT_EQ(gateway.malformedCount(), 3u);
  EXPECT_EQ(gateway.receivedCount(), 1u);
  ASSERT_EQ(batches.size(), 1u);
  EXPECT_TRUE(batches[0].detections.empty());
}

// -----------------------------------------------------------------------------
// Live socket: publish until the first batch arrives (PUB drops messages
// sent before the subscription is in place), then stop the loop.
// -----------------------------------------------------------------------------
TEST(DetectionGatewayLiveTest, ReceivesFromPublisher) {
  constexpr const char* kEndpoint = "tcp://127.0.0.1:15598";

  zmq::context_t context{1};
  zmq::socket_t publisher{context, zmq::socket_type::pub};
  publisher.set(zmq::sockopt::linger, 0);
  publisher.bind(kEndpoint);

  park::SimulationTimeProvider clock{kT0};
  std::promise<park::DetectionBatch> promise;
  auto future = promise.get_future();
  bool delivered = false;

  park::DetectionGateway gateway{
      clock,
      [&](park::DetectionBatch b) {
        if (!delivered) {
          delivered = true;
          promise.set_value(std::move(b));
        }
      },
      kEndpoint};
  std::thread loop([&gateway] { gateway.run(); });

  const std::string payload =
      R"({"timestamp_ms": 1740823200000,)"
      R"( "detections": [{"space_id": "P004", "is_occupied": true}]})";
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(3);
  while (future.wait_for(std::chrono::milliseconds(20)) !=
             std::future_status::ready &&
         std::chrono::steady_clock::now() < deadline) {
    EXPECT_TRUE(publisher.send(zmq::buffer(payload), zmq::send_flags::dontwait)
                    .has_value());
  }

  gateway.stop();
  loop.join();

  ASSERT_EQ(future.wait_for(std::chrono::seconds(0)),
            std::future_status::ready)
      << "No batch received from the publisher";
  const auto batch = future.get();
  EXPECT_EQ(park::timestamp_to_ms(batch.captured_at), kT0);
  ASSERT_EQ(batch.detections.size(), 1u);
  EXPECT_EQ(batch.detections[0].space_id, "P004");
  EXPECT_GE(gateway.receivedCount(), 1u);
}
