// =============================================================================
// parking_engine_test.cpp
// =============================================================================
// Tests for park::ParkingEngine.
//
// Validates:
//   - Lifecycle: start() / stop() idempotent, destructor stops threads
//   - executeCommand() drives the whole booking workflow as JSON
//   - Every failure comes back as an error envelope, never an exception
//   - Occupancy commands (update, status, events, detections, statistics)
//   - Notifications reach notificationBus() subscribers after start()
//   - runMaintenance() completes elapsed bookings and emits a heartbeat
//   - The REP socket answers commands when ipc endpoints are set
//   - Detector batches on the SUB endpoint reach the occupancy store
//
// Design: Each test creates its own engine on a simulated clock. ipc and
// detection endpoints are empty unless the test needs a socket.
// =============================================================================

#include "park/common/errors.hpp"
#include "park/engine/parking_engine.hpp"
#include "park/events/event.hpp"
#include "park/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <chrono>
#include <cstdint>
#include <future>
#include <string>
#include <thread>

using nlohmann::json;
using namespace std::chrono_literals;

namespace {

// 2025-03-01T08:00:00Z
constexpr std::int64_t kNow = 1'740'816'000'000;
constexpr std::int64_t kHour = 3'600'000;

park::EngineConfig testConfig() {
  park::EngineConfig config;
  config.lot.rows = 2;
  config.lot.columns = 5;
  config.payment.declined_methods = {"declined_card"};
  config.detection.endpoint = "";
  config.ipc.command_endpoint = "";
  config.ipc.telemetry_endpoint = "";
  return config;
}

json command(const std::string& method, const std::string& path,
             json params = json::object()) {
  return json{{"method", method}, {"path", path}, {"params", std::move(params)}};
}

json bookingParams(const std::string& space, const std::string& start,
                   const std::string& end) {
  return json{{"space_id", space},
              {"start_time", start},
              {"end_time", end},
              {"customer_name", "Ada Driver"},
              {"customer_email", "ada@example.com"},
              {"vehicle_number", "ABC-123"}};
}

}  // namespace

class ParkingEngineTest : public ::testing::Test {
 protected:
  json run(const json& cmd) {
    return json::parse(engine.executeCommand(cmd.dump()));
  }

  park::SimulationTimeProvider clock{kNow};
  park::ParkingEngine engine{testConfig(), clock};
};

// -----------------------------------------------------------------------------
// 1. Lifecycle
// -----------------------------------------------------------------------------

TEST_F(ParkingEngineTest, StartStopIdempotent) {
  EXPECT_FALSE(engine.isRunning());
  engine.start();
  engine.start();
  EXPECT_TRUE(engine.isRunning());
  engine.stop();
  engine.stop();
  EXPECT_FALSE(engine.isRunning());

  // Restart keeps the core: commands still see earlier state.
  run(command("POST", "spaces/update",
              {{"space_id", "P001"}, {"is_occupied", true}}));
  engine.start();
  EXPECT_EQ(run(command("GET", "status")).at("occupied"), 1);
  engine.stop();
}

TEST(ParkingEngineLifecycleTest, DestructorStopsThreads) {
  park::SimulationTimeProvider clock{kNow};
  {
    park::ParkingEngine engine(testConfig(), clock);
    engine.start();
    EXPECT_TRUE(engine.isRunning());
  }
  SUCCEED();
}

TEST(ParkingEngineLifecycleTest, InvalidConfigThrows) {
  park::SimulationTimeProvider clock{kNow};
  auto config = testConfig();
  config.booking.min_booking_hours = 0.0;
  EXPECT_THROW(park::ParkingEngine(config, clock), park::ConfigError);

  config = testConfig();
  config.forecast.model = "linear";
  config.forecast.model_path = "/nonexistent/model.json";
  EXPECT_THROW(park::ParkingEngine(config, clock), park::ConfigError);
}

// -----------------------------------------------------------------------------
// 2. Booking workflow over the command surface
// -----------------------------------------------------------------------------

TEST_F(ParkingEngineTest, BookingWorkflow) {
  const json available = run(command(
      "GET", "bookings/available",
      {{"start_time", "2025-03-01T12:00:00Z"},
       {"end_time", "2025-03-01T14:00:00Z"}}));
  ASSERT_EQ(available.at("success"), true);
  EXPECT_EQ(available.at("count"), 10);
  EXPECT_DOUBLE_EQ(
      available.at("available_spaces")[0].at("total_cost").get<double>(), 10.0);

  const json quote = run(command("POST", "bookings/calculate",
                                 {{"space_id", "P007"},
                                  {"start_time", "2025-03-01T12:00:00Z"},
                                  {"end_time", "2025-03-01T13:30:00Z"}}));
  EXPECT_DOUBLE_EQ(quote.at("total_cost").get<double>(), 7.5);
  EXPECT_EQ(quote.at("currency"), "USD");

  const json created = run(command(
      "POST", "bookings/create",
      bookingParams("P007", "2025-03-01T12:00:00Z", "2025-03-01T14:00:00Z")));
  ASSERT_EQ(created.at("success"), true) << created.dump();
  const json& booking = created.at("booking");
  EXPECT_EQ(booking.at("status"), "confirmed");
  EXPECT_EQ(booking.at("payment_status"), "unpaid");
  EXPECT_DOUBLE_EQ(booking.at("total_amount").get<double>(), 10.0);
  const std::string ref = booking.at("booking_reference");

  const json after = run(command(
      "GET", "bookings/available",
      {{"start_time", "2025-03-01T13:00:00Z"},
       {"end_time", "2025-03-01T15:00:00Z"}}));
  EXPECT_EQ(after.at("count"), 9);

  const json paid =
      run(command("POST", "payments/process", {{"booking_reference", ref}}));
  ASSERT_EQ(paid.at("success"), true) << paid.dump();
  EXPECT_EQ(paid.at("transaction_id"), "demo_txn_000001");
  EXPECT_EQ(paid.at("booking").at("payment_status"), "paid");

  const json payment = run(command(
      "GET", "payments/detail",
      {{"payment_reference", paid.at("payment_reference")}}));
  EXPECT_EQ(payment.at("payment").at("status"), "completed");
  EXPECT_EQ(payment.at("payment").at("booking_reference"), ref);

  const json detail =
      run(command("GET", "bookings/detail", {{"booking_reference", ref}}));
  EXPECT_EQ(detail.at("booking").at("stage"), "paid");

  const json listed = run(command("GET", "bookings", {{"status", "confirmed"}}));
  EXPECT_EQ(listed.at("count"), 1);

  const json cancelled =
      run(command("POST", "bookings/cancel", {{"booking_reference", ref}}));
  EXPECT_EQ(cancelled.at("booking").at("status"), "cancelled");
  EXPECT_EQ(cancelled.at("booking").at("payment_status"), "refunded");
}

TEST_F(ParkingEngineTest, CheckInAndOutUpdateOccupancy) {
  const json created = run(command(
      "POST", "bookings/create",
      bookingParams("P003", "2025-03-01T09:00:00Z", "2025-03-01T11:00:00Z")));
  const std::string ref = created.at("booking").at("booking_reference");

  run(command("POST", "bookings/check-in", {{"booking_reference", ref}}));
  json space = run(command("GET", "spaces/detail", {{"space_id", "P003"}}));
  EXPECT_EQ(space.at("occupancy").at("is_occupied"), true);
  EXPECT_EQ(space.at("occupancy").at("vehicle_type"), "car");

  clock.advance_by(kHour);
  run(command("POST", "bookings/check-out", {{"booking_reference", ref}}));
  space = run(command("GET", "spaces/detail", {{"space_id", "P003"}}));
  EXPECT_EQ(space.at("occupancy").at("is_occupied"), false);
  EXPECT_EQ(space.at("recent_events").size(), 2u);
}

// -----------------------------------------------------------------------------
// 3. Error envelopes
// -----------------------------------------------------------------------------

TEST_F(ParkingEngineTest, FailuresBecomeErrorEnvelopes) {
  json reply = json::parse(engine.executeCommand("{not json"));
  EXPECT_EQ(reply.at("success"), false);
  EXPECT_EQ(reply.at("error_code"), "invalid_request");

  reply = run(command("GET", "no/such/path"));
  EXPECT_EQ(reply.at("error_code"), "not_found");
  EXPECT_EQ(reply.at("status"), 404);

  reply = run(command("POST", "status"));
  EXPECT_EQ(reply.at("error_code"), "not_found");

  reply = run(command("GET", "spaces/detail", {{"space_id", "Z999"}}));
  EXPECT_EQ(reply.at("error_code"), "invalid_space");

  reply = run(command("GET", "bookings/available",
                      {{"start_time", "2025-03-01T12:00:00Z"},
                       {"end_time", "2025-03-01T11:00:00Z"}}));
  EXPECT_EQ(reply.at("error_code"), "invalid_interval");

  reply = run(command("GET", "predict"));
  EXPECT_EQ(reply.at("error_code"), "insufficient_history");
  EXPECT_EQ(reply.at("status"), 503);

  auto params =
      bookingParams("P001", "2025-03-01T12:00:00Z", "2025-03-01T14:00:00Z");
  params.erase("customer_email");
  reply = run(command("POST", "bookings/create", params));
  EXPECT_EQ(reply.at("error_code"), "invalid_customer_data");

  reply = run(command("GET", "bookings/detail", {{"booking_reference", "NOPE"}}));
  EXPECT_EQ(reply.at("error_code"), "not_found");
}

TEST_F(ParkingEngineTest, SlotTakenNamesConflict) {
  const json first = run(command(
      "POST", "bookings/create",
      bookingParams("P002", "2025-03-01T12:00:00Z", "2025-03-01T14:00:00Z")));
  const json second = run(command(
      "POST", "bookings/create",
      bookingParams("P002", "2025-03-01T13:00:00Z", "2025-03-01T15:00:00Z")));
  EXPECT_EQ(second.at("error_code"), "slot_taken");
  EXPECT_EQ(second.at("status"), 409);
  EXPECT_EQ(second.at("conflicting_reference"),
            first.at("booking").at("booking_reference"));
}

TEST_F(ParkingEngineTest, DeclinedPaymentKeepsBooking) {
  const json created = run(command(
      "POST", "bookings/create",
      bookingParams("P004", "2025-03-01T12:00:00Z", "2025-03-01T14:00:00Z")));
  const std::string ref = created.at("booking").at("booking_reference");

  const json declined = run(command(
      "POST", "payments/process",
      {{"booking_reference", ref}, {"payment_method", "declined_card"}}));
  EXPECT_EQ(declined.at("error_code"), "payment_failed");
  EXPECT_EQ(declined.at("status"), 402);

  const json detail =
      run(command("GET", "bookings/detail", {{"booking_reference", ref}}));
  EXPECT_EQ(detail.at("booking").at("status"), "confirmed");
  EXPECT_EQ(detail.at("booking").at("payment_status"), "failed");
}

// -----------------------------------------------------------------------------
// 4. Occupancy commands
// -----------------------------------------------------------------------------

TEST_F(ParkingEngineTest, OccupancyCommands) {
  EXPECT_EQ(run(command("GET", "ping")).at("response"), "pong");

  json status = run(command("GET", "status"));
  EXPECT_EQ(status.at("total"), 10);
  EXPECT_EQ(status.at("available"), 10);
  EXPECT_EQ(status.at("spaces").size(), 10u);

  const json updated = run(command(
      "POST", "spaces/update",
      {{"space_number", "P005"}, {"is_occupied", true}, {"vehicle_type", "bus"}}));
  EXPECT_EQ(updated.at("previous_occupied"), false);
  EXPECT_EQ(updated.at("event").at("event_type"), "detected_occupied");

  const json ingested = run(command(
      "POST", "detections",
      {{"detections", json::array({{{"space_id", "P006"},
                                    {"is_occupied", true},
                                    {"confidence", 0.95}},
                                   {{"space_id", "P007"},
                                    {"is_occupied", true},
                                    {"confidence", 0.1}}})}}));
  EXPECT_EQ(ingested.at("accepted"), 1);
  EXPECT_EQ(ingested.at("rejected"), 1);

  status = run(command("GET", "status"));
  EXPECT_EQ(status.at("occupied"), 2);
  EXPECT_DOUBLE_EQ(status.at("occupancy_rate").get<double>(), 0.2);

  const json events = run(command("GET", "events/recent", {{"limit", 10}}));
  EXPECT_EQ(events.at("count"), 2);

  const json stats = run(command("GET", "statistics/summary"));
  EXPECT_EQ(stats.at("date"), "2025-03-01");
  EXPECT_EQ(stats.at("entries_today"), 2);
  EXPECT_EQ(stats.at("exits_today"), 0);

  const json history = run(command("GET", "history", {{"hours", 1}}));
  EXPECT_EQ(history.at("window_minutes"), 5);
  EXPECT_EQ(history.at("history").size(), 12u);
}

// History accumulates until the forecaster has enough windows.
TEST_F(ParkingEngineTest, PredictAfterEnoughHistory) {
  run(command("POST", "spaces/update",
              {{"space_id", "P001"}, {"is_occupied", true}}));
  clock.advance_by(2 * kHour);

  const json forecast = run(command("GET", "predict", {{"hours", 4}}));
  ASSERT_EQ(forecast.at("success"), true) << forecast.dump();
  EXPECT_EQ(forecast.at("model"), "seasonal");
  ASSERT_EQ(forecast.at("predictions").size(), 4u);
  for (const auto& p : forecast.at("predictions")) {
    EXPECT_EQ(p.at("predicted_occupied").get<int>() +
                  p.at("predicted_available").get<int>(),
              10);
  }
}

// -----------------------------------------------------------------------------
// 5. Notifications and maintenance
// -----------------------------------------------------------------------------

TEST_F(ParkingEngineTest, BookingUpdatesReachSubscribers) {
  std::promise<park::BookingUpdateEvent> promise;
  auto future = promise.get_future();
  engine.notificationBus().subscribe<park::BookingUpdateEvent>(
      [&promise](const park::BookingUpdateEvent& e) {
        if (e.booking.stage == park::domain::BookingStage::Confirmed) {
          promise.set_value(e);
        }
      });
  engine.start();

  run(command("POST", "bookings/create",
              bookingParams("P008", "2025-03-01T12:00:00Z",
                            "2025-03-01T14:00:00Z")));

  ASSERT_EQ(future.wait_for(1s), std::future_status::ready)
      << "BookingUpdateEvent did not reach the notification bus";
  const auto event = future.get();
  EXPECT_EQ(event.booking.space_id, "P008");
  ASSERT_TRUE(event.previous_stage.has_value());
  EXPECT_EQ(*event.previous_stage, park::domain::BookingStage::Priced);
  engine.stop();
}

TEST_F(ParkingEngineTest, MaintenanceCompletesAndBeats) {
  const json created = run(command(
      "POST", "bookings/create",
      bookingParams("P009", "2025-03-01T09:00:00Z", "2025-03-01T10:00:00Z")));
  const std::string ref = created.at("booking").at("booking_reference");
  run(command("POST", "payments/process", {{"booking_reference", ref}}));

  std::promise<park::HeartbeatEvent> promise;
  auto future = promise.get_future();
  engine.notificationBus().subscribe<park::HeartbeatEvent>(
      [&promise](const park::HeartbeatEvent& e) {
        if (e.sequence_id == 1) {
          promise.set_value(e);
        }
      });
  engine.start();

  clock.advance_by(3 * kHour);
  engine.runMaintenance();

  ASSERT_EQ(future.wait_for(1s), std::future_status::ready);
  const auto beat = future.get();
  EXPECT_EQ(beat.component_id, "maintenance");
  EXPECT_EQ(beat.status, "ok completed=1");
  engine.stop();

  const json detail =
      run(command("GET", "bookings/detail", {{"booking_reference", ref}}));
  EXPECT_EQ(detail.at("booking").at("status"), "completed");
}

// -----------------------------------------------------------------------------
// 6. REP socket round trip
// -----------------------------------------------------------------------------
TEST(ParkingEngineIpcTest, AnswersOverRepSocket) {
  park::SimulationTimeProvider clock{kNow};
  auto config = testConfig();
  config.ipc.command_endpoint = "tcp://127.0.0.1:15610";
  config.ipc.telemetry_endpoint = "tcp://127.0.0.1:15611";
  park::ParkingEngine engine(config, clock);
  engine.start();

  zmq::context_t context{1};
  zmq::socket_t client{context, zmq::socket_type::req};
  client.set(zmq::sockopt::rcvtimeo, 2000);
  client.set(zmq::sockopt::linger, 0);
  client.connect(config.ipc.command_endpoint);

  const std::string request = command("GET", "status").dump();
  ASSERT_TRUE(client.send(zmq::buffer(request), zmq::send_flags::none)
                  .has_value());
  zmq::message_t reply;
  const auto received = client.recv(reply, zmq::recv_flags::none);
  engine.stop();

  ASSERT_TRUE(received.has_value()) << "No reply from the command socket";
  const json body = json::parse(reply.to_string());
  EXPECT_EQ(body.at("success"), true);
  EXPECT_EQ(body.at("total"), 10);
}

// -----------------------------------------------------------------------------
// 7. Detector feed: batches published on the SUB endpoint update occupancy.
//    PUB drops messages until the subscription lands, so keep publishing.
// -----------------------------------------------------------------------------
TEST(ParkingEngineIpcTest, IngestsDetectorFeed) {
  constexpr const char* kFeed = "tcp://127.0.0.1:15620";

  zmq::context_t context{1};
  zmq::socket_t detector{context, zmq::socket_type::pub};
  detector.set(zmq::sockopt::linger, 0);
  detector.bind(kFeed);

  park::SimulationTimeProvider clock{kNow};
  auto config = testConfig();
  config.detection.endpoint = kFeed;
  park::ParkingEngine engine(config, clock);
  engine.start();

  const std::string batch =
      R"({"timestamp_ms": 1740816000000, "detections": [)"
      R"({"space_id": "P002", "is_occupied": true, "confidence": 0.9}]})";
  auto occupied = [&engine] {
    return engine.service().status().counts.occupied == 1;
  };
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(3);
  while (!occupied() && std::chrono::steady_clock::now() < deadline) {
    EXPECT_TRUE(detector.send(zmq::buffer(batch), zmq::send_flags::dontwait)
                    .has_value());
    std::this_thread::sleep_for(20ms);
  }
  engine.stop();

  EXPECT_TRUE(occupied()) << "Detector batch never reached the store";
  EXPECT_TRUE(engine.service().status().spaces[1].is_occupied);
}
