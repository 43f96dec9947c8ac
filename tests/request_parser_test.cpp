// =============================================================================
// request_parser_test.cpp
// =============================================================================
// Schema validation at the command boundary. Every malformed input must come
// back as InvalidRequestError before the core sees it.
// =============================================================================

#include "park/api/request_parser.hpp"
#include "park/common/errors.hpp"
#include "park/time/time_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdint>

using nlohmann::json;
using park::api::RequestParser;

namespace {

std::int64_t ms(const char* iso) {
  return park::timestamp_to_ms(*park::parse_iso8601(iso));
}

}  // namespace

// -----------------------------------------------------------------------------
// Envelope
// -----------------------------------------------------------------------------

TEST(RequestParserTest, ParsesCommandEnvelope) {
  const auto cmd = RequestParser::parseCommand(
      R"({"method": "POST", "path": "/bookings/create", "params": {"a": 1}})");
  EXPECT_EQ(cmd.method, "POST");
  EXPECT_EQ(cmd.path, "bookings/create");
  EXPECT_EQ(cmd.params.at("a"), 1);
}

TEST(RequestParserTest, CommandDefaults) {
  const auto cmd = RequestParser::parseCommand(R"({"path": "status"})");
  EXPECT_EQ(cmd.method, "GET");
  EXPECT_TRUE(cmd.params.is_object());
  EXPECT_TRUE(cmd.params.empty());
}

TEST(RequestParserTest, RejectsMalformedCommands) {
  EXPECT_THROW(RequestParser::parseCommand("{not json"),
               park::InvalidRequestError);
  EXPECT_THROW(RequestParser::parseCommand("[1, 2]"), park::InvalidRequestError);
  EXPECT_THROW(RequestParser::parseCommand(R"({"method": "GET"})"),
               park::InvalidRequestError);
  EXPECT_THROW(RequestParser::parseCommand(R"({"path": 7})"),
               park::InvalidRequestError);
  EXPECT_THROW(RequestParser::parseCommand(R"({"path": "status", "params": [1]})"),
               park::InvalidRequestError);
}

// -----------------------------------------------------------------------------
// Occupancy queries
// -----------------------------------------------------------------------------

TEST(RequestParserTest, HistoryAndPredictHours) {
  EXPECT_DOUBLE_EQ(RequestParser::history(json::object()).hours, 24.0);
  EXPECT_DOUBLE_EQ(RequestParser::history({{"hours", 6}}).hours, 6.0);
  EXPECT_DOUBLE_EQ(RequestParser::history({{"hours", "12"}}).hours, 12.0);
  EXPECT_THROW(RequestParser::history({{"hours", "twelve"}}),
               park::InvalidRequestError);

  EXPECT_EQ(RequestParser::predict(json::object()).hours, 6);
  EXPECT_EQ(RequestParser::predict({{"hours", 3}}).hours, 3);
  EXPECT_THROW(RequestParser::predict({{"hours", 2.5}}),
               park::InvalidRequestError);
}

// Spans are bounded before they reach any timestamp arithmetic.
TEST(RequestParserTest, HoursOutOfRangeRejected) {
  EXPECT_DOUBLE_EQ(RequestParser::history({{"hours", 744}}).hours, 744.0);
  EXPECT_EQ(RequestParser::predict({{"hours", 168}}).hours, 168);

  const json bad_history[] = {
      {{"hours", 0}},       {{"hours", -2}},      {{"hours", "inf"}},
      {{"hours", "nan"}},   {{"hours", 1e300}},   {{"hours", "1e300"}},
      {{"hours", 1e8}},     {{"hours", 745}},
  };
  for (const auto& params : bad_history) {
    EXPECT_THROW(RequestParser::history(params), park::InvalidRequestError)
        << params.dump();
  }

  const json bad_predict[] = {
      {{"hours", 0}},     {{"hours", "inf"}}, {{"hours", 1e20}},
      {{"hours", 1e300}}, {{"hours", 169}},
  };
  for (const auto& params : bad_predict) {
    EXPECT_THROW(RequestParser::predict(params), park::InvalidRequestError)
        << params.dump();
  }
}

TEST(RequestParserTest, RecentEventsLimitBounds) {
  EXPECT_EQ(RequestParser::recentEvents(json::object()).limit, 50u);
  EXPECT_EQ(RequestParser::recentEvents({{"limit", 1000}}).limit, 1000u);
  EXPECT_THROW(RequestParser::recentEvents({{"limit", 0}}),
               park::InvalidRequestError);
  EXPECT_THROW(RequestParser::recentEvents({{"limit", 1001}}),
               park::InvalidRequestError);
}

TEST(RequestParserTest, SpaceAcceptsLegacyName) {
  EXPECT_EQ(RequestParser::space({{"space_id", "P001"}}).space_id, "P001");
  EXPECT_EQ(RequestParser::space({{"space_number", "P002"}}).space_id, "P002");
  EXPECT_THROW(RequestParser::space(json::object()), park::InvalidRequestError);
  EXPECT_THROW(RequestParser::space({{"space_id", 1}}), park::InvalidRequestError);
}

TEST(RequestParserTest, SpaceUpdateRequiresBoolean) {
  const auto req = RequestParser::spaceUpdate(
      {{"space_id", "P004"}, {"is_occupied", true}, {"vehicle_type", "truck"},
       {"confidence", 0.7}});
  EXPECT_EQ(req.space_id, "P004");
  EXPECT_TRUE(req.is_occupied);
  ASSERT_TRUE(req.vehicle_type.has_value());
  EXPECT_EQ(*req.vehicle_type, park::domain::VehicleType::Truck);
  EXPECT_DOUBLE_EQ(req.confidence, 0.7);

  EXPECT_THROW(RequestParser::spaceUpdate({{"space_id", "P004"}}),
               park::InvalidRequestError);
  EXPECT_THROW(
      RequestParser::spaceUpdate({{"space_id", "P004"}, {"is_occupied", "yes"}}),
      park::InvalidRequestError);
  EXPECT_THROW(RequestParser::spaceUpdate({{"space_id", "P004"},
                                           {"is_occupied", true},
                                           {"vehicle_type", "spaceship"}}),
               park::InvalidRequestError);
}

// -----------------------------------------------------------------------------
// Booking commands
// -----------------------------------------------------------------------------

TEST(RequestParserTest, AvailabilityParsesTimes) {
  const auto req = RequestParser::availability(
      {{"start_time", "2025-03-01T10:00:00Z"},
       {"end_time", "2025-03-01T12:00:00"},
       {"vehicle_type", "motorcycle"}});
  EXPECT_EQ(park::timestamp_to_ms(req.start_time), ms("2025-03-01T10:00:00Z"));
  EXPECT_EQ(park::timestamp_to_ms(req.end_time), ms("2025-03-01T12:00:00Z"));
  ASSERT_TRUE(req.vehicle_type.has_value());
  EXPECT_EQ(*req.vehicle_type, park::domain::VehicleType::Motorcycle);

  // end <= start is a core decision, not a schema one.
  EXPECT_NO_THROW(RequestParser::availability(
      {{"start_time", "2025-03-01T12:00:00Z"},
       {"end_time", "2025-03-01T10:00:00Z"}}));

  EXPECT_THROW(RequestParser::availability({{"start_time", "2025-03-01T10:00:00Z"}}),
               park::InvalidRequestError);
  EXPECT_THROW(RequestParser::availability(
                   {{"start_time", "yesterday"}, {"end_time", "today"}}),
               park::InvalidRequestError);
}

TEST(RequestParserTest, CreateBookingCollectsCustomer) {
  const auto req = RequestParser::createBooking(
      {{"space_id", "P007"},
       {"start_time", "2025-03-01T10:00:00Z"},
       {"end_time", "2025-03-01T12:00:00Z"},
       {"customer_name", "Ada Driver"},
       {"customer_email", "ada@example.com"},
       {"vehicle_number", "ABC-123"},
       {"notes", "near exit"}});
  EXPECT_EQ(req.space_id, "P007");
  EXPECT_EQ(req.customer.name, "Ada Driver");
  EXPECT_EQ(req.customer.email, "ada@example.com");
  EXPECT_EQ(req.customer.phone, "");
  EXPECT_EQ(req.customer.vehicle_number, "ABC-123");
  EXPECT_EQ(req.customer.vehicle_type, park::domain::VehicleType::Car);
  EXPECT_EQ(req.customer.notes, "near exit");

  // Missing customer fields are left for the core to reject.
  EXPECT_NO_THROW(RequestParser::createBooking(
      {{"space_id", "P007"},
       {"start_time", "2025-03-01T10:00:00Z"},
       {"end_time", "2025-03-01T12:00:00Z"}}));
  EXPECT_THROW(RequestParser::createBooking(
                   {{"space_id", "P007"},
                    {"start_time", "2025-03-01T10:00:00Z"},
                    {"end_time", "2025-03-01T12:00:00Z"},
                    {"customer_email", 42}}),
               park::InvalidRequestError);
}

TEST(RequestParserTest, PaymentAndReferences) {
  const auto pay = RequestParser::processPayment({{"booking_reference", "BK1"}});
  EXPECT_EQ(pay.booking_reference, "BK1");
  EXPECT_EQ(pay.payment_method, "card");
  EXPECT_EQ(RequestParser::processPayment(
                {{"booking_reference", "BK1"}, {"payment_method", "wallet"}})
                .payment_method,
            "wallet");
  EXPECT_THROW(RequestParser::processPayment(json::object()),
               park::InvalidRequestError);

  EXPECT_EQ(RequestParser::bookingReference({{"booking_reference", "BK2"}})
                .booking_reference,
            "BK2");
  EXPECT_EQ(RequestParser::paymentReference({{"payment_reference", "PAY1"}})
                .payment_reference,
            "PAY1");
  EXPECT_THROW(RequestParser::paymentReference(json::object()),
               park::InvalidRequestError);
}

TEST(RequestParserTest, BookingFilter) {
  const auto filter = RequestParser::bookingFilter(
      {{"status", "confirmed"}, {"from_date", "2025-03-01T00:00:00Z"},
       {"limit", 10}});
  ASSERT_TRUE(filter.status.has_value());
  EXPECT_EQ(*filter.status, park::domain::BookingStatus::Confirmed);
  ASSERT_TRUE(filter.starting_from.has_value());
  EXPECT_EQ(park::timestamp_to_ms(*filter.starting_from),
            ms("2025-03-01T00:00:00Z"));
  EXPECT_EQ(filter.limit, 10u);

  EXPECT_EQ(RequestParser::bookingFilter(json::object()).limit, 100u);
  EXPECT_THROW(RequestParser::bookingFilter({{"status", "lost"}}),
               park::InvalidRequestError);
  EXPECT_THROW(RequestParser::bookingFilter({{"limit", 500}}),
               park::InvalidRequestError);
}

// -----------------------------------------------------------------------------
// Detector batches
// -----------------------------------------------------------------------------

TEST(RequestParserTest, DetectionBatchTimestamps) {
  const auto now = park::ms_to_timestamp(ms("2025-03-01T10:00:00Z"));
  const json detections = json::array(
      {{{"space_id", "P001"}, {"is_occupied", true}, {"confidence", 0.8}},
       {{"space_number", "P002"}, {"is_occupied", false}}});

  const auto defaulted =
      RequestParser::detectionBatch({{"detections", detections}}, now);
  EXPECT_EQ(defaulted.captured_at, now);
  ASSERT_EQ(defaulted.detections.size(), 2u);
  EXPECT_EQ(defaulted.detections[0].space_id, "P001");
  EXPECT_DOUBLE_EQ(defaulted.detections[0].confidence, 0.8);
  EXPECT_EQ(defaulted.detections[1].space_id, "P002");
  EXPECT_DOUBLE_EQ(defaulted.detections[1].confidence, 1.0);

  const auto by_ms = RequestParser::detectionBatch(
      {{"timestamp_ms", 1'700'000'000'000}, {"detections", detections}}, now);
  EXPECT_EQ(park::timestamp_to_ms(by_ms.captured_at), 1'700'000'000'000);

  const auto by_iso = RequestParser::detectionBatch(
      {{"timestamp", "2025-03-01T09:59:00Z"}, {"detections", detections}}, now);
  EXPECT_EQ(park::timestamp_to_ms(by_iso.captured_at),
            ms("2025-03-01T09:59:00Z"));
}

TEST(RequestParserTest, DetectionBatchIsStrict) {
  const auto now = park::ms_to_timestamp(0);
  EXPECT_THROW(RequestParser::detectionBatch(json::object(), now),
               park::InvalidRequestError);
  EXPECT_THROW(RequestParser::detectionBatch({{"detections", "none"}}, now),
               park::InvalidRequestError);
  EXPECT_THROW(RequestParser::detectionBatch(
                   {{"detections", json::array({json::array({1})})}}, now),
               park::InvalidRequestError);
  EXPECT_THROW(
      RequestParser::detectionBatch(
          {{"detections", json::array({{{"space_id", "P001"}}})}}, now),
      park::InvalidRequestError);
  EXPECT_THROW(RequestParser::detectionBatch(
                   {{"timestamp_ms", 1.5}, {"detections", json::array()}}, now),
               park::InvalidRequestError);
}
