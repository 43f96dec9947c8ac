#pragma once

#include "park/booking/booking_engine.hpp"
#include "park/common/errors.hpp"
#include "park/domain/booking.hpp"
#include "park/domain/occupancy.hpp"
#include "park/domain/parking_space.hpp"
#include "park/domain/payment.hpp"
#include "park/events/event.hpp"
#include "park/occupancy/detection_ingestor.hpp"
#include "park/pricing/pricing_calculator.hpp"
#include "park/service/parking_service.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace park {
namespace api {

// -----------------------------------------------------------------------------
// ResponseFormatter: typed results -> JSON
// -----------------------------------------------------------------------------
//
// @brief  Renders ParkingService results, errors and telemetry events as
//         the JSON the command and telemetry sockets carry.
//
// @details
// Successful command replies are objects with "success": true plus the
// operation's fields. Failures use one envelope:
//
//   {"success": false, "error": "<message>", "error_code": "slot_taken",
//    "status": 409}
//
// status is an HTTP-like code so existing dashboards can reuse their
// handling: 400 validation, 402 payment declined, 404 not found,
// 409 slot taken or illegal state, 503 no prediction available,
// 504 payment timeout.
//
// Timestamps are ISO-8601 UTC strings. Occupancy rates are fractions in
// [0,1].
//
// Thread model: Stateless, safe from any thread.
// -----------------------------------------------------------------------------
class ResponseFormatter {
 public:
  static nlohmann::json toJson(const domain::ParkingSpace& space);
  static nlohmann::json toJson(const domain::OccupancySnapshot& snapshot);
  static nlohmann::json toJson(const domain::OccupancyEvent& event);
  static nlohmann::json toJson(const domain::OccupancyCounts& counts);
  static nlohmann::json toJson(const domain::OccupancyBucket& bucket);
  static nlohmann::json toJson(const domain::Booking& booking);
  static nlohmann::json toJson(const domain::PaymentRecord& payment);
  static nlohmann::json toJson(const PriceQuote& quote);
  static nlohmann::json toJson(const IngestReport& report);

  // Forecast points carry predicted counts derived from the lot size.
  static nlohmann::json toJson(const domain::ForecastPoint& point,
                               std::size_t total_spaces);

  static nlohmann::json status(const StatusReport& report);
  static nlohmann::json history(const HistoryReport& report);
  static nlohmann::json forecast(const ForecastReport& report);
  static nlohmann::json availability(const AvailabilityReport& report);
  static nlohmann::json quote(const PriceQuote& quote);
  static nlohmann::json booking(const domain::Booking& booking);
  static nlohmann::json bookings(const std::vector<domain::Booking>& bookings);
  static nlohmann::json payment(const PaymentOutcome& outcome);
  static nlohmann::json paymentDetail(const domain::PaymentRecord& payment);
  static nlohmann::json spaceDetail(const SpaceDetail& detail);
  static nlohmann::json events(const std::vector<domain::OccupancyEvent>& events);
  static nlohmann::json statistics(const StatisticsSummary& summary);
  static nlohmann::json spaceUpdate(const RecordedEvent& recorded);
  static nlohmann::json ingest(const IngestReport& report);

  // Error envelope for a core or boundary error.
  static nlohmann::json error(const Error& e);
  static nlohmann::json error(ErrorKind kind, const std::string& message);

  // Anything that is not a park::Error: "internal_error", status 500.
  static nlohmann::json internalError(const std::string& message);

  static nlohmann::json pong(Timestamp now);

  static const char* errorCode(ErrorKind kind);
  static int httpStatus(ErrorKind kind);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @brief  JSON for the PUB socket, tagged with "type" ("occupancy_update",
  //         "booking_update", "payment_update", "heartbeat").
  //
  // @return std::nullopt if the variant holds no alternative.
  // -------------------------------------------------------------------------
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static nlohmann::json ok(nlohmann::json body = nlohmann::json::object());
};

}  // namespace api
}  // namespace park
