#pragma once

#include "park/api/requests.hpp"
#include "park/booking/booking_engine.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace park {
namespace api {

// -----------------------------------------------------------------------------
// RequestParser: raw JSON -> typed request structs
// -----------------------------------------------------------------------------
//
// @brief  Static schema validation for the command surface.
//
// @details
// Every function throws InvalidRequestError naming the offending field
// when a required field is missing, has the wrong JSON type, or holds an
// unparsable value (timestamps must be ISO-8601, vehicle types one of
// car/motorcycle/truck/bus/bicycle). Nothing here touches engine state;
// semantic checks (end after start, policy, availability) stay in the core.
//
// `now` is used only for defaults (a detector batch without a timestamp is
// stamped with the current time).
// -----------------------------------------------------------------------------
class RequestParser {
 public:
  // @throws InvalidRequestError on malformed JSON or a missing method/path.
  static Command parseCommand(const std::string& raw);

  static HistoryRequest history(const nlohmann::json& params);
  static PredictRequest predict(const nlohmann::json& params);
  static AvailabilityRequest availability(const nlohmann::json& params);
  static QuoteRequest quote(const nlohmann::json& params);
  static CreateBookingRequest createBooking(const nlohmann::json& params);
  static ProcessPaymentRequest processPayment(const nlohmann::json& params);
  static BookingReferenceRequest bookingReference(const nlohmann::json& params);
  static PaymentReferenceRequest paymentReference(const nlohmann::json& params);
  static BookingFilter bookingFilter(const nlohmann::json& params);
  static SpaceRequest space(const nlohmann::json& params);
  static RecentEventsRequest recentEvents(const nlohmann::json& params);
  static SpaceUpdateRequest spaceUpdate(const nlohmann::json& params);

  // {"timestamp": ISO-8601 | "timestamp_ms": int, "detections": [...]}
  static DetectionBatch detectionBatch(const nlohmann::json& params,
                                       Timestamp now);

  // @throws InvalidRequestError
  static Timestamp timestamp(const nlohmann::json& params, const char* field);
};

}  // namespace api
}  // namespace park
