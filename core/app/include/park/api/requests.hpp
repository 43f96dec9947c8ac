#pragma once

#include "park/booking/booking_engine.hpp"
#include "park/domain/booking.hpp"
#include "park/domain/occupancy.hpp"
#include "park/domain/vehicle_type.hpp"
#include "park/events/event_types.hpp"
#include "park/occupancy/i_occupancy_detector.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace park {
namespace api {

// -----------------------------------------------------------------------------
// Boundary request schemas
// -----------------------------------------------------------------------------
// Every JSON command is parsed into one of these structs by RequestParser
// before anything in the core runs. Field names follow the wire names.
// -----------------------------------------------------------------------------

// Envelope: {"method": "GET", "path": "bookings/available", "params": {...}}
struct Command {
  std::string method;
  std::string path;
  nlohmann::json params = nlohmann::json::object();
};

struct HistoryRequest {
  double hours{24.0};
};

struct PredictRequest {
  int hours{6};
};

struct AvailabilityRequest {
  Timestamp start_time{};
  Timestamp end_time{};
  std::optional<domain::VehicleType> vehicle_type;
};

struct QuoteRequest {
  domain::SpaceId space_id;
  Timestamp start_time{};
  Timestamp end_time{};
};

struct CreateBookingRequest {
  domain::SpaceId space_id;
  Timestamp start_time{};
  Timestamp end_time{};
  domain::CustomerDetails customer;
};

struct ProcessPaymentRequest {
  domain::BookingReference booking_reference;
  std::string payment_method{"card"};
};

struct BookingReferenceRequest {
  domain::BookingReference booking_reference;
};

struct PaymentReferenceRequest {
  domain::PaymentReference payment_reference;
};

struct SpaceRequest {
  domain::SpaceId space_id;
};

struct RecentEventsRequest {
  std::size_t limit{50};
};

struct SpaceUpdateRequest {
  domain::SpaceId space_id;
  bool is_occupied{false};
  std::optional<domain::VehicleType> vehicle_type;
  double confidence{1.0};
};

}  // namespace api
}  // namespace park
