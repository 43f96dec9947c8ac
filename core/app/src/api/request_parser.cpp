#include "park/api/request_parser.hpp"

#include "park/common/errors.hpp"
#include "park/forecast/forecast_features.hpp"
#include "park/history/history_aggregator.hpp"
#include "park/time/time_utils.hpp"

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace park {
namespace api {

namespace {

using nlohmann::json;

const json* field(const json& params, const char* name) {
  auto it = params.find(name);
  if (it == params.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

std::string requireString(const json& params, const char* name) {
  const json* v = field(params, name);
  if (v == nullptr) {
    throw InvalidRequestError(std::string(name) + " is required");
  }
  if (!v->is_string()) {
    throw InvalidRequestError(std::string(name) + " must be a string");
  }
  return v->get<std::string>();
}

std::string optionalString(const json& params, const char* name,
                           const std::string& fallback = "") {
  const json* v = field(params, name);
  if (v == nullptr) {
    return fallback;
  }
  if (!v->is_string()) {
    throw InvalidRequestError(std::string(name) + " must be a string");
  }
  return v->get<std::string>();
}

double optionalNumber(const json& params, const char* name, double fallback) {
  const json* v = field(params, name);
  if (v == nullptr) {
    return fallback;
  }
  if (v->is_number()) {
    return v->get<double>();
  }
  // Query-string style callers send numbers as text.
  if (v->is_string()) {
    try {
      std::size_t used = 0;
      const std::string text = v->get<std::string>();
      double value = std::stod(text, &used);
      if (used == text.size()) {
        return value;
      }
    } catch (const std::logic_error&) {
      // Falls through to the error below.
    }
  }
  throw InvalidRequestError(std::string(name) + " must be a number");
}

std::optional<domain::VehicleType> optionalVehicle(const json& params,
                                                   const char* name) {
  const std::string text = optionalString(params, name);
  if (text.empty()) {
    return std::nullopt;
  }
  auto type = domain::parseVehicleType(text);
  if (!type) {
    throw InvalidRequestError(std::string(name) + " unknown: " + text);
  }
  return type;
}

// Accepts "space_id" and the older "space_number".
domain::SpaceId requireSpace(const json& params) {
  if (field(params, "space_id") == nullptr &&
      field(params, "space_number") != nullptr) {
    return requireString(params, "space_number");
  }
  return requireString(params, "space_id");
}

void requireObject(const json& params) {
  if (!params.is_object()) {
    throw InvalidRequestError("params must be a JSON object");
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// parseCommand()
// -----------------------------------------------------------------------------
Command RequestParser::parseCommand(const std::string& raw) {
  json j;
  try {
    j = json::parse(raw);
  } catch (const json::parse_error& e) {
    throw InvalidRequestError(std::string("Malformed JSON command: ") +
                              e.what());
  }
  if (!j.is_object()) {
    throw InvalidRequestError("Command must be a JSON object");
  }

  Command command;
  command.method = optionalString(j, "method", "GET");
  command.path = requireString(j, "path");
  while (!command.path.empty() && command.path.front() == '/') {
    command.path.erase(command.path.begin());
  }
  if (const json* params = field(j, "params")) {
    requireObject(*params);
    command.params = *params;
  }
  return command;
}

Timestamp RequestParser::timestamp(const nlohmann::json& params,
                                   const char* name) {
  const std::string text = requireString(params, name);
  auto parsed = parse_iso8601(text);
  if (!parsed) {
    throw InvalidRequestError(std::string(name) +
                              " is not an ISO-8601 date-time: " + text);
  }
  return *parsed;
}

HistoryRequest RequestParser::history(const nlohmann::json& params) {
  requireObject(params);
  HistoryRequest request;
  const double hours = optionalNumber(params, "hours", request.hours);
  if (!std::isfinite(hours) || hours <= 0.0 ||
      hours > HistoryAggregator::kMaxTrailingHours) {
    throw InvalidRequestError(
        "hours must be greater than 0 and at most " +
        std::to_string(static_cast<int>(HistoryAggregator::kMaxTrailingHours)));
  }
  request.hours = hours;
  return request;
}

PredictRequest RequestParser::predict(const nlohmann::json& params) {
  requireObject(params);
  PredictRequest request;
  const double hours = optionalNumber(params, "hours", request.hours);
  if (!std::isfinite(hours) || hours < 1.0 ||
      hours > forecast::kMaxHorizonHours) {
    throw InvalidRequestError("hours must be between 1 and " +
                              std::to_string(forecast::kMaxHorizonHours));
  }
  if (hours != std::floor(hours)) {
    throw InvalidRequestError("hours must be a whole number");
  }
  request.hours = static_cast<int>(hours);
  return request;
}

AvailabilityRequest RequestParser::availability(const nlohmann::json& params) {
  requireObject(params);
  AvailabilityRequest request;
  request.start_time = timestamp(params, "start_time");
  request.end_time = timestamp(params, "end_time");
  request.vehicle_type = optionalVehicle(params, "vehicle_type");
  return request;
}

QuoteRequest RequestParser::quote(const nlohmann::json& params) {
  requireObject(params);
  QuoteRequest request;
  request.space_id = requireSpace(params);
  request.start_time = timestamp(params, "start_time");
  request.end_time = timestamp(params, "end_time");
  return request;
}

CreateBookingRequest RequestParser::createBooking(
    const nlohmann::json& params) {
  requireObject(params);
  CreateBookingRequest request;
  request.space_id = requireSpace(params);
  request.start_time = timestamp(params, "start_time");
  request.end_time = timestamp(params, "end_time");

  // Emptiness is the core's call (InvalidCustomerDataError); only types
  // are checked here.
  domain::CustomerDetails& c = request.customer;
  c.name = optionalString(params, "customer_name");
  c.email = optionalString(params, "customer_email");
  c.phone = optionalString(params, "customer_phone");
  c.vehicle_number = optionalString(params, "vehicle_number");
  c.vehicle_type =
      optionalVehicle(params, "vehicle_type").value_or(domain::VehicleType::Car);
  c.notes = optionalString(params, "notes");
  return request;
}

ProcessPaymentRequest RequestParser::processPayment(
    const nlohmann::json& params) {
  requireObject(params);
  ProcessPaymentRequest request;
  request.booking_reference = requireString(params, "booking_reference");
  request.payment_method =
      optionalString(params, "payment_method", request.payment_method);
  return request;
}

BookingReferenceRequest RequestParser::bookingReference(
    const nlohmann::json& params) {
  requireObject(params);
  return BookingReferenceRequest{requireString(params, "booking_reference")};
}

PaymentReferenceRequest RequestParser::paymentReference(
    const nlohmann::json& params) {
  requireObject(params);
  return PaymentReferenceRequest{requireString(params, "payment_reference")};
}

BookingFilter RequestParser::bookingFilter(const nlohmann::json& params) {
  requireObject(params);
  BookingFilter filter;
  const std::string status = optionalString(params, "status");
  if (!status.empty()) {
    filter.status = domain::parseBookingStatus(status);
    if (!filter.status) {
      throw InvalidRequestError("status unknown: " + status);
    }
  }
  if (field(params, "from_date") != nullptr) {
    filter.starting_from = timestamp(params, "from_date");
  }
  const double limit =
      optionalNumber(params, "limit", static_cast<double>(filter.limit));
  if (limit < 1.0 || limit > 100.0) {
    throw InvalidRequestError("limit must be between 1 and 100");
  }
  filter.limit = static_cast<std::size_t>(limit);
  return filter;
}

SpaceRequest RequestParser::space(const nlohmann::json& params) {
  requireObject(params);
  return SpaceRequest{requireSpace(params)};
}

RecentEventsRequest RequestParser::recentEvents(const nlohmann::json& params) {
  requireObject(params);
  RecentEventsRequest request;
  const double limit =
      optionalNumber(params, "limit", static_cast<double>(request.limit));
  if (limit < 1.0 || limit > 1000.0) {
    throw InvalidRequestError("limit must be between 1 and 1000");
  }
  request.limit = static_cast<std::size_t>(limit);
  return request;
}

SpaceUpdateRequest RequestParser::spaceUpdate(const nlohmann::json& params) {
  requireObject(params);
  SpaceUpdateRequest request;
  request.space_id = requireSpace(params);
  const json* occupied = field(params, "is_occupied");
  if (occupied == nullptr || !occupied->is_boolean()) {
    throw InvalidRequestError("is_occupied is required and must be a boolean");
  }
  request.is_occupied = occupied->get<bool>();
  request.vehicle_type = optionalVehicle(params, "vehicle_type");
  request.confidence = optionalNumber(params, "confidence", 1.0);
  return request;
}

// -----------------------------------------------------------------------------
// detectionBatch(): shared by the command surface and the SUB gateway
// -----------------------------------------------------------------------------
DetectionBatch RequestParser::detectionBatch(const nlohmann::json& params,
                                             Timestamp now) {
  requireObject(params);
  DetectionBatch batch;
  batch.captured_at = now;
  if (const json* ms = field(params, "timestamp_ms")) {
    if (!ms->is_number_integer()) {
      throw InvalidRequestError("timestamp_ms must be an integer");
    }
    batch.captured_at = ms_to_timestamp(ms->get<std::int64_t>());
  } else if (field(params, "timestamp") != nullptr) {
    batch.captured_at = timestamp(params, "timestamp");
  }

  const json* detections = field(params, "detections");
  if (detections == nullptr || !detections->is_array()) {
    throw InvalidRequestError("detections is required and must be an array");
  }
  for (const json& entry : *detections) {
    if (!entry.is_object()) {
      throw InvalidRequestError("detections entries must be objects");
    }
    Detection detection;
    detection.space_id = requireSpace(entry);
    const json* occupied = field(entry, "is_occupied");
    if (occupied == nullptr || !occupied->is_boolean()) {
      throw InvalidRequestError("detections[].is_occupied must be a boolean");
    }
    detection.is_occupied = occupied->get<bool>();
    detection.confidence = optionalNumber(entry, "confidence", 1.0);
    detection.vehicle_type = optionalVehicle(entry, "vehicle_type");
    batch.detections.push_back(std::move(detection));
  }
  return batch;
}

}  // namespace api
}  // namespace park
