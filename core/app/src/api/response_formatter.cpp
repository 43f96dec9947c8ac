#include "park/api/response_formatter.hpp"

#include "park/time/time_utils.hpp"

#include <cmath>
#include <utility>

namespace park {
namespace api {

namespace {

using nlohmann::json;

json optionalVehicle(const std::optional<domain::VehicleType>& type) {
  return type ? json(domain::toString(*type)) : json(nullptr);
}

json optionalText(const std::string& text) {
  return text.empty() ? json(nullptr) : json(text);
}

}  // namespace

json ResponseFormatter::ok(json body) {
  body["success"] = true;
  return body;
}

// -----------------------------------------------------------------------------
// Domain values
// -----------------------------------------------------------------------------
json ResponseFormatter::toJson(const domain::ParkingSpace& space) {
  json j;
  j["space_id"] = space.id;
  j["row"] = space.row;
  j["column"] = space.column;
  j["hourly_rate"] = space.hourly_rate;
  j["vehicle_restriction"] = optionalVehicle(space.vehicle_restriction);
  return j;
}

json ResponseFormatter::toJson(const domain::OccupancySnapshot& snapshot) {
  json j;
  j["space_id"] = snapshot.space_id;
  j["is_occupied"] = snapshot.is_occupied;
  j["last_updated"] = format_iso8601(snapshot.last_updated);
  j["vehicle_type"] = optionalVehicle(snapshot.vehicle_type);
  return j;
}

json ResponseFormatter::toJson(const domain::OccupancyEvent& event) {
  json j;
  j["sequence_id"] = event.sequence_id;
  j["space_id"] = event.space_id;
  j["event_type"] = domain::toString(event.type);
  j["timestamp"] = format_iso8601(event.timestamp);
  j["vehicle_type"] = optionalVehicle(event.vehicle_type);
  j["confidence"] = event.confidence;
  return j;
}

json ResponseFormatter::toJson(const domain::OccupancyCounts& counts) {
  json j;
  j["total"] = counts.total;
  j["occupied"] = counts.occupied;
  j["available"] = counts.available;
  j["occupancy_rate"] = counts.occupancyRate();
  return j;
}

json ResponseFormatter::toJson(const domain::OccupancyBucket& bucket) {
  json j;
  j["window_start"] = format_iso8601(bucket.window_start);
  j["window_end"] = format_iso8601(bucket.window_end);
  j["occupied_count"] = bucket.occupied_count;
  j["available_count"] = bucket.available_count;
  j["occupancy_rate"] = bucket.occupancyRate();
  return j;
}

json ResponseFormatter::toJson(const domain::ForecastPoint& point,
                               std::size_t total_spaces) {
  const auto occupied = static_cast<std::size_t>(std::lround(
      point.predicted_occupancy_rate * static_cast<double>(total_spaces)));
  json j;
  j["timestamp"] = format_iso8601(point.timestamp);
  j["predicted_occupancy_rate"] = point.predicted_occupancy_rate;
  j["predicted_occupied"] = occupied;
  j["predicted_available"] = total_spaces - occupied;
  return j;
}

json ResponseFormatter::toJson(const domain::Booking& booking) {
  json j;
  j["booking_reference"] = booking.reference;
  j["space_id"] = booking.space_id;
  j["start_time"] = format_iso8601(booking.interval.start);
  j["end_time"] = format_iso8601(booking.interval.end);
  j["duration_hours"] =
      hours_between(booking.interval.start, booking.interval.end);
  j["customer_name"] = booking.customer.name;
  j["customer_email"] = booking.customer.email;
  j["customer_phone"] = optionalText(booking.customer.phone);
  j["vehicle_number"] = booking.customer.vehicle_number;
  j["vehicle_type"] = domain::toString(booking.customer.vehicle_type);
  j["notes"] = optionalText(booking.customer.notes);
  j["total_amount"] = booking.total_amount;
  j["status"] = domain::toString(booking.status);
  j["stage"] = domain::toString(booking.stage);
  j["payment_status"] = domain::toString(booking.payment_status);
  j["payment_reference"] = optionalText(booking.payment_reference);
  j["created_at"] = format_iso8601(booking.created_at);
  j["updated_at"] = format_iso8601(booking.updated_at);
  return j;
}

json ResponseFormatter::toJson(const domain::PaymentRecord& payment) {
  json j;
  j["payment_reference"] = payment.reference;
  j["booking_reference"] = payment.booking_reference;
  j["amount"] = payment.amount;
  j["currency"] = payment.currency;
  j["method"] = payment.method;
  j["gateway"] = payment.gateway;
  j["transaction_id"] = optionalText(payment.transaction_id);
  j["status"] = domain::toString(payment.status);
  j["failure_reason"] = optionalText(payment.failure_reason);
  j["created_at"] = format_iso8601(payment.created_at);
  j["completed_at"] = payment.completed_at
                          ? json(format_iso8601(*payment.completed_at))
                          : json(nullptr);
  return j;
}

json ResponseFormatter::toJson(const PriceQuote& quote) {
  json j;
  j["space_id"] = quote.space_id;
  j["duration_hours"] = quote.duration_hours;
  j["hourly_rate"] = quote.hourly_rate;
  j["total_cost"] = quote.total_cost;
  j["currency"] = quote.currency;
  return j;
}

json ResponseFormatter::toJson(const IngestReport& report) {
  json rejections = json::array();
  for (const auto& r : report.rejections) {
    json entry;
    entry["space_id"] = r.space_id;
    entry["reason"] = r.reason;
    rejections.push_back(std::move(entry));
  }
  json j;
  j["accepted"] = report.accepted;
  j["rejected"] = report.rejected;
  j["rejections"] = std::move(rejections);
  return j;
}

// -----------------------------------------------------------------------------
// Command replies
// -----------------------------------------------------------------------------
json ResponseFormatter::status(const StatusReport& report) {
  json spaces = json::array();
  for (const auto& snapshot : report.spaces) {
    spaces.push_back(toJson(snapshot));
  }
  json j = toJson(report.counts);
  j["timestamp"] = format_iso8601(report.as_of);
  j["spaces"] = std::move(spaces);
  return ok(std::move(j));
}

json ResponseFormatter::history(const HistoryReport& report) {
  json buckets = json::array();
  for (const auto& bucket : report.buckets) {
    buckets.push_back(toJson(bucket));
  }
  json j;
  j["hours"] = report.hours;
  j["window_minutes"] = report.window.count();
  j["history"] = std::move(buckets);
  return ok(std::move(j));
}

json ResponseFormatter::forecast(const ForecastReport& report) {
  json points = json::array();
  for (const auto& point : report.points) {
    points.push_back(toJson(point, report.total_spaces));
  }
  json j;
  j["model"] = report.model;
  j["hours"] = report.hours;
  j["history_buckets"] = report.history_buckets;
  j["predictions"] = std::move(points);
  return ok(std::move(j));
}

json ResponseFormatter::availability(const AvailabilityReport& report) {
  json spaces = json::array();
  for (const auto& hit : report.spaces) {
    json entry = toJson(hit.space);
    entry["total_cost"] = hit.quote.total_cost;
    entry["currency"] = hit.quote.currency;
    spaces.push_back(std::move(entry));
  }
  json j;
  j["start_time"] = format_iso8601(report.start_time);
  j["end_time"] = format_iso8601(report.end_time);
  j["count"] = report.spaces.size();
  j["available_spaces"] = std::move(spaces);
  return ok(std::move(j));
}

json ResponseFormatter::quote(const PriceQuote& quote) {
  return ok(toJson(quote));
}

json ResponseFormatter::booking(const domain::Booking& booking) {
  json j;
  j["booking"] = toJson(booking);
  return ok(std::move(j));
}

json ResponseFormatter::bookings(const std::vector<domain::Booking>& bookings) {
  json list = json::array();
  for (const auto& b : bookings) {
    list.push_back(toJson(b));
  }
  json j;
  j["count"] = bookings.size();
  j["bookings"] = std::move(list);
  return ok(std::move(j));
}

json ResponseFormatter::payment(const PaymentOutcome& outcome) {
  json j;
  j["payment_reference"] = outcome.payment.reference;
  j["transaction_id"] = outcome.payment.transaction_id;
  j["amount"] = outcome.payment.amount;
  j["currency"] = outcome.payment.currency;
  j["booking"] = toJson(outcome.booking);
  return ok(std::move(j));
}

json ResponseFormatter::paymentDetail(const domain::PaymentRecord& payment) {
  json j;
  j["payment"] = toJson(payment);
  return ok(std::move(j));
}

json ResponseFormatter::spaceDetail(const SpaceDetail& detail) {
  json recent = json::array();
  for (const auto& e : detail.recent_events) {
    recent.push_back(toJson(e));
  }
  json j;
  j["space"] = toJson(detail.space);
  j["occupancy"] = toJson(detail.snapshot);
  j["recent_events"] = std::move(recent);
  return ok(std::move(j));
}

json ResponseFormatter::events(const std::vector<domain::OccupancyEvent>& events) {
  json list = json::array();
  for (const auto& e : events) {
    list.push_back(toJson(e));
  }
  json j;
  j["count"] = events.size();
  j["events"] = std::move(list);
  return ok(std::move(j));
}

json ResponseFormatter::statistics(const StatisticsSummary& summary) {
  json j;
  j["current"] = toJson(summary.counts);
  j["date"] = format_iso8601(summary.day_start).substr(0, 10);
  j["entries_today"] = summary.entries_today;
  j["exits_today"] = summary.exits_today;
  j["average_occupancy_rate"] = summary.average_occupancy_rate;
  j["peak_occupancy_rate"] = summary.peak_occupancy_rate;
  return ok(std::move(j));
}

json ResponseFormatter::spaceUpdate(const RecordedEvent& recorded) {
  json j;
  j["event"] = toJson(recorded.event);
  j["occupancy"] = toJson(recorded.snapshot);
  j["previous_occupied"] = recorded.previous_occupied;
  return ok(std::move(j));
}

json ResponseFormatter::ingest(const IngestReport& report) {
  return ok(toJson(report));
}

// -----------------------------------------------------------------------------
// Errors
// -----------------------------------------------------------------------------
const char* ResponseFormatter::errorCode(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidInterval:     return "invalid_interval";
    case ErrorKind::InvalidSpace:        return "invalid_space";
    case ErrorKind::NotFound:            return "not_found";
    case ErrorKind::SlotTaken:           return "slot_taken";
    case ErrorKind::InvalidCustomerData: return "invalid_customer_data";
    case ErrorKind::InsufficientHistory: return "insufficient_history";
    case ErrorKind::PaymentFailed:       return "payment_failed";
    case ErrorKind::PaymentTimeout:      return "payment_timeout";
    case ErrorKind::BookingState:        return "booking_state";
    case ErrorKind::BookingPolicy:       return "booking_policy";
    case ErrorKind::InvalidEvent:        return "invalid_event";
    case ErrorKind::InvalidRequest:      return "invalid_request";
    case ErrorKind::Config:              return "config_error";
  }
  return "internal_error";
}

int ResponseFormatter::httpStatus(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidInterval:
    case ErrorKind::InvalidSpace:
    case ErrorKind::InvalidCustomerData:
    case ErrorKind::BookingPolicy:
    case ErrorKind::InvalidEvent:
    case ErrorKind::InvalidRequest:
      return 400;
    case ErrorKind::PaymentFailed:
      return 402;
    case ErrorKind::NotFound:
      return 404;
    case ErrorKind::SlotTaken:
    case ErrorKind::BookingState:
      return 409;
    case ErrorKind::InsufficientHistory:
      return 503;
    case ErrorKind::PaymentTimeout:
      return 504;
    case ErrorKind::Config:
      return 500;
  }
  return 500;
}

json ResponseFormatter::error(const Error& e) {
  json j = error(e.kind(), e.what());
  if (auto* slot = dynamic_cast<const SlotTakenError*>(&e)) {
    j["conflicting_reference"] = slot->conflictingReference();
  }
  return j;
}

json ResponseFormatter::error(ErrorKind kind, const std::string& message) {
  json j;
  j["success"] = false;
  j["error"] = message;
  j["error_code"] = errorCode(kind);
  j["status"] = httpStatus(kind);
  return j;
}

json ResponseFormatter::internalError(const std::string& message) {
  json j;
  j["success"] = false;
  j["error"] = message;
  j["error_code"] = "internal_error";
  j["status"] = 500;
  return j;
}

json ResponseFormatter::pong(Timestamp now) {
  json j;
  j["response"] = "pong";
  j["timestamp"] = format_iso8601(now);
  return ok(std::move(j));
}

// -----------------------------------------------------------------------------
// formatTelemetry(): dispatch Event variant to a JSON document
// -----------------------------------------------------------------------------
std::optional<std::string> ResponseFormatter::formatTelemetry(
    const Event& event) {
  if (auto* e = std::get_if<OccupancyUpdateEvent>(&event)) {
    json j = toJson(e->snapshot);
    j["type"] = "occupancy_update";
    j["event_type"] = domain::toString(e->event.type);
    j["previous_occupied"] = e->previous_occupied;
    j["timestamp"] = format_iso8601(e->timestamp);
    return j.dump();
  }
  if (auto* e = std::get_if<BookingUpdateEvent>(&event)) {
    json j;
    j["type"] = "booking_update";
    j["booking_reference"] = e->booking.reference;
    j["space_id"] = e->booking.space_id;
    j["stage"] = domain::toString(e->booking.stage);
    j["previous_stage"] = e->previous_stage
                              ? json(domain::toString(*e->previous_stage))
                              : json(nullptr);
    j["status"] = domain::toString(e->booking.status);
    j["payment_status"] = domain::toString(e->booking.payment_status);
    j["timestamp"] = format_iso8601(e->timestamp);
    return j.dump();
  }
  if (auto* e = std::get_if<PaymentUpdateEvent>(&event)) {
    json j;
    j["type"] = "payment_update";
    j["payment_reference"] = e->payment.reference;
    j["booking_reference"] = e->payment.booking_reference;
    j["status"] = domain::toString(e->payment.status);
    j["amount"] = e->payment.amount;
    j["timestamp"] = format_iso8601(e->timestamp);
    return j.dump();
  }
  if (auto* e = std::get_if<HeartbeatEvent>(&event)) {
    json j;
    j["type"] = "heartbeat";
    j["component"] = e->component_id;
    j["status"] = e->status;
    j["sequence_id"] = e->sequence_id;
    j["timestamp"] = format_iso8601(e->timestamp);
    return j.dump();
  }
  return std::nullopt;
}

}  // namespace api
}  // namespace park
