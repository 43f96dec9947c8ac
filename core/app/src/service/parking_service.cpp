#include "park/service/parking_service.hpp"

#include "park/common/errors.hpp"
#include "park/time/time_utils.hpp"

#include <algorithm>
#include <iostream>
#include <unordered_map>
#include <utility>

namespace park {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
ParkingService::ParkingService(
    const SpaceRegistry& registry, OccupancyStore& store,
    const HistoryAggregator& history, const IForecaster& forecaster,
    const AvailabilityIndex& availability, const PricingCalculator& pricing,
    BookingEngine& bookings, DetectionIngestor& ingestor,
    const ITimeProvider& time_provider, double lookback_hours, EventSink sink)
    : registry_(registry),
      store_(store),
      history_(history),
      forecaster_(forecaster),
      availability_(availability),
      pricing_(pricing),
      bookings_(bookings),
      ingestor_(ingestor),
      time_provider_(time_provider),
      lookback_hours_(lookback_hours),
      sink_(std::move(sink)) {}

Timestamp ParkingService::now() const {
  return ms_to_timestamp(time_provider_.now_ms());
}

// -----------------------------------------------------------------------------
// Occupancy queries
// -----------------------------------------------------------------------------
StatusReport ParkingService::status() const {
  StatusReport report;
  report.as_of = now();
  report.spaces = store_.allSnapshots();
  report.counts = store_.counts();
  return report;
}

HistoryReport ParkingService::history(const api::HistoryRequest& request) const {
  HistoryReport report;
  report.hours = request.hours;
  report.window = history_.window();
  report.buckets = history_.trailing(now(), request.hours);
  return report;
}

// -----------------------------------------------------------------------------
// predict(): history since the first event, capped at the lookback
// -----------------------------------------------------------------------------
ForecastReport ParkingService::predict(const api::PredictRequest& request) const {
  if (request.hours < 1) {
    throw InvalidIntervalError("Forecast hours must be at least 1");
  }

  const auto first = store_.firstEventTime();
  if (!first) {
    throw InsufficientHistoryError(0, forecaster_.minimumHistory());
  }

  const Timestamp current = now();
  const auto window_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(history_.window());
  const auto lookback = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::duration<double, std::ratio<3600>>(lookback_hours_));

  const Timestamp range_start =
      floor_to(std::max(*first, current - lookback), window_ms);
  const Timestamp range_end = floor_to(current, window_ms) + window_ms;
  if (range_end <= range_start) {
    // Every recorded event lies ahead of the clock.
    throw InsufficientHistoryError(0, forecaster_.minimumHistory());
  }

  const auto buckets = history_.history(range_start, range_end);

  ForecastReport report;
  report.model = forecaster_.name();
  report.hours = request.hours;
  report.total_spaces = registry_.size();
  report.history_buckets = buckets.size();
  report.points = forecaster_.predict(buckets, request.hours);
  return report;
}

// -----------------------------------------------------------------------------
// Reservation queries and workflow
// -----------------------------------------------------------------------------
AvailabilityReport ParkingService::available(
    const api::AvailabilityRequest& request) const {
  AvailabilityReport report;
  report.start_time = request.start_time;
  report.end_time = request.end_time;
  for (auto& space : availability_.search(request.start_time, request.end_time,
                                          request.vehicle_type)) {
    PriceQuote quote =
        pricing_.cost(space, request.start_time, request.end_time);
    report.spaces.push_back(AvailableSpace{std::move(space), std::move(quote)});
  }
  return report;
}

PriceQuote ParkingService::calculate(const api::QuoteRequest& request) const {
  return pricing_.cost(request.space_id, request.start_time, request.end_time);
}

domain::Booking ParkingService::createBooking(
    const api::CreateBookingRequest& request) {
  // Reject bad customer data before a hold exists.
  BookingEngine::validateCustomer(request.customer);

  const domain::BookingHandle handle =
      bookings_.hold(request.space_id, request.start_time, request.end_time);
  try {
    bookings_.price(handle);
    return bookings_.confirm(handle, request.customer);
  } catch (const Error& e) {
    std::cerr << "[ParkingService] Releasing hold " << handle.reference
              << ": " << e.what() << "\n";
    try {
      bookings_.cancel(handle.reference, CancelOrigin::Administrative);
    } catch (const Error& release_error) {
      std::cerr << "[ParkingService] Hold release failed for "
                << handle.reference << ": " << release_error.what() << "\n";
    }
    throw;
  }
}

PaymentOutcome ParkingService::processPayment(
    const api::ProcessPaymentRequest& request) {
  return bookings_.pay(request.booking_reference, request.payment_method);
}

std::vector<domain::Booking> ParkingService::bookings(
    const BookingFilter& filter) const {
  return bookings_.listBookings(filter);
}

domain::Booking ParkingService::bookingDetail(
    const api::BookingReferenceRequest& request) const {
  return bookings_.getBooking(request.booking_reference);
}

domain::Booking ParkingService::cancel(
    const api::BookingReferenceRequest& request) {
  return bookings_.cancel(request.booking_reference, CancelOrigin::Customer);
}

domain::Booking ParkingService::checkIn(
    const api::BookingReferenceRequest& request) {
  return bookings_.checkIn(request.booking_reference);
}

domain::Booking ParkingService::checkOut(
    const api::BookingReferenceRequest& request) {
  return bookings_.checkOut(request.booking_reference);
}

domain::PaymentRecord ParkingService::paymentDetail(
    const api::PaymentReferenceRequest& request) const {
  return bookings_.getPayment(request.payment_reference);
}

// -----------------------------------------------------------------------------
// Space and event views
// -----------------------------------------------------------------------------
SpaceDetail ParkingService::spaceDetail(const api::SpaceRequest& request) const {
  SpaceDetail detail;
  detail.space = registry_.at(request.space_id);
  detail.snapshot = store_.currentSnapshot(request.space_id);
  detail.recent_events =
      store_.recentEvents(kSpaceDetailEvents, request.space_id);
  return detail;
}

std::vector<domain::OccupancyEvent> ParkingService::recentEvents(
    const api::RecentEventsRequest& request) const {
  return store_.recentEvents(request.limit);
}

// -----------------------------------------------------------------------------
// statisticsSummary(): today's transitions and bucket rates
// -----------------------------------------------------------------------------
StatisticsSummary ParkingService::statisticsSummary() const {
  const Timestamp current = now();

  StatisticsSummary summary;
  summary.counts = store_.counts();
  summary.day_start = utc_day_start(current);
  const Timestamp day_end = summary.day_start + std::chrono::hours(24);

  // Replay from the start of the log so a re-asserted state (occupied
  // followed by occupied) is not counted as a second entry.
  std::unordered_map<domain::SpaceId, bool> occupied;
  for (const auto& event : store_.eventsBetween(Timestamp::min(), day_end)) {
    bool& state = occupied[event.space_id];
    const bool next = domain::marksOccupied(event.type);
    if (next != state && event.timestamp >= summary.day_start) {
      if (next) {
        ++summary.entries_today;
      } else {
        ++summary.exits_today;
      }
    }
    state = next;
  }

  const auto window_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(history_.window());
  const Timestamp range_end =
      std::min(floor_to(current, window_ms) + window_ms, day_end);
  if (range_end > summary.day_start) {
    const auto buckets = history_.history(summary.day_start, range_end);
    double total = 0.0;
    for (const auto& bucket : buckets) {
      const double rate = bucket.occupancyRate();
      total += rate;
      summary.peak_occupancy_rate = std::max(summary.peak_occupancy_rate, rate);
    }
    if (!buckets.empty()) {
      summary.average_occupancy_rate =
          total / static_cast<double>(buckets.size());
    }
  }
  return summary;
}

// -----------------------------------------------------------------------------
// Occupancy writes
// -----------------------------------------------------------------------------
RecordedEvent ParkingService::updateSpace(
    const api::SpaceUpdateRequest& request) {
  domain::OccupancyEvent event;
  event.space_id = request.space_id;
  event.type = request.is_occupied ? domain::OccupancyEventType::DetectedOccupied
                                   : domain::OccupancyEventType::DetectedEmpty;
  event.timestamp = now();
  event.confidence = request.confidence;
  if (request.is_occupied) {
    event.vehicle_type = request.vehicle_type;
  }

  RecordedEvent recorded = store_.recordEvent(std::move(event));
  std::cout << "[ParkingService] Manual update: " << recorded.event.space_id
            << (recorded.snapshot.is_occupied ? " occupied" : " available")
            << "\n";
  if (sink_) {
    sink_(OccupancyUpdateEvent{recorded.event, recorded.snapshot,
                               recorded.previous_occupied,
                               recorded.event.timestamp});
  }
  return recorded;
}

IngestReport ParkingService::ingest(const DetectionBatch& batch) {
  return ingestor_.ingest(batch);
}

std::size_t ParkingService::reconcile() { return bookings_.completeElapsed(); }

}  // namespace park
