#pragma once

#include "park/api/requests.hpp"
#include "park/availability/availability_index.hpp"
#include "park/booking/booking_engine.hpp"
#include "park/domain/booking.hpp"
#include "park/domain/occupancy.hpp"
#include "park/domain/parking_space.hpp"
#include "park/domain/payment.hpp"
#include "park/events/event.hpp"
#include "park/forecast/i_forecaster.hpp"
#include "park/history/history_aggregator.hpp"
#include "park/occupancy/detection_ingestor.hpp"
#include "park/occupancy/occupancy_store.hpp"
#include "park/pricing/pricing_calculator.hpp"
#include "park/registry/space_registry.hpp"
#include "park/time/i_time_provider.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace park {

// -----------------------------------------------------------------------------
// Result shapes returned by ParkingService
// -----------------------------------------------------------------------------

struct StatusReport {
  std::vector<domain::OccupancySnapshot> spaces;
  domain::OccupancyCounts counts;
  Timestamp as_of{};
};

struct HistoryReport {
  double hours{0.0};
  std::chrono::minutes window{0};
  std::vector<domain::OccupancyBucket> buckets;
};

struct ForecastReport {
  std::string model;
  int hours{0};
  std::size_t total_spaces{0};
  std::size_t history_buckets{0};
  std::vector<domain::ForecastPoint> points;
};

// One search hit: the space plus the price of the requested interval.
struct AvailableSpace {
  domain::ParkingSpace space;
  PriceQuote quote;
};

struct AvailabilityReport {
  Timestamp start_time{};
  Timestamp end_time{};
  std::vector<AvailableSpace> spaces;
};

struct SpaceDetail {
  domain::ParkingSpace space;
  domain::OccupancySnapshot snapshot;
  std::vector<domain::OccupancyEvent> recent_events;
};

struct StatisticsSummary {
  domain::OccupancyCounts counts;
  Timestamp day_start{};
  std::size_t entries_today{0};
  std::size_t exits_today{0};
  double average_occupancy_rate{0.0};
  double peak_occupancy_rate{0.0};
};

// -----------------------------------------------------------------------------
// ParkingService: typed in-process API over the core
// -----------------------------------------------------------------------------
//
// @brief  One member function per boundary operation. Each takes an already
//         validated request struct (see api::RequestParser) and composes the
//         core components to answer it.
//
// @details
// ParkingService holds no state of its own beyond references; every query
// reads the components at call time, so two concurrent calls never see
// each other's partial work. Errors propagate unchanged as park::Error
// subclasses; rendering them is the boundary's job (ResponseFormatter).
//
// createBooking() runs hold -> price -> confirm. If pricing or confirmation
// fails after the hold succeeded, the hold is released administratively so
// the failed request leaves no live reservation behind.
//
// Thread model:
//   Safe to call from any thread. Called on the IpcServer thread in
//   production and directly from tests.
//
// Ownership:
//   Owned by ParkingEngine via std::unique_ptr. All referenced components
//   are owned by the engine and outlive the service.
// -----------------------------------------------------------------------------
class ParkingService {
 public:
  ParkingService(const SpaceRegistry& registry, OccupancyStore& store,
                 const HistoryAggregator& history, const IForecaster& forecaster,
                 const AvailabilityIndex& availability,
                 const PricingCalculator& pricing, BookingEngine& bookings,
                 DetectionIngestor& ingestor,
                 const ITimeProvider& time_provider, double lookback_hours,
                 EventSink sink = {});

  ParkingService(const ParkingService&) = delete;
  ParkingService& operator=(const ParkingService&) = delete;

  StatusReport status() const;

  // @throws InvalidIntervalError if hours <= 0.
  HistoryReport history(const api::HistoryRequest& request) const;

  // -------------------------------------------------------------------------
  // predict(request)
  // -------------------------------------------------------------------------
  // @brief  Forecast for the next request.hours hours.
  //
  // @details
  // History starts at the first recorded occupancy event, bounded by the
  // configured lookback, and ends with the window containing now.
  //
  // @throws InvalidIntervalError      hours < 1.
  // @throws InsufficientHistoryError  Nothing recorded yet, or fewer buckets
  //                                   than the forecaster's minimum.
  // -------------------------------------------------------------------------
  ForecastReport predict(const api::PredictRequest& request) const;

  AvailabilityReport available(const api::AvailabilityRequest& request) const;

  PriceQuote calculate(const api::QuoteRequest& request) const;

  domain::Booking createBooking(const api::CreateBookingRequest& request);

  PaymentOutcome processPayment(const api::ProcessPaymentRequest& request);

  std::vector<domain::Booking> bookings(const BookingFilter& filter) const;

  domain::Booking bookingDetail(const api::BookingReferenceRequest& request) const;

  domain::Booking cancel(const api::BookingReferenceRequest& request);

  domain::Booking checkIn(const api::BookingReferenceRequest& request);
  domain::Booking checkOut(const api::BookingReferenceRequest& request);

  domain::PaymentRecord paymentDetail(
      const api::PaymentReferenceRequest& request) const;

  // @throws InvalidSpaceError
  SpaceDetail spaceDetail(const api::SpaceRequest& request) const;

  std::vector<domain::OccupancyEvent> recentEvents(
      const api::RecentEventsRequest& request) const;

  // Today is the current UTC day.
  StatisticsSummary statisticsSummary() const;

  // Manual occupancy update, recorded as a detection event at now.
  // @throws InvalidSpaceError, InvalidEventError
  RecordedEvent updateSpace(const api::SpaceUpdateRequest& request);

  IngestReport ingest(const DetectionBatch& batch);

  // Completes elapsed paid bookings. Returns how many changed.
  std::size_t reconcile();

  const SpaceRegistry& registry() const { return registry_; }

 private:
  static constexpr std::size_t kSpaceDetailEvents = 10;

  Timestamp now() const;

  const SpaceRegistry& registry_;
  OccupancyStore& store_;
  const HistoryAggregator& history_;
  const IForecaster& forecaster_;
  const AvailabilityIndex& availability_;
  const PricingCalculator& pricing_;
  BookingEngine& bookings_;
  DetectionIngestor& ingestor_;
  const ITimeProvider& time_provider_;
  double lookback_hours_;
  EventSink sink_;
};

}  // namespace park
