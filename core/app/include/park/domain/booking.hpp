#pragma once

#include "park/domain/booking_status.hpp"
#include "park/domain/parking_space.hpp"
#include "park/domain/time_interval.hpp"
#include "park/domain/vehicle_type.hpp"
#include "park/events/event_types.hpp"

#include <optional>
#include <string>

namespace park {
namespace domain {

// -----------------------------------------------------------------------------
// BookingReference
// -----------------------------------------------------------------------------
// Unique booking identity ("BK20261019104500000A"). Generated once by
// ReferenceGenerator at hold time and never reused.
// -----------------------------------------------------------------------------
using BookingReference = std::string;

// -----------------------------------------------------------------------------
// CustomerDetails
// -----------------------------------------------------------------------------
// Collected at confirm time. name, email and vehicle_number are required;
// phone and notes are optional (empty string means "not given").
// -----------------------------------------------------------------------------
struct CustomerDetails {
  std::string name;
  std::string email;
  std::string phone;
  std::string vehicle_number;
  VehicleType vehicle_type{VehicleType::Car};
  std::string notes;
};

// -----------------------------------------------------------------------------
// Booking
// -----------------------------------------------------------------------------
// Responsibility: The central transactional record: which stall, which
// interval, who, how much, and where in the lifecycle it is.
//
// @details
// Created by BookingEngine::hold() in stage Held (status pending, payment
// unpaid). Only the BookingEngine mutates the authoritative copy held in the
// BookingLedger; every copy returned to callers is a snapshot.
//
// Invariant (enforced by BookingLedger): for a fixed space_id no two bookings
// whose status is pending or confirmed have overlapping intervals.
//
// total_amount is 0 until the booking is priced. It is stored rounded to
// currency minor units.
// -----------------------------------------------------------------------------
struct Booking {
  BookingReference reference;
  SpaceId space_id;
  TimeInterval interval;
  CustomerDetails customer;
  double total_amount{0.0};
  BookingStage stage{BookingStage::Held};
  BookingStatus status{BookingStatus::Pending};
  PaymentStatus payment_status{PaymentStatus::Unpaid};
  std::string payment_reference;  // Last payment attempt, empty if none
  Timestamp created_at{};
  Timestamp updated_at{};
};

// -----------------------------------------------------------------------------
// BookingHandle
// -----------------------------------------------------------------------------
// What hold() returns and what the later workflow steps take. Carries the
// space id so the engine can take the per-space lock without a lookup.
// -----------------------------------------------------------------------------
struct BookingHandle {
  BookingReference reference;
  SpaceId space_id;
};

}  // namespace domain
}  // namespace park
