#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace park {

// -----------------------------------------------------------------------------
// ErrorKind: machine-readable category carried by every park::Error
// -----------------------------------------------------------------------------
//
// @brief  One enumerator per failure family of the occupancy & reservation
//         core.
//
// @details
// The command boundary maps the kind to an error code string and an
// HTTP-like status (see ResponseFormatter). Core code never inspects the
// kind; it only throws the concrete class.
// -----------------------------------------------------------------------------
enum class ErrorKind {
  InvalidInterval,
  InvalidSpace,
  NotFound,
  SlotTaken,
  InvalidCustomerData,
  InsufficientHistory,
  PaymentFailed,
  PaymentTimeout,
  BookingState,
  BookingPolicy,
  InvalidEvent,
  InvalidRequest,
  Config,
};

// -----------------------------------------------------------------------------
// Error: root of the engine's exception hierarchy
// -----------------------------------------------------------------------------
//
// @brief  std::runtime_error plus an ErrorKind.
//
// @details
// Validation errors are thrown before any state is touched, so catching an
// Error never requires rollback on the caller's side. The only exceptions
// to "no state change" are the payment errors: a failed or timed-out
// payment leaves the booking confirmed (see BookingEngine::pay()).
// -----------------------------------------------------------------------------
class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

// end <= start, or a non-positive window/horizon.
class InvalidIntervalError : public Error {
 public:
  explicit InvalidIntervalError(const std::string& message)
      : Error(ErrorKind::InvalidInterval, message) {}
};

// Space id not present in the SpaceRegistry (write paths).
class InvalidSpaceError : public Error {
 public:
  explicit InvalidSpaceError(const std::string& space_id)
      : Error(ErrorKind::InvalidSpace, "Unknown parking space: " + space_id),
        space_id_(space_id) {}

  const std::string& spaceId() const noexcept { return space_id_; }

 private:
  std::string space_id_;
};

// Lookup of something that does not exist (read paths).
class NotFoundError : public Error {
 public:
  explicit NotFoundError(const std::string& message)
      : Error(ErrorKind::NotFound, message) {}
};

class BookingNotFoundError : public NotFoundError {
 public:
  explicit BookingNotFoundError(const std::string& reference)
      : NotFoundError("Booking not found: " + reference) {}
};

class PaymentNotFoundError : public NotFoundError {
 public:
  explicit PaymentNotFoundError(const std::string& reference)
      : NotFoundError("Payment not found: " + reference) {}
};

// The overlap recheck in BookingEngine::hold() found a live booking.
class SlotTakenError : public Error {
 public:
  SlotTakenError(const std::string& space_id,
                 const std::string& conflicting_reference)
      : Error(ErrorKind::SlotTaken,
              "Space " + space_id +
                  " not available for selected time (conflicts with " +
                  conflicting_reference + ")"),
        conflicting_reference_(conflicting_reference) {}

  const std::string& conflictingReference() const noexcept {
    return conflicting_reference_;
  }

 private:
  std::string conflicting_reference_;
};

class InvalidCustomerDataError : public Error {
 public:
  explicit InvalidCustomerDataError(const std::string& message)
      : Error(ErrorKind::InvalidCustomerData, message) {}
};

// Surfaced at the boundary as "no prediction available".
class InsufficientHistoryError : public Error {
 public:
  InsufficientHistoryError(std::size_t available, std::size_t required)
      : Error(ErrorKind::InsufficientHistory,
              "Insufficient history for forecast: " +
                  std::to_string(available) + " bucket(s), " +
                  std::to_string(required) + " required"),
        available_(available),
        required_(required) {}

  std::size_t available() const noexcept { return available_; }
  std::size_t required() const noexcept { return required_; }

 private:
  std::size_t available_;
  std::size_t required_;
};

class PaymentFailedError : public Error {
 public:
  explicit PaymentFailedError(const std::string& message)
      : Error(ErrorKind::PaymentFailed, message) {}
};

class PaymentTimeoutError : public Error {
 public:
  explicit PaymentTimeoutError(const std::string& message)
      : Error(ErrorKind::PaymentTimeout, message) {}
};

// Illegal lifecycle transition (cancel twice, pay before confirm, ...).
class BookingStateError : public Error {
 public:
  explicit BookingStateError(const std::string& message)
      : Error(ErrorKind::BookingState, message) {}
};

// Duration, advance-booking or cancellation-notice policy violated.
class BookingPolicyError : public Error {
 public:
  explicit BookingPolicyError(const std::string& message)
      : Error(ErrorKind::BookingPolicy, message) {}
};

// Malformed or stale occupancy event. Rejected per event.
class InvalidEventError : public Error {
 public:
  explicit InvalidEventError(const std::string& message)
      : Error(ErrorKind::InvalidEvent, message) {}
};

// Boundary request failed schema validation.
class InvalidRequestError : public Error {
 public:
  explicit InvalidRequestError(const std::string& message)
      : Error(ErrorKind::InvalidRequest, message) {}
};

class ConfigError : public Error {
 public:
  explicit ConfigError(const std::string& message)
      : Error(ErrorKind::Config, message) {}
};

}  // namespace park
