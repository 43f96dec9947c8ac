#pragma once

#include "park/domain/booking.hpp"
#include "park/events/event_types.hpp"

#include <optional>
#include <string>

namespace park {
namespace domain {

using PaymentReference = std::string;

// -----------------------------------------------------------------------------
// PaymentAttemptStatus
// -----------------------------------------------------------------------------
// Processing while the gateway call is in flight. TimedOut means the gateway
// did not answer within the configured bound; the real outcome is unknown.
// -----------------------------------------------------------------------------
enum class PaymentAttemptStatus {
  Processing,
  Completed,
  Failed,
  TimedOut,
};

inline const char* toString(PaymentAttemptStatus status) {
  switch (status) {
    case PaymentAttemptStatus::Processing: return "processing";
    case PaymentAttemptStatus::Completed:  return "completed";
    case PaymentAttemptStatus::Failed:     return "failed";
    case PaymentAttemptStatus::TimedOut:   return "timed_out";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// PaymentRecord
// -----------------------------------------------------------------------------
// One call to the payment collaborator for one booking. A booking may have
// several records (a failed attempt followed by a retry); Booking holds the
// reference of the latest.
// -----------------------------------------------------------------------------
struct PaymentRecord {
  PaymentReference reference;
  BookingReference booking_reference;
  double amount{0.0};
  std::string currency;
  std::string method;
  std::string gateway;
  std::string transaction_id;
  std::string failure_reason;
  PaymentAttemptStatus status{PaymentAttemptStatus::Processing};
  Timestamp created_at{};
  std::optional<Timestamp> completed_at;
};

}  // namespace domain
}  // namespace park
