#pragma once

#include <optional>
#include <string>

namespace park {
namespace domain {

// -----------------------------------------------------------------------------
// BookingStage: reservation lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every state a booking can occupy inside the
//         BookingEngine. "Searching" happens before a booking exists and has
//         no enumerator.
//
// @details
// The lifecycle follows a strict state machine. The BookingEngine enforces
// the transition graph (BookingEngine::isLegalTransition):
//
//   Held ──> Priced ──> Confirmed ──> Paid ──> Completed
//    │        │  ▲          │           │
//    │        └──┘          │           │
//    ▼        ▼             ▼           ▼
//   Cancelled Cancelled  Cancelled   Cancelled (payment refunded)
//
// Terminal stages: Cancelled, Completed.
//
// BookingStatus (pending, confirmed, cancelled, completed) is the coarse
// status exposed at the boundary; see statusForStage(). Held and Priced
// report as pending, Confirmed and Paid as confirmed, with payment_status
// telling the latter two apart.
// -----------------------------------------------------------------------------
enum class BookingStage {
  Held,       // Interval reserved, no price yet
  Priced,     // total_amount computed and stored
  Confirmed,  // Customer details accepted
  Paid,       // Payment collaborator reported success
  Cancelled,  // Released, terminal
  Completed,  // end_time elapsed after payment, terminal
};

enum class BookingStatus {
  Pending,
  Confirmed,
  Cancelled,
  Completed,
};

enum class PaymentStatus {
  Unpaid,
  Paid,
  Failed,
  Refunded,
};

// Coarse status implied by a stage.
inline BookingStatus statusForStage(BookingStage stage) {
  switch (stage) {
    case BookingStage::Held:
    case BookingStage::Priced:
      return BookingStatus::Pending;
    case BookingStage::Confirmed:
    case BookingStage::Paid:
      return BookingStatus::Confirmed;
    case BookingStage::Cancelled:
      return BookingStatus::Cancelled;
    case BookingStage::Completed:
      return BookingStatus::Completed;
  }
  return BookingStatus::Pending;
}

// A booking in one of these statuses owns its interval on the space.
inline bool holdsInterval(BookingStatus status) {
  return status == BookingStatus::Pending ||
         status == BookingStatus::Confirmed;
}

inline const char* toString(BookingStage stage) {
  switch (stage) {
    case BookingStage::Held:      return "held";
    case BookingStage::Priced:    return "priced";
    case BookingStage::Confirmed: return "confirmed";
    case BookingStage::Paid:      return "paid";
    case BookingStage::Cancelled: return "cancelled";
    case BookingStage::Completed: return "completed";
  }
  return "unknown";
}

inline const char* toString(BookingStatus status) {
  switch (status) {
    case BookingStatus::Pending:   return "pending";
    case BookingStatus::Confirmed: return "confirmed";
    case BookingStatus::Cancelled: return "cancelled";
    case BookingStatus::Completed: return "completed";
  }
  return "unknown";
}

inline std::optional<BookingStatus> parseBookingStatus(const std::string& text) {
  if (text == "pending") return BookingStatus::Pending;
  if (text == "confirmed") return BookingStatus::Confirmed;
  if (text == "cancelled") return BookingStatus::Cancelled;
  if (text == "completed") return BookingStatus::Completed;
  return std::nullopt;
}

inline const char* toString(PaymentStatus status) {
  switch (status) {
    case PaymentStatus::Unpaid:   return "unpaid";
    case PaymentStatus::Paid:     return "paid";
    case PaymentStatus::Failed:   return "failed";
    case PaymentStatus::Refunded: return "refunded";
  }
  return "unknown";
}

}  // namespace domain
}  // namespace park
