#pragma once

#include "park/booking/booking_ledger.hpp"
#include "park/concurrent/reference_generator.hpp"
#include "park/domain/booking.hpp"
#include "park/domain/booking_policy.hpp"
#include "park/domain/booking_status.hpp"
#include "park/domain/payment.hpp"
#include "park/events/event.hpp"
#include "park/occupancy/occupancy_store.hpp"
#include "park/payment/i_payment_gateway.hpp"
#include "park/pricing/pricing_calculator.hpp"
#include "park/registry/space_registry.hpp"
#include "park/time/i_time_provider.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace park {

// Who is cancelling. Customer cancellations must respect the notice period.
enum class CancelOrigin {
  Customer,
  Administrative,
};

struct BookingFilter {
  std::optional<domain::BookingStatus> status;
  std::optional<Timestamp> starting_from;  // start_time >= starting_from
  std::size_t limit{100};
};

struct PaymentOutcome {
  domain::Booking booking;
  domain::PaymentRecord payment;
};

// -----------------------------------------------------------------------------
// BookingEngine: reservation lifecycle
// -----------------------------------------------------------------------------
//
// @brief  The only component that changes booking state. Drives
//         hold -> price -> confirm -> pay, cancellation, check-in/out and
//         completion of elapsed bookings.
//
// @details
// Stage machine (isLegalTransition):
//
//     Held ──► Priced ──► Confirmed ──► Paid ──► Completed
//       │        │ ▲          │          │
//       │        └─┘ re-price │          │
//       └────────┴────────────┴──────────┴──► Cancelled
//
// Cancelled and Completed are terminal. Status is derived from the stage
// (statusForStage): Held/Priced are pending, Confirmed/Paid are confirmed.
//
// Atomicity: every stage change runs inside BookingLedger::apply(), under
// the space's lane, and rechecks the current stage there. Two racing
// operations on one booking see each other's effect; the loser gets a
// BookingStateError.
//
// Payment: the gateway call runs on a helper thread and is waited for at
// most payment_timeout. The booking is never rolled back by a payment
// problem:
//   declined  -> payment_status = failed, PaymentFailedError
//   timed out -> payment_status unchanged (outcome unknown),
//                PaymentTimeoutError
// Both leave the booking confirmed and holding its space; the caller may
// retry pay(). Only one payment per booking may be in flight: the booking
// stays marked until the gateway call returns, even past a timeout. A call
// that returns after its timeout settles the payment from the helper
// thread (record completed or failed, booking Paid if still Confirmed),
// and a pay() in the meantime gets BookingStateError.
//
// Notifications: after each committed change a BookingUpdateEvent (and a
// PaymentUpdateEvent / OccupancyUpdateEvent where relevant) is handed to
// the EventSink. The sink must not block.
//
// Thread model:
//   All public methods are safe to call concurrently from any thread. The
//   sink may also be called from a payment helper thread.
//
// Ownership:
//   Owned by ParkingEngine via std::unique_ptr. References to the registry,
//   ledger, occupancy store, pricing calculator, time provider and
//   whatever the sink captures must outlive it; the gateway is shared (see
//   IPaymentGateway). The destructor waits for outstanding gateway calls.
// -----------------------------------------------------------------------------
class BookingEngine {
 public:
  BookingEngine(const SpaceRegistry& registry, BookingLedger& ledger,
                OccupancyStore& occupancy, const PricingCalculator& pricing,
                std::shared_ptr<IPaymentGateway> gateway,
                const ITimeProvider& time_provider,
                domain::BookingPolicy policy,
                std::chrono::milliseconds payment_timeout,
                EventSink sink = {});

  ~BookingEngine();

  BookingEngine(const BookingEngine&) = delete;
  BookingEngine& operator=(const BookingEngine&) = delete;

  // -------------------------------------------------------------------------
  // hold(space_id, start, end)
  // -------------------------------------------------------------------------
  // @brief  Creates a Held/pending booking after the atomic overlap recheck.
  //
  // @throws InvalidIntervalError  end <= start.
  // @throws InvalidSpaceError     Unknown space.
  // @throws BookingPolicyError    Duration outside [min, max] hours, start
  //                               in the past or beyond the advance window.
  // @throws SlotTakenError        Overlaps a pending/confirmed booking.
  //
  // Live occupancy is deliberately not consulted.
  // -------------------------------------------------------------------------
  domain::BookingHandle hold(const domain::SpaceId& space_id, Timestamp start,
                             Timestamp end);

  // Prices the booking, stores total_amount, moves it to Priced.
  // @throws BookingNotFoundError, BookingStateError
  PriceQuote price(const domain::BookingHandle& handle);

  // -------------------------------------------------------------------------
  // confirm(handle, customer)
  // -------------------------------------------------------------------------
  // @brief  Attaches customer details and moves Priced -> Confirmed.
  //
  // @throws InvalidCustomerDataError  See validateCustomer().
  // @throws BookingPolicyError        Vehicle type not accepted by the space.
  // @throws BookingNotFoundError, BookingStateError
  // -------------------------------------------------------------------------
  domain::Booking confirm(const domain::BookingHandle& handle,
                          const domain::CustomerDetails& customer);

  // @throws BookingNotFoundError, BookingStateError (already paid, or an
  //         earlier payment's outcome is still pending), InvalidRequestError
  //         (empty method), PaymentFailedError, PaymentTimeoutError
  PaymentOutcome pay(const domain::BookingReference& reference,
                     const std::string& payment_method);

  // -------------------------------------------------------------------------
  // cancel(reference, origin)
  // -------------------------------------------------------------------------
  // @brief  Moves any non-terminal booking to Cancelled and frees its
  //         interval at once. A paid booking becomes payment_status
  //         refunded.
  //
  // @throws BookingStateError   Already cancelled or completed.
  // @throws BookingPolicyError  Customer cancellation inside the notice
  //                             period (cancellation_hours before start).
  // @throws BookingNotFoundError
  // -------------------------------------------------------------------------
  domain::Booking cancel(const domain::BookingReference& reference,
                         CancelOrigin origin = CancelOrigin::Customer);

  // Records an enter / exit event for the booked space. Booking must be
  // confirmed (Confirmed or Paid).
  domain::Booking checkIn(const domain::BookingReference& reference);
  domain::Booking checkOut(const domain::BookingReference& reference);

  // Paid bookings whose end_time has passed become Completed. Returns how
  // many were completed.
  std::size_t completeElapsed();

  // @throws BookingNotFoundError
  domain::Booking getBooking(const domain::BookingReference& reference) const;

  // Newest created first.
  std::vector<domain::Booking> listBookings(const BookingFilter& filter) const;

  // @throws PaymentNotFoundError
  domain::PaymentRecord getPayment(
      const domain::PaymentReference& reference) const;

  const domain::BookingPolicy& policy() const { return policy_; }

  // Required: name, email (must contain '@'), vehicle_number.
  // @throws InvalidCustomerDataError naming the first offending field.
  static void validateCustomer(const domain::CustomerDetails& customer);

  static bool isLegalTransition(domain::BookingStage from,
                                domain::BookingStage to);

 private:
  Timestamp now() const;

  void checkPolicy(Timestamp start, Timestamp end) const;

  // Runs `change` under the ledger lane after checking `from -> to` is
  // legal, then sets stage/status/updated_at and notifies.
  domain::Booking transition(
      const domain::BookingReference& reference, domain::BookingStage to,
      const std::function<void(domain::Booking&)>& change = {});

  domain::Booking recordPresence(const domain::BookingReference& reference,
                                 domain::OccupancyEventType type);

  void storePayment(const domain::PaymentRecord& record);

  // Writes the gateway's answer into the record and the booking.
  // @throws PaymentFailedError on a decline, BookingStateError if the
  //         booking left Confirmed while the gateway was charging.
  PaymentOutcome settlePayment(domain::PaymentRecord record,
                               const PaymentResult& result);

  // Helper-thread path for a call that returned after pay() gave up.
  void settleLatePayment(const domain::PaymentRecord& record,
                         const PaymentResult& result) noexcept;

  void releaseInFlight(const domain::BookingReference& reference);

  void notify(Event event) const;

  const SpaceRegistry& registry_;
  BookingLedger& ledger_;
  OccupancyStore& occupancy_;
  const PricingCalculator& pricing_;
  std::shared_ptr<IPaymentGateway> gateway_;
  const ITimeProvider& time_provider_;
  domain::BookingPolicy policy_;
  std::chrono::milliseconds payment_timeout_;
  EventSink sink_;

  ReferenceGenerator booking_refs_;
  ReferenceGenerator payment_refs_;

  mutable std::shared_mutex payments_mutex_;
  std::unordered_map<domain::PaymentReference, domain::PaymentRecord> payments_;
  std::unordered_set<domain::BookingReference> payments_in_flight_;

  // Gateway helper threads still running; the destructor waits for zero.
  std::mutex helpers_mutex_;
  std::condition_variable helpers_idle_;
  std::size_t helpers_running_{0};
};

}  // namespace park
