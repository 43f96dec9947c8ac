#pragma once

#include "park/domain/booking.hpp"
#include "park/domain/payment.hpp"

#include <string>

namespace park {

struct PaymentRequest {
  domain::PaymentReference payment_reference;
  domain::BookingReference booking_reference;
  double amount{0.0};
  std::string currency;
  std::string method;
};

struct PaymentResult {
  bool success{false};
  std::string transaction_id;
  std::string failure_reason;  // Set when success is false
};

// -----------------------------------------------------------------------------
// IPaymentGateway: external payment capability
// -----------------------------------------------------------------------------
//
// @brief  Charges a booking. The only operation is processPayment().
//
// @details
// BookingEngine calls processPayment() on a helper thread and waits at most
// the configured timeout. An implementation may block for as long as it
// likes; a call that outlives the timeout keeps running detached, and its
// answer still settles the payment when it arrives. Implementations must
// not reference objects that may be destroyed while they run; BookingEngine
// holds them through std::shared_ptr.
//
// Declines are reported with success = false. Throwing is treated the same
// as a decline, using the exception message as the failure reason.
//
// Thread-safety contract:
//   processPayment() may be called concurrently from several threads.
// -----------------------------------------------------------------------------
class IPaymentGateway {
 public:
  virtual ~IPaymentGateway() = default;

  virtual PaymentResult processPayment(const PaymentRequest& request) = 0;

  // Recorded on each PaymentRecord ("demo", "stripe", ...).
  virtual std::string name() const = 0;
};

}  // namespace park
