#pragma once

#include "park/payment/i_payment_gateway.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace park {

// -----------------------------------------------------------------------------
// DemoPaymentGateway: in-process stand-in for a real processor
// -----------------------------------------------------------------------------
//
// @brief  Approves every payment except those whose method is listed in
//         declined_methods. Approved payments get transaction ids
//         "demo_txn_000001", "demo_txn_000002", ...
//
// @details
// An optional artificial latency makes the timeout path reachable in tests
// and demos. Amounts <= 0 are declined.
//
// Thread model: Stateless apart from an atomic counter; safe from any thread.
// -----------------------------------------------------------------------------
class DemoPaymentGateway final : public IPaymentGateway {
 public:
  explicit DemoPaymentGateway(
      std::vector<std::string> declined_methods = {},
      std::chrono::milliseconds latency = std::chrono::milliseconds(0));

  PaymentResult processPayment(const PaymentRequest& request) override;

  std::string name() const override { return "demo"; }

 private:
  std::set<std::string> declined_methods_;
  std::chrono::milliseconds latency_;
  std::atomic<std::uint64_t> next_txn_{1};
};

}  // namespace park
