#include "park/payment/demo_payment_gateway.hpp"

#include <cstdio>
#include <thread>

namespace park {

DemoPaymentGateway::DemoPaymentGateway(
    std::vector<std::string> declined_methods,
    std::chrono::milliseconds latency)
    : declined_methods_(declined_methods.begin(), declined_methods.end()),
      latency_(latency) {}

PaymentResult DemoPaymentGateway::processPayment(
    const PaymentRequest& request) {
  if (latency_.count() > 0) {
    std::this_thread::sleep_for(latency_);
  }

  PaymentResult result;
  if (declined_methods_.count(request.method) != 0) {
    result.failure_reason = "Payment method declined: " + request.method;
    return result;
  }
  if (!(request.amount > 0.0)) {
    result.failure_reason = "Amount must be positive";
    return result;
  }

  char buf[32];
  std::snprintf(buf, sizeof(buf), "demo_txn_%06llu",
                static_cast<unsigned long long>(next_txn_.fetch_add(1)));
  result.success = true;
  result.transaction_id = buf;
  return result;
}

}  // namespace park
