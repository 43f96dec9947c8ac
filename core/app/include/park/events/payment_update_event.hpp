#pragma once

#include "park/domain/payment.hpp"
#include "park/events/event_types.hpp"

namespace park {

// Published once per payment attempt, after the attempt settled (completed,
// failed or timed out).
struct PaymentUpdateEvent {
  domain::PaymentRecord payment;
  Timestamp timestamp{};
};

}  // namespace park
