#include "park/booking/booking_engine.hpp"

#include "park/common/errors.hpp"
#include "park/events/booking_update_event.hpp"
#include "park/events/occupancy_update_event.hpp"
#include "park/events/payment_update_event.hpp"
#include "park/time/time_utils.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace park {

namespace {

using domain::BookingStage;

// -----------------------------------------------------------------------------
// GatewayCall: one gateway call shared by pay() and its helper thread
// -----------------------------------------------------------------------------
// The caller waits on done_cv for at most the timeout. If it gives up it
// sets abandoned under the mutex, and the helper settles the payment itself
// once the gateway answers.
// -----------------------------------------------------------------------------
struct GatewayCall {
  std::mutex mutex;
  std::condition_variable done_cv;
  bool done{false};
  bool abandoned{false};
  PaymentResult result;
};

// A throwing gateway counts as a decline.
PaymentResult invokeGateway(IPaymentGateway& gateway,
                            const PaymentRequest& request) {
  try {
    return gateway.processPayment(request);
  } catch (const std::exception& e) {
    return PaymentResult{false, "", e.what()};
  }
}

// Clears the in-flight marker for a booking when pay() returns, unless
// dismissed because a timed-out call still owns it.
class InFlightGuard {
 public:
  InFlightGuard(std::shared_mutex& mutex,
                std::unordered_set<domain::BookingReference>& set,
                domain::BookingReference reference)
      : mutex_(mutex), set_(set), reference_(std::move(reference)) {}

  ~InFlightGuard() {
    if (armed_) {
      std::unique_lock lock(mutex_);
      set_.erase(reference_);
    }
  }

  void dismiss() { armed_ = false; }

  InFlightGuard(const InFlightGuard&) = delete;
  InFlightGuard& operator=(const InFlightGuard&) = delete;

 private:
  std::shared_mutex& mutex_;
  std::unordered_set<domain::BookingReference>& set_;
  domain::BookingReference reference_;
  bool armed_{true};
};

bool isBlank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
  });
}

}  // namespace

BookingEngine::BookingEngine(const SpaceRegistry& registry,
                             BookingLedger& ledger, OccupancyStore& occupancy,
                             const PricingCalculator& pricing,
                             std::shared_ptr<IPaymentGateway> gateway,
                             const ITimeProvider& time_provider,
                             domain::BookingPolicy policy,
                             std::chrono::milliseconds payment_timeout,
                             EventSink sink)
    : registry_(registry),
      ledger_(ledger),
      occupancy_(occupancy),
      pricing_(pricing),
      gateway_(std::move(gateway)),
      time_provider_(time_provider),
      policy_(std::move(policy)),
      payment_timeout_(payment_timeout),
      sink_(std::move(sink)),
      booking_refs_("BK", time_provider),
      payment_refs_("PAY", time_provider) {
  if (!gateway_) {
    throw std::invalid_argument("BookingEngine requires a payment gateway");
  }
}

BookingEngine::~BookingEngine() {
  std::unique_lock<std::mutex> lock(helpers_mutex_);
  helpers_idle_.wait(lock, [this] { return helpers_running_ == 0; });
}

// -----------------------------------------------------------------------------
// isLegalTransition: booking stage machine
// -----------------------------------------------------------------------------
bool BookingEngine::isLegalTransition(BookingStage from, BookingStage to) {
  switch (from) {
    case BookingStage::Held:
      return to == BookingStage::Priced ||
             to == BookingStage::Cancelled;

    case BookingStage::Priced:
      return to == BookingStage::Priced ||
             to == BookingStage::Confirmed ||
             to == BookingStage::Cancelled;

    case BookingStage::Confirmed:
      return to == BookingStage::Paid ||
             to == BookingStage::Cancelled;

    case BookingStage::Paid:
      return to == BookingStage::Completed ||
             to == BookingStage::Cancelled;

    case BookingStage::Cancelled:
    case BookingStage::Completed:
      return false;
  }
  return false;
}

void BookingEngine::validateCustomer(const domain::CustomerDetails& customer) {
  if (isBlank(customer.name)) {
    throw InvalidCustomerDataError("customer_name is required");
  }
  if (isBlank(customer.email)) {
    throw InvalidCustomerDataError("customer_email is required");
  }
  if (customer.email.find('@') == std::string::npos) {
    throw InvalidCustomerDataError("customer_email is not an email address: " +
                                   customer.email);
  }
  if (isBlank(customer.vehicle_number)) {
    throw InvalidCustomerDataError("vehicle_number is required");
  }
}

Timestamp BookingEngine::now() const {
  return ms_to_timestamp(time_provider_.now_ms());
}

void BookingEngine::notify(Event event) const {
  if (sink_) {
    sink_(std::move(event));
  }
}

void BookingEngine::checkPolicy(Timestamp start, Timestamp end) const {
  const double hours = hours_between(start, end);
  if (hours < policy_.min_booking_hours) {
    throw BookingPolicyError("Booking must be at least " +
                             std::to_string(policy_.min_booking_hours) +
                             " hour(s)");
  }
  if (hours > policy_.max_booking_hours) {
    throw BookingPolicyError("Booking must be at most " +
                             std::to_string(policy_.max_booking_hours) +
                             " hour(s)");
  }
  const Timestamp current = now();
  if (start < current) {
    throw BookingPolicyError("start_time is in the past: " +
                             format_iso8601(start));
  }
  if (hours_between(current, start) > policy_.advance_booking_days * 24.0) {
    throw BookingPolicyError("Bookings may be made at most " +
                             std::to_string(policy_.advance_booking_days) +
                             " day(s) in advance");
  }
}

// -----------------------------------------------------------------------------
// hold()
// -----------------------------------------------------------------------------
domain::BookingHandle BookingEngine::hold(const domain::SpaceId& space_id,
                                          Timestamp start, Timestamp end) {
  if (end <= start) {
    throw InvalidIntervalError("end_time must be after start_time");
  }
  registry_.at(space_id);  // InvalidSpaceError before any policy message
  checkPolicy(start, end);

  domain::Booking booking;
  booking.reference = booking_refs_.next();
  booking.space_id = space_id;
  booking.interval = domain::TimeInterval{start, end};
  booking.stage = BookingStage::Held;
  booking.status = domain::statusForStage(booking.stage);
  booking.payment_status = domain::PaymentStatus::Unpaid;
  booking.created_at = now();
  booking.updated_at = booking.created_at;

  try {
    ledger_.reserve(booking);
  } catch (const SlotTakenError& e) {
    std::cerr << "[BookingEngine] Hold rejected for " << space_id << " ["
              << format_iso8601(start) << ", " << format_iso8601(end)
              << "): conflicts with " << e.conflictingReference() << "\n";
    throw;
  }

  std::cout << "[BookingEngine] Held " << booking.reference << " on "
            << space_id << " [" << format_iso8601(start) << ", "
            << format_iso8601(end) << ")\n";

  notify(BookingUpdateEvent{booking, std::nullopt, booking.created_at});
  return domain::BookingHandle{booking.reference, booking.space_id};
}

// -----------------------------------------------------------------------------
// transition(): stage change under the ledger lane
// -----------------------------------------------------------------------------
domain::Booking BookingEngine::transition(
    const domain::BookingReference& reference, BookingStage to,
    const std::function<void(domain::Booking&)>& change) {
  BookingStage previous = BookingStage::Held;
  const Timestamp at = now();

  domain::Booking updated =
      ledger_.apply(reference, [&](domain::Booking& booking) {
        if (!isLegalTransition(booking.stage, to)) {
          throw BookingStateError(
              "Booking " + reference + " cannot move from " +
              domain::toString(booking.stage) + " to " +
              domain::toString(to));
        }
        if (change) {
          change(booking);
        }
        previous = booking.stage;
        booking.stage = to;
        booking.status = domain::statusForStage(to);
        booking.updated_at = at;
      });

  notify(BookingUpdateEvent{updated, previous, at});
  return updated;
}

// -----------------------------------------------------------------------------
// price()
// -----------------------------------------------------------------------------
PriceQuote BookingEngine::price(const domain::BookingHandle& handle) {
  PriceQuote quote;
  transition(handle.reference, BookingStage::Priced,
             [&](domain::Booking& booking) {
               quote = pricing_.cost(booking.space_id, booking.interval.start,
                                     booking.interval.end);
               booking.total_amount = quote.total_cost;
             });
  return quote;
}

// -----------------------------------------------------------------------------
// confirm()
// -----------------------------------------------------------------------------
domain::Booking BookingEngine::confirm(const domain::BookingHandle& handle,
                                       const domain::CustomerDetails& customer) {
  validateCustomer(customer);
  const domain::ParkingSpace& space = registry_.at(handle.space_id);
  if (!space.accepts(customer.vehicle_type)) {
    throw BookingPolicyError("Space " + space.id + " does not accept " +
                             domain::toString(customer.vehicle_type));
  }

  domain::Booking booking =
      transition(handle.reference, BookingStage::Confirmed,
                 [&](domain::Booking& b) { b.customer = customer; });

  std::cout << "[BookingEngine] Confirmed " << booking.reference << " for "
            << customer.name << " (" << booking.total_amount << " "
            << policy_.currency << ")\n";
  return booking;
}

void BookingEngine::storePayment(const domain::PaymentRecord& record) {
  std::unique_lock lock(payments_mutex_);
  payments_[record.reference] = record;
}

void BookingEngine::releaseInFlight(const domain::BookingReference& reference) {
  std::unique_lock lock(payments_mutex_);
  payments_in_flight_.erase(reference);
}

// -----------------------------------------------------------------------------
// pay()
// -----------------------------------------------------------------------------
PaymentOutcome BookingEngine::pay(const domain::BookingReference& reference,
                                  const std::string& payment_method) {
  if (isBlank(payment_method)) {
    throw InvalidRequestError("payment_method is required");
  }

  domain::Booking booking = ledger_.get(reference);
  if (booking.payment_status == domain::PaymentStatus::Paid) {
    throw BookingStateError("Booking " + reference + " is already paid");
  }
  if (!isLegalTransition(booking.stage, BookingStage::Paid)) {
    throw BookingStateError("Booking " + reference + " cannot be paid while " +
                            domain::toString(booking.stage));
  }

  {
    std::unique_lock lock(payments_mutex_);
    if (!payments_in_flight_.insert(reference).second) {
      throw BookingStateError("Payment outcome pending for booking " +
                              reference);
    }
  }
  InFlightGuard in_flight(payments_mutex_, payments_in_flight_, reference);

  domain::PaymentRecord record;
  record.reference = payment_refs_.next();
  record.booking_reference = reference;
  record.amount = booking.total_amount;
  record.currency = policy_.currency;
  record.method = payment_method;
  record.gateway = gateway_->name();
  record.status = domain::PaymentAttemptStatus::Processing;
  record.created_at = now();
  storePayment(record);

  const PaymentRequest request{record.reference, reference, record.amount,
                               record.currency, payment_method};
  auto call = std::make_shared<GatewayCall>();

  {
    std::lock_guard<std::mutex> lock(helpers_mutex_);
    ++helpers_running_;
  }
  try {
    std::thread([this, gateway = gateway_, request, record, call] {
      const PaymentResult result = invokeGateway(*gateway, request);
      bool abandoned = false;
      {
        std::lock_guard<std::mutex> lock(call->mutex);
        call->result = result;
        call->done = true;
        abandoned = call->abandoned;
      }
      call->done_cv.notify_one();

      if (abandoned) {
        settleLatePayment(record, result);
        releaseInFlight(record.booking_reference);
      }

      std::lock_guard<std::mutex> lock(helpers_mutex_);
      --helpers_running_;
      helpers_idle_.notify_all();
    }).detach();
  } catch (const std::system_error&) {
    std::lock_guard<std::mutex> lock(helpers_mutex_);
    --helpers_running_;
    throw;
  }

  PaymentResult result;
  {
    std::unique_lock<std::mutex> lock(call->mutex);
    if (!call->done_cv.wait_for(lock, payment_timeout_,
                                [&call] { return call->done; })) {
      // From here the helper owns the in-flight marker. The TimedOut record
      // is written while call->mutex is held, so a late answer always lands
      // on top of it.
      call->abandoned = true;
      in_flight.dismiss();

      record.status = domain::PaymentAttemptStatus::TimedOut;
      record.failure_reason = "Payment gateway timed out after " +
                              std::to_string(payment_timeout_.count()) +
                              " ms";
      record.completed_at = now();
      storePayment(record);
      ledger_.apply(reference, [&](domain::Booking& b) {
        b.payment_reference = record.reference;
        b.updated_at = *record.completed_at;
      });
      std::cerr << "[BookingEngine] Payment " << record.reference << " for "
                << reference
                << " timed out; booking stays confirmed, outcome pending\n";
      notify(PaymentUpdateEvent{record, *record.completed_at});
      throw PaymentTimeoutError(record.failure_reason);
    }
    result = call->result;
  }

  return settlePayment(record, result);
}

// -----------------------------------------------------------------------------
// settlePayment(): gateway answer -> payment record + booking
// -----------------------------------------------------------------------------
PaymentOutcome BookingEngine::settlePayment(domain::PaymentRecord record,
                                            const PaymentResult& result) {
  const domain::BookingReference& reference = record.booking_reference;
  record.completed_at = now();

  if (!result.success) {
    record.status = domain::PaymentAttemptStatus::Failed;
    record.failure_reason = result.failure_reason;
    storePayment(record);
    domain::Booking failed = ledger_.apply(reference, [&](domain::Booking& b) {
      b.payment_status = domain::PaymentStatus::Failed;
      b.payment_reference = record.reference;
      b.updated_at = *record.completed_at;
    });
    std::cerr << "[BookingEngine] Payment " << record.reference << " for "
              << reference << " declined: " << record.failure_reason << "\n";
    notify(PaymentUpdateEvent{record, *record.completed_at});
    notify(BookingUpdateEvent{failed, failed.stage, *record.completed_at});
    throw PaymentFailedError("Payment failed for booking " + reference + ": " +
                             record.failure_reason);
  }

  record.status = domain::PaymentAttemptStatus::Completed;
  record.failure_reason.clear();
  record.transaction_id = result.transaction_id;
  storePayment(record);
  notify(PaymentUpdateEvent{record, *record.completed_at});

  domain::Booking booking;
  try {
    booking = transition(reference, BookingStage::Paid,
                         [&](domain::Booking& b) {
                           b.payment_status = domain::PaymentStatus::Paid;
                           b.payment_reference = record.reference;
                         });
  } catch (const BookingStateError&) {
    // Cancelled while the gateway was charging. The charge stands on the
    // payment record; the booking keeps its terminal state.
    std::cerr << "[BookingEngine] Payment " << record.reference
              << " completed but booking " << reference
              << " changed state meanwhile; refund required\n";
    throw;
  }

  std::cout << "[BookingEngine] Paid " << reference << " via "
            << record.gateway << " (" << record.transaction_id << ")\n";
  return PaymentOutcome{booking, record};
}

void BookingEngine::settleLatePayment(const domain::PaymentRecord& record,
                                      const PaymentResult& result) noexcept {
  try {
    settlePayment(record, result);
  } catch (const std::exception& e) {
    std::cerr << "[BookingEngine] Late answer for payment " << record.reference
              << ": " << e.what() << "\n";
  }
}

// -----------------------------------------------------------------------------
// cancel()
// -----------------------------------------------------------------------------
domain::Booking BookingEngine::cancel(const domain::BookingReference& reference,
                                      CancelOrigin origin) {
  const domain::Booking current = ledger_.get(reference);
  if (!isLegalTransition(current.stage, BookingStage::Cancelled)) {
    throw BookingStateError("Booking " + reference + " is already " +
                            domain::toString(current.status));
  }

  if (origin == CancelOrigin::Customer) {
    const double notice = hours_between(now(), current.interval.start);
    if (notice < policy_.cancellation_hours) {
      throw BookingPolicyError(
          "Cancellation must be done at least " +
          std::to_string(policy_.cancellation_hours) +
          " hour(s) before start time");
    }
  }

  domain::Booking cancelled =
      transition(reference, BookingStage::Cancelled, [](domain::Booking& b) {
        if (b.payment_status == domain::PaymentStatus::Paid) {
          b.payment_status = domain::PaymentStatus::Refunded;
        }
      });

  std::cout << "[BookingEngine] Cancelled " << reference << " on "
            << cancelled.space_id << "\n";
  return cancelled;
}

// -----------------------------------------------------------------------------
// checkIn() / checkOut()
// -----------------------------------------------------------------------------
domain::Booking BookingEngine::recordPresence(
    const domain::BookingReference& reference,
    domain::OccupancyEventType type) {
  const domain::Booking booking = ledger_.get(reference);
  if (booking.status != domain::BookingStatus::Confirmed) {
    throw BookingStateError("Booking " + reference + " is " +
                            domain::toString(booking.status) +
                            "; only confirmed bookings can check in or out");
  }

  domain::OccupancyEvent event;
  event.space_id = booking.space_id;
  event.type = type;
  event.timestamp = now();
  if (type == domain::OccupancyEventType::Enter) {
    event.vehicle_type = booking.customer.vehicle_type;
  }

  RecordedEvent recorded = occupancy_.recordEvent(std::move(event));
  std::cout << "[BookingEngine] " << domain::toString(type) << " recorded for "
            << reference << " on " << booking.space_id << "\n";
  notify(OccupancyUpdateEvent{recorded.event, recorded.snapshot,
                              recorded.previous_occupied,
                              recorded.event.timestamp});
  return booking;
}

domain::Booking BookingEngine::checkIn(
    const domain::BookingReference& reference) {
  return recordPresence(reference, domain::OccupancyEventType::Enter);
}

domain::Booking BookingEngine::checkOut(
    const domain::BookingReference& reference) {
  return recordPresence(reference, domain::OccupancyEventType::Exit);
}

// -----------------------------------------------------------------------------
// completeElapsed(): reconciliation pass
// -----------------------------------------------------------------------------
std::size_t BookingEngine::completeElapsed() {
  const Timestamp current = now();
  std::size_t completed = 0;

  for (const auto& booking : ledger_.list()) {
    if (booking.stage != BookingStage::Paid ||
        booking.interval.end > current) {
      continue;
    }
    try {
      transition(booking.reference, BookingStage::Completed);
      ++completed;
    } catch (const BookingStateError& e) {
      // Cancelled between list() and transition().
      std::cerr << "[BookingEngine] Skipping completion: " << e.what() << "\n";
    }
  }

  if (completed > 0) {
    std::cout << "[BookingEngine] Completed " << completed
              << " elapsed booking(s)\n";
  }
  return completed;
}

domain::Booking BookingEngine::getBooking(
    const domain::BookingReference& reference) const {
  return ledger_.get(reference);
}

std::vector<domain::Booking> BookingEngine::listBookings(
    const BookingFilter& filter) const {
  std::vector<domain::Booking> out;
  for (auto& booking : ledger_.list()) {
    if (filter.status && booking.status != *filter.status) {
      continue;
    }
    if (filter.starting_from &&
        booking.interval.start < *filter.starting_from) {
      continue;
    }
    out.push_back(std::move(booking));
  }

  std::sort(out.begin(), out.end(),
            [](const domain::Booking& a, const domain::Booking& b) {
              if (a.created_at != b.created_at) {
                return a.created_at > b.created_at;
              }
              return a.reference > b.reference;
            });
  if (out.size() > filter.limit) {
    out.resize(filter.limit);
  }
  return out;
}

domain::PaymentRecord BookingEngine::getPayment(
    const domain::PaymentReference& reference) const {
  std::shared_lock lock(payments_mutex_);
  auto it = payments_.find(reference);
  if (it == payments_.end()) {
    throw PaymentNotFoundError(reference);
  }
  return it->second;
}

}  // namespace park
