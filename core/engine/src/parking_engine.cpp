#include "park/engine/parking_engine.hpp"

#include "park/api/request_parser.hpp"
#include "park/api/response_formatter.hpp"
#include "park/common/errors.hpp"
#include "park/forecast/linear_feature_forecaster.hpp"
#include "park/forecast/seasonal_profile_forecaster.hpp"
#include "park/payment/demo_payment_gateway.hpp"
#include "park/time/time_utils.hpp"

#include <iostream>
#include <utility>

namespace park {

using api::RequestParser;
using api::ResponseFormatter;

// -----------------------------------------------------------------------------
// Constructor: build the core in dependency order
// -----------------------------------------------------------------------------
ParkingEngine::ParkingEngine(EngineConfig config,
                             const ITimeProvider& time_provider,
                             std::shared_ptr<IPaymentGateway> payment_gateway)
    : time_provider_(time_provider),
      config_(std::move(config)),
      payment_gateway_(std::move(payment_gateway)) {
  config_.validate();

  EventSink sink = [this](Event event) { notify(std::move(event)); };

  registry_ = std::make_unique<SpaceRegistry>(config_.lot);
  store_ = std::make_unique<OccupancyStore>(
      *registry_, ms_to_timestamp(time_provider_.now_ms()));
  ledger_ = std::make_unique<BookingLedger>(*registry_);
  pricing_ = std::make_unique<PricingCalculator>(*registry_,
                                                 config_.booking.currency);
  if (!payment_gateway_) {
    payment_gateway_ = makePaymentGateway();
  }
  booking_engine_ = std::make_unique<BookingEngine>(
      *registry_, *ledger_, *store_, *pricing_, payment_gateway_,
      time_provider_, config_.booking, config_.payment.timeout, sink);
  history_ = std::make_unique<HistoryAggregator>(*store_, *registry_,
                                                 config_.history.window);
  forecaster_ = makeForecaster();
  availability_ =
      std::make_unique<AvailabilityIndex>(*registry_, *store_, *ledger_);
  ingestor_ = std::make_unique<DetectionIngestor>(
      *store_, config_.detection.confidence_threshold, sink);
  service_ = std::make_unique<ParkingService>(
      *registry_, *store_, *history_, *forecaster_, *availability_, *pricing_,
      *booking_engine_, *ingestor_, time_provider_,
      config_.forecast.lookback_hours, sink);

  std::cout << "[ParkingEngine] " << registry_->size() << " space(s), "
            << "forecast=" << forecaster_->name()
            << " payment=" << payment_gateway_->name() << "\n";
}

ParkingEngine::~ParkingEngine() { stop(); }

std::unique_ptr<IForecaster> ParkingEngine::makeForecaster() const {
  const ForecastConfig& fc = config_.forecast;
  if (fc.model == "linear") {
    return std::make_unique<LinearFeatureForecaster>(
        LinearModelParameters::loadFile(fc.model_path),
        fc.min_history_buckets);
  }
  if (fc.model == "seasonal") {
    return std::make_unique<SeasonalProfileForecaster>(fc.min_history_buckets);
  }
  throw ConfigError("Unknown forecast model: " + fc.model);
}

std::shared_ptr<IPaymentGateway> ParkingEngine::makePaymentGateway() const {
  if (config_.payment.gateway == "demo") {
    return std::make_shared<DemoPaymentGateway>(
        config_.payment.declined_methods, config_.payment.simulated_latency);
  }
  throw ConfigError("Unknown payment gateway: " + config_.payment.gateway);
}

void ParkingEngine::notify(Event event) {
  notification_loop_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void ParkingEngine::start() {
  if (running_) {
    return;
  }

  // ---  1) Notification loop ------------------------------------------------
  notification_loop_.start();

  // ---  2) IpcServer + telemetry bridge -------------------------------------
  if (!config_.ipc.command_endpoint.empty() &&
      !config_.ipc.telemetry_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc.command_endpoint, config_.ipc.telemetry_endpoint);
    ipc_server_->start();

    telemetry_subscription_ = notification_loop_.eventBus().subscribe(
        [this](const Event& e) { ipc_server_->pushTelemetry(e); });
  }

  // ---  3) Maintenance -------------------------------------------------------
  maintenance_thread_ = std::make_unique<PeriodicTaskThread>(
      "maintenance", config_.maintenance.interval,
      [this] { runMaintenance(); });
  maintenance_thread_->start();

  // ---  4) Detection thread LAST --------------------------------------------
  if (!config_.detection.endpoint.empty()) {
    detection_thread_ = std::make_unique<DetectionThread>(
        time_provider_,
        [this](DetectionBatch batch) {
          try {
            service_->ingest(batch);
          } catch (const Error& e) {
            std::cerr << "[ParkingEngine] Detector batch failed: " << e.what()
                      << "\n";
          }
        },
        config_.detection.endpoint);
    detection_thread_->start();
  }

  running_ = true;

  std::cout << "[ParkingEngine] started. Threads: notifications, maintenance"
            << (ipc_server_ ? ", ipc" : "")
            << (detection_thread_ ? ", detection" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void ParkingEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Stop detector inflow first ---------------------------------------
  detection_thread_.reset();

  // ---  2) Maintenance -------------------------------------------------------
  maintenance_thread_.reset();

  // ---  3) Drain notifications, then drop the telemetry bridge ---------------
  notification_loop_.stop();
  if (telemetry_subscription_) {
    notification_loop_.eventBus().unsubscribe(*telemetry_subscription_);
    telemetry_subscription_.reset();
  }

  // ---  4) IpcServer last: publishes what the drain queued -------------------
  ipc_server_.reset();

  running_ = false;

  std::cout << "[ParkingEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// runMaintenance()
// -----------------------------------------------------------------------------
void ParkingEngine::runMaintenance() {
  const std::size_t completed = service_->reconcile();

  HeartbeatEvent heartbeat;
  heartbeat.component_id = "maintenance";
  heartbeat.status = "ok completed=" + std::to_string(completed);
  heartbeat.timestamp = ms_to_timestamp(time_provider_.now_ms());
  heartbeat.sequence_id = ++heartbeat_sequence_;
  notify(std::move(heartbeat));
}

// -----------------------------------------------------------------------------
// executeCommand(): JSON in, JSON out, never throws
// -----------------------------------------------------------------------------
std::string ParkingEngine::executeCommand(const std::string& raw) {
  std::string path = "<unparsed>";
  try {
    const api::Command command = RequestParser::parseCommand(raw);
    path = command.method + " " + command.path;
    return dispatch(command).dump();
  } catch (const Error& e) {
    std::cerr << "[ParkingEngine] " << path << " failed ("
              << ResponseFormatter::errorCode(e.kind()) << "): " << e.what()
              << "\n";
    return ResponseFormatter::error(e).dump();
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[ParkingEngine] " << path << " bad JSON: " << e.what()
              << "\n";
    return ResponseFormatter::error(ErrorKind::InvalidRequest, e.what()).dump();
  } catch (const std::exception& e) {
    std::cerr << "[ParkingEngine] " << path << " internal error: " << e.what()
              << "\n";
    return ResponseFormatter::internalError(e.what()).dump();
  }
}

// -----------------------------------------------------------------------------
// dispatch(): route on method + path
// -----------------------------------------------------------------------------
nlohmann::json ParkingEngine::dispatch(const api::Command& command) {
  const std::string& p = command.path;
  const nlohmann::json& params = command.params;
  const bool get = command.method == "GET";
  const bool post = command.method == "POST";

  if (get && p == "ping") {
    return ResponseFormatter::pong(ms_to_timestamp(time_provider_.now_ms()));
  }

  // Occupancy
  if (get && p == "status") {
    return ResponseFormatter::status(service_->status());
  }
  if (get && p == "history") {
    return ResponseFormatter::history(
        service_->history(RequestParser::history(params)));
  }
  if (get && p == "predict") {
    return ResponseFormatter::forecast(
        service_->predict(RequestParser::predict(params)));
  }
  if (get && p == "spaces/detail") {
    return ResponseFormatter::spaceDetail(
        service_->spaceDetail(RequestParser::space(params)));
  }
  if (post && p == "spaces/update") {
    return ResponseFormatter::spaceUpdate(
        service_->updateSpace(RequestParser::spaceUpdate(params)));
  }
  if (get && p == "events/recent") {
    return ResponseFormatter::events(
        service_->recentEvents(RequestParser::recentEvents(params)));
  }
  if (get && p == "statistics/summary") {
    return ResponseFormatter::statistics(service_->statisticsSummary());
  }
  if (post && p == "detections") {
    return ResponseFormatter::ingest(service_->ingest(
        RequestParser::detectionBatch(
            params, ms_to_timestamp(time_provider_.now_ms()))));
  }

  // Bookings
  if (get && p == "bookings/available") {
    return ResponseFormatter::availability(
        service_->available(RequestParser::availability(params)));
  }
  if (post && p == "bookings/calculate") {
    return ResponseFormatter::quote(
        service_->calculate(RequestParser::quote(params)));
  }
  if (post && p == "bookings/create") {
    return ResponseFormatter::booking(
        service_->createBooking(RequestParser::createBooking(params)));
  }
  if (get && p == "bookings") {
    return ResponseFormatter::bookings(
        service_->bookings(RequestParser::bookingFilter(params)));
  }
  if (get && p == "bookings/detail") {
    return ResponseFormatter::booking(
        service_->bookingDetail(RequestParser::bookingReference(params)));
  }
  if (post && p == "bookings/cancel") {
    return ResponseFormatter::booking(
        service_->cancel(RequestParser::bookingReference(params)));
  }
  if (post && p == "bookings/check-in") {
    return ResponseFormatter::booking(
        service_->checkIn(RequestParser::bookingReference(params)));
  }
  if (post && p == "bookings/check-out") {
    return ResponseFormatter::booking(
        service_->checkOut(RequestParser::bookingReference(params)));
  }

  // Payments
  if (post && p == "payments/process") {
    return ResponseFormatter::payment(
        service_->processPayment(RequestParser::processPayment(params)));
  }
  if (get && p == "payments/detail") {
    return ResponseFormatter::paymentDetail(
        service_->paymentDetail(RequestParser::paymentReference(params)));
  }

  throw NotFoundError("Unknown command: " + command.method + " " + p);
}

}  // namespace park
