#pragma once

#include "park/api/requests.hpp"
#include "park/availability/availability_index.hpp"
#include "park/booking/booking_engine.hpp"
#include "park/booking/booking_ledger.hpp"
#include "park/concurrent/event_loop_thread.hpp"
#include "park/concurrent/periodic_task_thread.hpp"
#include "park/config/engine_config.hpp"
#include "park/forecast/i_forecaster.hpp"
#include "park/history/history_aggregator.hpp"
#include "park/network/detection_thread.hpp"
#include "park/network/ipc_server.hpp"
#include "park/occupancy/detection_ingestor.hpp"
#include "park/occupancy/occupancy_store.hpp"
#include "park/payment/i_payment_gateway.hpp"
#include "park/pricing/pricing_calculator.hpp"
#include "park/registry/space_registry.hpp"
#include "park/service/parking_service.hpp"
#include "park/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace park {

// -----------------------------------------------------------------------------
// ParkingEngine
// -----------------------------------------------------------------------------
//
// @brief  Central orchestrator: owns the core components, the threads around
//         them and the JSON command surface.
//
// @details
// Provides a lifecycle API (start/stop) so main() and tests can run the
// whole system without wiring internals.
//
// The core components (registry, occupancy store, ledger, booking engine,
// forecaster, ...) are built in the constructor and live as long as the
// engine. start()/stop() only bring the threads up and down, so bookings and
// the occupancy log survive a restart of the I/O side. executeCommand() works
// whether or not the engine is started; tests use it directly.
//
// Thread layout after start():
//
//   notification loop   → EventBus fan-out of occupancy/booking/payment
//                         updates (telemetry bridge, external subscribers)
//   maintenance thread  → every maintenance.interval: reconcile elapsed paid
//                         bookings, publish a heartbeat
//   ipc thread          → REP commands (executeCommand) + PUB telemetry
//                         (only if both ipc endpoints are set)
//   detection thread    → SUB detector batches → ParkingService::ingest
//                         (only if detection.endpoint is set)
//
//   main thread         → engine.start(), wait for shutdown, engine.stop()
//
// Core components never call into the boundary. They report changes through
// an EventSink bound to notification_loop_.push(), which returns at once.
//
// Thread model:
//   Constructed, started, stopped and destroyed on one thread (main).
//   executeCommand() and service() are safe from any thread.
//
// Ownership:
//   ParkingEngine
//    ├── time_provider_       (const ITimeProvider&, non-owning)
//    ├── config_              (EngineConfig, value member)
//    ├── notification_loop_   (EventLoopThread, value member)
//    ├── registry_ .. service_ (unique_ptr, built in dependency order)
//    ├── maintenance_thread_  (unique_ptr<PeriodicTaskThread>)
//    ├── ipc_server_          (unique_ptr<IpcServer>)
//    └── detection_thread_    (unique_ptr<DetectionThread>)
//
// Threads are declared last so they are destroyed first; stop() releases
// them explicitly before anything they call into.
// -----------------------------------------------------------------------------
class ParkingEngine {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  config         Validated here (ConfigError on failure).
  // @param  time_provider  Source of "now" for every component. Must outlive
  //                        the engine.
  // @param  payment_gateway  Optional collaborator override. When null the
  //                          gateway named by config.payment.gateway is
  //                          created ("demo").
  //
  // @throws ConfigError  Invalid config, unknown gateway or forecast model,
  //                      unreadable linear-model parameter file.
  //
  // No threads are spawned and no sockets are opened here.
  // -------------------------------------------------------------------------
  ParkingEngine(EngineConfig config, const ITimeProvider& time_provider,
                std::shared_ptr<IPaymentGateway> payment_gateway = nullptr);

  ~ParkingEngine();

  ParkingEngine(const ParkingEngine&) = delete;
  ParkingEngine& operator=(const ParkingEngine&) = delete;
  ParkingEngine(ParkingEngine&&) = delete;
  ParkingEngine& operator=(ParkingEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Startup sequence:
  //   1. Notification loop (subscribers see every change from here on).
  //   2. IpcServer + telemetry bridge.
  //   3. Maintenance thread.
  //   4. Detection thread LAST, so every consumer is live before the first
  //      detector batch arrives.
  //
  // Idempotent. Call from one thread only.
  // @throws zmq::error_t if an endpoint cannot be bound or connected.
  // -------------------------------------------------------------------------
  void start();

  // Reverse of start(). Idempotent. After stop(), start() may be called
  // again.
  void stop();

  bool isRunning() const { return running_; }

  // -------------------------------------------------------------------------
  // executeCommand(raw)
  // -------------------------------------------------------------------------
  // @brief  Runs one JSON command and returns the JSON reply.
  //
  // @param  raw  {"method": "GET"|"POST", "path": "...", "params": {...}}
  //
  // @details
  // Never throws: every failure becomes the error envelope rendered by
  // api::ResponseFormatter. Failures are logged to std::cerr with the
  // command's path.
  //
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& raw);

  // Reconciles elapsed bookings and publishes a heartbeat. Called by the
  // maintenance thread; public so tests can trigger a pass.
  void runMaintenance();

  ParkingService& service() { return *service_; }

  // Subscribers run on the notification loop thread.
  EventBus& notificationBus() { return notification_loop_.eventBus(); }

  const EngineConfig& config() const { return config_; }

 private:
  nlohmann::json dispatch(const api::Command& command);

  std::unique_ptr<IForecaster> makeForecaster() const;
  std::shared_ptr<IPaymentGateway> makePaymentGateway() const;

  void notify(Event event);

  const ITimeProvider& time_provider_;
  EngineConfig config_;

  // --- Notification fan-out (value member) ----------------------------------
  EventLoopThread notification_loop_{"notifications"};

  // --- Core components (construction order = dependency order) ---------------
  std::unique_ptr<SpaceRegistry> registry_;
  std::unique_ptr<OccupancyStore> store_;
  std::unique_ptr<BookingLedger> ledger_;
  std::unique_ptr<PricingCalculator> pricing_;
  std::shared_ptr<IPaymentGateway> payment_gateway_;
  std::unique_ptr<BookingEngine> booking_engine_;
  std::unique_ptr<HistoryAggregator> history_;
  std::unique_ptr<IForecaster> forecaster_;
  std::unique_ptr<AvailabilityIndex> availability_;
  std::unique_ptr<DetectionIngestor> ingestor_;
  std::unique_ptr<ParkingService> service_;

  // --- Threads (destroyed first) ---------------------------------------------
  std::unique_ptr<PeriodicTaskThread> maintenance_thread_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<DetectionThread> detection_thread_;
  std::optional<EventBus::SubscriptionId> telemetry_subscription_;

  std::atomic<std::uint64_t> heartbeat_sequence_{0};
  bool running_{false};
};

}  // namespace park
