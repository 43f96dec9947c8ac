// -----------------------------------------------------------------------------
// park_engine: single executable entry point.
//
//   park_engine [config.json]
//
//   1) Load the EngineConfig (defaults when no file is given).
//   2) Create the wall-clock LiveTimeProvider.
//   3) Create the ParkingEngine and start it: notification loop, maintenance
//      thread, IPC server (REP commands + PUB telemetry) and the detector
//      SUB thread.
//   4) Wait on the main thread until SIGINT/SIGTERM.
//   5) Shut down cleanly.
//
// Thread layout:
//   main thread         → waits for a shutdown signal
//   notification thread → EventBus fan-out, telemetry bridge
//   maintenance thread  → booking reconciliation, heartbeat
//   ipc thread          → command handling, telemetry publishing
//   detection thread    → detector batch ingestion
// -----------------------------------------------------------------------------

#include "park/common/errors.hpp"
#include "park/config/engine_config.hpp"
#include "park/engine/parking_engine.hpp"
#include "park/time/live_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

// -----------------------------------------------------------------------------
// The only global in the program. The signal handler may only touch a
// lock-free atomic; main() polls it and performs the shutdown itself.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void shutdown_handler(int /*signum*/) {
  g_shutdown_requested.store(true);
}

int main(int argc, char** argv) {
  park::EngineConfig config;
  try {
    if (argc > 1) {
      config = park::EngineConfig::loadFile(argv[1]);
      std::cout << "[main] Loaded configuration from " << argv[1] << "\n";
    } else {
      std::cout << "[main] No configuration file given, using defaults.\n";
    }
  } catch (const park::ConfigError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 2;
  }

  park::LiveTimeProvider clock;

  try {
    park::ParkingEngine engine(config, clock);

    std::signal(SIGINT, shutdown_handler);
    std::signal(SIGTERM, shutdown_handler);

    engine.start();

    std::cout << "[main] Commands on " << config.ipc.command_endpoint
              << ", telemetry on " << config.ipc.telemetry_endpoint
              << ", detector feed from " << config.detection.endpoint << "\n"
              << "[main] Press Ctrl-C to shut down.\n";

    while (!g_shutdown_requested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n[main] Shutdown requested. Stopping engine...\n";
    engine.stop();
  } catch (const park::Error& e) {
    std::cerr << "[main] Engine error: " << e.what() << "\n";
    return 1;
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] Socket error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
