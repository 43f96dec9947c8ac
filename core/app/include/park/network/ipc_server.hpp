#pragma once

#include "park/concurrent/thread_safe_queue.hpp"
#include "park/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace park {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ command and telemetry endpoint
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that answers JSON commands from dashboards
//         and booking front-ends (REP socket) and broadcasts occupancy,
//         booking and payment updates (PUB socket).
//
// @details
// One worker thread serves both sockets:
//   REP  (command_endpoint, default port 5556)
//        Request: {"method": "...", "path": "...", "params": {...}}.
//        The raw string goes to command_handler_ (ParkingEngine::
//        executeCommand()); its JSON reply goes back on the same socket.
//        The worker polls REP with a kPollTimeout budget and, between polls,
//        flushes pending telemetry.
//   PUB  (telemetry_endpoint, default port 5557)
//        One JSON document per notification, rendered by
//        ResponseFormatter::formatTelemetry(). Sends use dontwait; when the
//        high-water mark is reached the update is dropped and counted.
// Thread model:
//   Constructed and destroyed on the main thread (via ParkingEngine).
//   start() spawns the worker; stop() sets an atomic flag and joins it.
//   pushTelemetry() may be called from any thread.
//
//   command_handler_ runs on the IPC thread. Everything it reaches in the
//   core is thread-safe, so commands may overlap with ingestion and the
//   maintenance task.
//
// Ownership:
//   Owned by ParkingEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  command_handler     Takes the raw request, returns the JSON reply.
  // @param  command_endpoint    Bind address of the REP socket.
  // @param  telemetry_endpoint  Bind address of the PUB socket.
  //
  // No sockets are opened and no threads are spawned here.
  // -------------------------------------------------------------------------
  IpcServer(CommandHandler command_handler,
            std::string command_endpoint,
            std::string telemetry_endpoint);

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. No-op when running.
  // @throws zmq::error_t if an endpoint cannot be bound.
  void start();

  // Publishes what is still queued, then joins. Idempotent.
  void stop();

  // Thread-safety: Safe to call from any thread.
  void pushTelemetry(Event event);

  bool isRunning() const { return running_.load(); }

 private:
  static constexpr std::chrono::milliseconds kPollTimeout{50};

  void serve();
  bool commandPending();
  void answerCommand();
  void flushTelemetry();

  CommandHandler command_handler_;
  std::string command_endpoint_;
  std::string telemetry_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> rep_;
  std::unique_ptr<zmq::socket_t> pub_;

  ThreadSafeQueue<Event> outbox_;
  std::size_t dropped_{0};  // Worker thread only

  std::thread worker_;
  std::atomic<bool> running_{false};
};

}  // namespace park
