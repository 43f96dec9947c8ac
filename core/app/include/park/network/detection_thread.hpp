#pragma once

#include "park/network/detection_gateway.hpp"
#include "park/time/i_time_provider.hpp"

#include <memory>
#include <string>
#include <thread>

namespace park {

// -----------------------------------------------------------------------------
// DetectionThread: dedicated I/O thread for detector batches
// -----------------------------------------------------------------------------
//
// @brief  Wraps a DetectionGateway and the std::thread running its recv loop
//         into one RAII component owned by ParkingEngine.
//
// @details
// The gateway has its own blocking loop (ZMQ with ZMQ_RCVTIMEO) rather than
// a queue to drain, so it gets a raw std::thread instead of an
// EventLoopThread. The sink is called on this thread; ParkingEngine binds it
// to ParkingService::ingest(), which is thread-safe.
//
// The gateway is created in start(), not in the constructor, so no socket
// is opened until the engine is ready to ingest.
//
// Thread model:
//   start()/stop() from the owning thread (main). stop() blocks until the
//   loop exits (at most DetectionGateway::kRecvTimeoutMs).
// -----------------------------------------------------------------------------
class DetectionThread {
 public:
  DetectionThread(const ITimeProvider& time_provider,
                  DetectionGateway::BatchSink sink, std::string endpoint);

  ~DetectionThread();

  DetectionThread(const DetectionThread&) = delete;
  DetectionThread& operator=(const DetectionThread&) = delete;
  DetectionThread(DetectionThread&&) = delete;
  DetectionThread& operator=(DetectionThread&&) = delete;

  // Creates the gateway (connects the socket) and spawns the thread.
  // Idempotent.
  void start();

  // Idempotent; safe if never started.
  void stop();

  bool isRunning() const { return thread_.joinable(); }

 private:
  const ITimeProvider& time_provider_;
  DetectionGateway::BatchSink sink_;
  std::string endpoint_;

  std::unique_ptr<DetectionGateway> gateway_;
  std::thread thread_;
};

}  // namespace park
