#pragma once

#include "park/occupancy/i_occupancy_detector.hpp"
#include "park/time/i_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>

namespace park {

// -----------------------------------------------------------------------------
// DetectionGateway: ZeroMQ SUB receiver for detector batches
// -----------------------------------------------------------------------------
//
// @brief  Connects to the camera detector's PUB socket, decodes each message
//         into a DetectionBatch and hands it to a sink.
//
// @details
// Wire format (one JSON document per message):
//
//   {"timestamp_ms": 1760869800000,
//    "detections": [{"space_id": "P001", "is_occupied": true,
//                    "confidence": 0.91, "vehicle_type": "car"}, ...]}
//
// "timestamp" (ISO-8601) may replace timestamp_ms; with neither, the batch
// is stamped with the time provider's now. Decoding is shared with the
// command surface (api::RequestParser::detectionBatch).
//
// A malformed message is logged to std::cerr and skipped; it never stops
// the loop. Per-detection rejection (unknown space, low confidence, stale
// timestamp) happens later, in the DetectionIngestor behind the sink.
//
// Thread model:
//   run() blocks the calling thread (the detection thread). stop() may be
//   called from any thread; run() notices within kRecvTimeoutMs.
//
// Ownership:
//   Owns the ZMQ context and socket. Holds a reference to the time
//   provider, which must outlive it.
// -----------------------------------------------------------------------------
class DetectionGateway {
 public:
  using BatchSink = std::function<void(DetectionBatch)>;

  DetectionGateway(const ITimeProvider& time_provider, BatchSink sink,
                   const std::string& endpoint);

  ~DetectionGateway() = default;

  DetectionGateway(const DetectionGateway&) = delete;
  DetectionGateway& operator=(const DetectionGateway&) = delete;
  DetectionGateway(DetectionGateway&&) = delete;
  DetectionGateway& operator=(DetectionGateway&&) = delete;

  void run();
  void stop();

  // -------------------------------------------------------------------------
  // handleMessage(payload)
  // -------------------------------------------------------------------------
  // @brief  Decodes one payload and forwards it to the sink.
  //
  // @return false if the payload was malformed (already logged).
  //
  // Called by run() for every message; public so the decoding path can be
  // exercised without a socket.
  // -------------------------------------------------------------------------
  bool handleMessage(const std::string& payload);

  std::size_t receivedCount() const { return received_.load(); }
  std::size_t malformedCount() const { return malformed_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  const ITimeProvider& time_provider_;
  BatchSink sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> stop_requested_{false};
  std::atomic<std::size_t> received_{0};
  std::atomic<std::size_t> malformed_{0};
};

}  // namespace park
