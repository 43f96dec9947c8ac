#include "park/network/detection_gateway.hpp"

#include "park/api/request_parser.hpp"
#include "park/common/errors.hpp"
#include "park/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace park {

// -----------------------------------------------------------------------------
// Constructor: SUB socket, all topics, bounded recv
// -----------------------------------------------------------------------------
DetectionGateway::DetectionGateway(const ITimeProvider& time_provider,
                                   BatchSink sink,
                                   const std::string& endpoint)
    : time_provider_(time_provider), sink_(std::move(sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.set(zmq::sockopt::linger, 0);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void DetectionGateway::run() {
  while (!stop_requested_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;
    }
    handleMessage(msg.to_string());
  }
}

void DetectionGateway::stop() { stop_requested_.store(true); }

bool DetectionGateway::handleMessage(const std::string& payload) {
  DetectionBatch batch;
  try {
    batch = api::RequestParser::detectionBatch(
        nlohmann::json::parse(payload),
        ms_to_timestamp(time_provider_.now_ms()));
  } catch (const nlohmann::json::exception& e) {
    ++malformed_;
    std::cerr << "[DetectionGateway] JSON parse error: " << e.what()
              << " payload: " << payload << "\n";
    return false;
  } catch (const InvalidRequestError& e) {
    ++malformed_;
    std::cerr << "[DetectionGateway] Malformed batch: " << e.what()
              << " payload: " << payload << "\n";
    return false;
  }

  ++received_;
  sink_(std::move(batch));
  return true;
}

}  // namespace park
