#include "park/network/detection_thread.hpp"

#include <iostream>
#include <utility>

namespace park {

DetectionThread::DetectionThread(const ITimeProvider& time_provider,
                                 DetectionGateway::BatchSink sink,
                                 std::string endpoint)
    : time_provider_(time_provider),
      sink_(std::move(sink)),
      endpoint_(std::move(endpoint)) {}

DetectionThread::~DetectionThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): create gateway and spawn recv thread
// -----------------------------------------------------------------------------
void DetectionThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ = std::make_unique<DetectionGateway>(time_provider_, sink_,
                                                endpoint_);
  thread_ = std::thread([this] {
    std::cout << "[DetectionThread] listening on " << endpoint_ << "\n";
    gateway_->run();
    std::cout << "[DetectionThread] recv loop exited. batches="
              << gateway_->receivedCount()
              << " malformed=" << gateway_->malformedCount() << "\n";
  });
}

// -----------------------------------------------------------------------------
// stop(): signal gateway and join thread
// -----------------------------------------------------------------------------
void DetectionThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  gateway_.reset();
}

}  // namespace park
