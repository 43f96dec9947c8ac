#include "park/network/ipc_server.hpp"

#include "park/api/response_formatter.hpp"

#include <cerrno>
#include <iostream>
#include <utility>
#include <vector>

namespace park {

IpcServer::IpcServer(CommandHandler command_handler,
                     std::string command_endpoint,
                     std::string telemetry_endpoint)
    : command_handler_(std::move(command_handler)),
      command_endpoint_(std::move(command_endpoint)),
      telemetry_endpoint_(std::move(telemetry_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): REP + PUB on a fresh context, then the worker
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  rep_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);
  for (zmq::socket_t* socket : {rep_.get(), pub_.get()}) {
    socket->set(zmq::sockopt::linger, 0);
  }
  rep_->bind(command_endpoint_);
  pub_->bind(telemetry_endpoint_);

  dropped_ = 0;
  running_.store(true);
  worker_ = std::thread([this] { serve(); });

  std::cout << "[IpcServer] Listening: commands on " << command_endpoint_
            << ", telemetry on " << telemetry_endpoint_ << "\n";
}

void IpcServer::stop() {
  running_.store(false);
  if (!worker_.joinable()) {
    return;
  }
  worker_.join();

  rep_.reset();
  pub_.reset();
  context_.reset();

  std::cout << "[IpcServer] Closed (" << dropped_
            << " telemetry update(s) dropped)\n";
}

void IpcServer::pushTelemetry(Event event) { outbox_.push(std::move(event)); }

// -----------------------------------------------------------------------------
// serve(): worker loop. Telemetry still queued at shutdown is published once.
// -----------------------------------------------------------------------------
void IpcServer::serve() {
  while (running_.load()) {
    flushTelemetry();
    if (commandPending()) {
      answerCommand();
    }
  }
  flushTelemetry();
}

bool IpcServer::commandPending() {
  std::vector<zmq::pollitem_t> items = {
      {static_cast<void*>(*rep_), 0, ZMQ_POLLIN, 0}};
  try {
    zmq::poll(items, kPollTimeout);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return false;
    }
    throw;
  }
  return (items[0].revents & ZMQ_POLLIN) != 0;
}

// -----------------------------------------------------------------------------
// answerCommand(): exactly one reply per request on a REP socket
// -----------------------------------------------------------------------------
void IpcServer::answerCommand() {
  zmq::message_t request;
  if (!rep_->recv(request, zmq::recv_flags::dontwait)) {
    return;
  }

  std::string reply;
  try {
    reply = command_handler_(request.to_string());
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] Handler threw: " << e.what() << "\n";
    reply = api::ResponseFormatter::internalError(e.what()).dump();
  }

  if (!rep_->send(zmq::buffer(reply), zmq::send_flags::none)) {
    std::cerr << "[IpcServer] Reply not sent for request of "
              << request.size() << " byte(s)\n";
  }
}

void IpcServer::flushTelemetry() {
  while (auto event = outbox_.try_pop()) {
    const auto payload = api::ResponseFormatter::formatTelemetry(*event);
    if (!payload) {
      continue;
    }
    if (!pub_->send(zmq::buffer(*payload), zmq::send_flags::dontwait)) {
      ++dropped_;
    }
  }
}

}  // namespace park
