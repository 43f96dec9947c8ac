#include "park/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <iostream>

namespace park {

namespace {

// Upper bound on how long stop() waits for an idle worker to notice.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

EventLoopThread::~EventLoopThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
  std::cout << "[EventLoopThread] " << name_ << " started\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  // The worker wakes within kIdleWaitTimeout; no lock is held across join().
  thread_.join();
  std::cout << "[EventLoopThread] " << name_ << " stopped after "
            << processed_.load() << " event(s)\n";
}

// -----------------------------------------------------------------------------
// run() - worker loop
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.pop_for(kIdleWaitTimeout);
    if (event) {
      bus_.publish(*event);
      processed_.fetch_add(1);
    }
  }

  // Drain: events pushed before stop() are still delivered.
  while (std::optional<Event> event = queue_.try_pop()) {
    bus_.publish(*event);
    processed_.fetch_add(1);
  }
}

}  // namespace park
