#pragma once

#include "park/concurrent/thread_safe_queue.hpp"
#include "park/eventbus/event_bus.hpp"
#include "park/events/event.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <thread>

namespace park {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
// Responsibility: Owns one worker thread that drains a ThreadSafeQueue<Event>
// and publishes each event on its EventBus. Any thread may push(); every
// subscriber callback runs on the worker, so notification handling is
// serialized and never runs on a request handler's thread.
//
// Lifecycle: construct, subscribe on eventBus(), start(), push() from
// anywhere, stop(). stop() drains what is already queued before joining so
// no accepted notification is lost on shutdown.
//
// Thread model: start() and stop() from the owning thread; push(),
// eventBus() and processedCount() from any thread.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "event_loop");

  // Joins the worker if still running.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Starts the worker. No-op if already running.
  void start();

  // Signals the worker, waits for it to drain the queue and exit. Idempotent.
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  bool isRunning() const { return running_.load(); }

  // Number of events published so far. Tests poll this instead of sleeping.
  std::size_t processedCount() const { return processed_.load(); }

 private:
  // Worker loop: wait up to kIdleWaitTimeout for an event, publish it,
  // re-check running_.
  void run();

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> processed_{0};
  std::thread thread_;
};

}  // namespace park
