#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace park {

// -----------------------------------------------------------------------------
// PeriodicTaskThread: the engine's scheduled-task worker
// -----------------------------------------------------------------------------
//
// @brief  Owns one thread that calls a task every `interval` until stopped.
//
// @details
// The core exposes pull-style queries only; anything that must happen on a
// timer (reconciling bookings whose end_time has passed) runs here at the
// boundary. The first run happens one interval after start().
//
// The task runs on the worker thread. An exception escaping the task is
// logged with the thread's name and the schedule continues; a failing
// reconciliation pass must not end all future passes.
//
// Thread model:
//   start()/stop() from the owning thread. stop() wakes the worker
//   immediately through a condition variable rather than waiting out the
//   interval.
// -----------------------------------------------------------------------------
class PeriodicTaskThread {
 public:
  using Task = std::function<void()>;

  PeriodicTaskThread(std::string name, std::chrono::milliseconds interval,
                     Task task);

  ~PeriodicTaskThread();

  PeriodicTaskThread(const PeriodicTaskThread&) = delete;
  PeriodicTaskThread& operator=(const PeriodicTaskThread&) = delete;
  PeriodicTaskThread(PeriodicTaskThread&&) = delete;
  PeriodicTaskThread& operator=(PeriodicTaskThread&&) = delete;

  void start();
  void stop();

  bool isRunning() const { return running_.load(); }

  // Completed task invocations (including ones that threw).
  std::size_t runCount() const { return runs_.load(); }

 private:
  void run();

  std::string name_;
  std::chrono::milliseconds interval_;
  Task task_;

  std::atomic<bool> running_{false};
  std::atomic<std::size_t> runs_{0};
  std::mutex mutex_;
  std::condition_variable cv_;
  std::thread thread_;
};

}  // namespace park
