#include "park/concurrent/periodic_task_thread.hpp"

#include <exception>
#include <iostream>

namespace park {

PeriodicTaskThread::PeriodicTaskThread(std::string name,
                                       std::chrono::milliseconds interval,
                                       Task task)
    : name_(std::move(name)), interval_(interval), task_(std::move(task)) {}

PeriodicTaskThread::~PeriodicTaskThread() { stop(); }

void PeriodicTaskThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
  std::cout << "[PeriodicTaskThread] " << name_ << " started (every "
            << interval_.count() << " ms)\n";
}

void PeriodicTaskThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  {
    // Store under the mutex so the worker cannot miss the notify between
    // checking the predicate and blocking.
    std::lock_guard lock(mutex_);
    running_.store(false);
  }
  cv_.notify_all();
  thread_.join();
  std::cout << "[PeriodicTaskThread] " << name_ << " stopped\n";
}

// -----------------------------------------------------------------------------
// run() - sleep one interval, run the task, repeat
// -----------------------------------------------------------------------------
void PeriodicTaskThread::run() {
  while (true) {
    {
      std::unique_lock lock(mutex_);
      if (cv_.wait_for(lock, interval_, [this] { return !running_.load(); })) {
        return;
      }
    }

    try {
      task_();
    } catch (const std::exception& e) {
      std::cerr << "[PeriodicTaskThread] " << name_
                << " task failed: " << e.what() << "\n";
    }
    runs_.fetch_add(1);
  }
}

}  // namespace park
