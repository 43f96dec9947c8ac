// =============================================================================
// concurrent_workers_test.cpp
// =============================================================================
// Tests for the engine's worker primitives:
//   - EventLoopThread: delivery on the worker thread, drain on stop()
//   - PeriodicTaskThread: repeated runs, prompt stop, failing task tolerated
//   - ReferenceGenerator: format and uniqueness under concurrent callers
// =============================================================================

#include "park/concurrent/event_loop_thread.hpp"
#include "park/concurrent/periodic_task_thread.hpp"
#include "park/concurrent/reference_generator.hpp"
#include "park/time/simulation_time_provider.hpp"
#include "park/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------

TEST(EventLoopThreadTest, DeliversOnWorkerThread) {
  park::EventLoopThread loop("test_loop");

  std::promise<std::thread::id> delivered_on;
  auto future = delivered_on.get_future();
  loop.eventBus().subscribe<park::HeartbeatEvent>(
      [&delivered_on](const park::HeartbeatEvent&) {
        delivered_on.set_value(std::this_thread::get_id());
      });

  loop.start();
  loop.push(park::HeartbeatEvent{"test", "ok"});

  ASSERT_EQ(future.wait_for(2s), std::future_status::ready);
  EXPECT_NE(future.get(), std::this_thread::get_id());
  loop.stop();
  EXPECT_FALSE(loop.isRunning());
}

TEST(EventLoopThreadTest, StopDrainsQueuedEvents) {
  park::EventLoopThread loop("drain_loop");
  std::atomic<int> seen{0};
  loop.eventBus().subscribe([&seen](const park::Event&) { ++seen; });

  // Pushed before start(): must still be delivered.
  for (int i = 0; i < 20; ++i) {
    loop.push(park::HeartbeatEvent{"test", "ok"});
  }
  loop.start();
  loop.stop();

  EXPECT_EQ(seen.load(), 20);
  EXPECT_EQ(loop.processedCount(), 20u);
}

TEST(EventLoopThreadTest, StopWithoutStartIsNoOp) {
  park::EventLoopThread loop;
  EXPECT_NO_THROW(loop.stop());
}

// -----------------------------------------------------------------------------
// PeriodicTaskThread
// -----------------------------------------------------------------------------

TEST(PeriodicTaskThreadTest, RunsRepeatedly) {
  std::atomic<int> runs{0};
  park::PeriodicTaskThread task("tick", 5ms, [&runs] { ++runs; });
  task.start();

  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (runs.load() < 3 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(1ms);
  }
  task.stop();

  EXPECT_GE(runs.load(), 3);
  EXPECT_EQ(task.runCount(), static_cast<std::size_t>(runs.load()));
}

// A long interval must not delay shutdown.
TEST(PeriodicTaskThreadTest, StopDoesNotWaitOutInterval) {
  park::PeriodicTaskThread task("slow", 1h, [] {});
  task.start();

  const auto started = std::chrono::steady_clock::now();
  task.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - started, 1s);
  EXPECT_EQ(task.runCount(), 0u);
}

TEST(PeriodicTaskThreadTest, FailingTaskKeepsSchedule) {
  std::atomic<int> attempts{0};
  park::PeriodicTaskThread task("flaky", 2ms, [&attempts] {
    ++attempts;
    throw std::runtime_error("reconciliation failed");
  });
  task.start();

  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (attempts.load() < 2 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(1ms);
  }
  task.stop();

  EXPECT_GE(attempts.load(), 2);
}

// -----------------------------------------------------------------------------
// ReferenceGenerator
// -----------------------------------------------------------------------------

TEST(ReferenceGeneratorTest, PrefixTimestampAndSequence) {
  // 2025-03-01T10:15:00Z
  park::SimulationTimeProvider clock(
      park::timestamp_to_ms(*park::parse_iso8601("2025-03-01T10:15:00Z")));
  park::ReferenceGenerator gen("BK", clock);

  EXPECT_EQ(gen.next(), "BK202503011015000000");
  EXPECT_EQ(gen.next(), "BK202503011015000001");
  EXPECT_EQ(gen.prefix(), "BK");
}

TEST(ReferenceGeneratorTest, UniqueAcrossThreads) {
  park::SimulationTimeProvider clock(1'700'000'000'000);
  park::ReferenceGenerator gen("PAY", clock);

  constexpr int kThreads = 8;
  constexpr int kPerThread = 200;
  std::mutex mutex;
  std::set<std::string> refs;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      std::vector<std::string> local;
      for (int i = 0; i < kPerThread; ++i) {
        local.push_back(gen.next());
      }
      std::lock_guard<std::mutex> lock(mutex);
      refs.insert(local.begin(), local.end());
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(refs.size(), static_cast<std::size_t>(kThreads * kPerThread));
  for (const auto& ref : refs) {
    ASSERT_EQ(ref.rfind("PAY", 0), 0u);
    ASSERT_EQ(ref.size(), 3u + 14u + 4u);
  }
}
