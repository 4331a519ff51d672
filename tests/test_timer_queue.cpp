#include "timer_queue.hpp"
#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace prdeck;
using namespace std::chrono_literals;

TEST_CASE("due timers fire in deadline order") {
  TimerQueue timers;
  std::vector<int> fired;
  timers.schedule(200ms, [&] { fired.push_back(2); });
  timers.schedule(100ms, [&] { fired.push_back(1); });
  timers.schedule(10s, [&] { fired.push_back(3); });
  const auto now = TimerQueue::Clock::now();
  CHECK(timers.run_due(now) == 0);
  CHECK(timers.run_due(now + 1s) == 2);
  CHECK(fired == std::vector<int>{1, 2});
  CHECK(timers.pending() == 1);
}

TEST_CASE("cancelled timers never fire") {
  TimerQueue timers;
  bool fired = false;
  auto id = timers.schedule(50ms, [&] { fired = true; });
  CHECK(timers.cancel(id));
  CHECK_FALSE(timers.cancel(id));
  timers.run_due(TimerQueue::Clock::now() + 1s);
  CHECK_FALSE(fired);
  CHECK(timers.pending() == 0);
}

TEST_CASE("repeating timers are rescheduled") {
  TimerQueue timers;
  int count = 0;
  auto id = timers.schedule_every(100ms, [&] { ++count; });
  auto now = TimerQueue::Clock::now();
  timers.run_due(now + 150ms);
  timers.run_due(now + 300ms);
  CHECK(count == 2);
  CHECK(timers.pending() == 1);
  CHECK(timers.cancel(id));
  CHECK_THROWS_AS(timers.schedule_every(0ms, [] {}), std::invalid_argument);
}

TEST_CASE("a failing callback does not stop other timers") {
  TimerQueue timers;
  bool second = false;
  timers.schedule(0ms, [] { throw std::runtime_error("boom"); });
  timers.schedule(1ms, [&] { second = true; });
  CHECK(timers.run_due(TimerQueue::Clock::now() + 1s) == 2);
  CHECK(second);
}

TEST_CASE("started queue fires on its own thread") {
  TimerQueue timers;
  timers.start();
  std::atomic<bool> fired{false};
  timers.schedule(20ms, [&] { fired = true; });
  auto deadline = std::chrono::steady_clock::now() + 2s;
  while (!fired && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  CHECK(fired);
  timers.schedule(1h, [] {});
  timers.stop();
  CHECK(timers.pending() == 0);
}
