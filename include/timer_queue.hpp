/**
 * @file timer_queue.hpp
 * @brief Single-thread scheduler for delayed callbacks.
 */
#ifndef PRDECK_TIMER_QUEUE_HPP
#define PRDECK_TIMER_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace prdeck {

/**
 * Runs callbacks once their deadline has passed. Callbacks execute on the
 * queue's own thread in deadline order and must not block.
 */
class TimerQueue {
public:
  using Clock = std::chrono::steady_clock;
  using TimerId = std::uint64_t;

  TimerQueue() = default;
  ~TimerQueue();

  TimerQueue(const TimerQueue &) = delete;
  TimerQueue &operator=(const TimerQueue &) = delete;

  void start();

  /// Stop the thread and drop every pending timer.
  void stop();

  /// Run @p fn once @p delay has elapsed.
  TimerId schedule(std::chrono::milliseconds delay, std::function<void()> fn);

  /// Run @p fn every @p interval until cancelled.
  TimerId schedule_every(std::chrono::milliseconds interval,
                         std::function<void()> fn);

  /// Remove a pending timer. Returns false if it already ran or is unknown.
  bool cancel(TimerId id);

  /// Number of timers waiting to fire.
  std::size_t pending() const;

  /**
   * Fire every timer whose deadline is at or before @p now on the calling
   * thread. Used when the queue is not started.
   *
   * @return Number of callbacks run.
   */
  std::size_t run_due(Clock::time_point now);

private:
  struct Entry {
    TimerId id{0};
    std::function<void()> fn;
    std::chrono::milliseconds interval{0}; ///< Zero for one-shot timers
  };

  TimerId add(Clock::time_point deadline, Entry entry);
  void loop();

  std::multimap<Clock::time_point, Entry> timers_;
  TimerId next_id_{1};
  bool running_{false};
  std::thread thread_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

} // namespace prdeck

#endif // PRDECK_TIMER_QUEUE_HPP
