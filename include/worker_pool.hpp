/**
 * @file worker_pool.hpp
 * @brief Thread pool running effect jobs with an optional request rate limit.
 */
#ifndef PRDECK_WORKER_POOL_HPP
#define PRDECK_WORKER_POOL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace prdeck {

/**
 * Fixed set of worker threads consuming a FIFO job queue. Jobs start no
 * faster than the configured requests-per-minute ceiling.
 */
class WorkerPool {
public:
  /**
   * @param workers Number of worker threads (at least one is used).
   * @param max_rate Maximum jobs started per minute (0 = unlimited).
   */
  WorkerPool(int workers, int max_rate);

  /// Stops and joins the workers.
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /// Start the worker threads.
  void start();

  /// Stop the worker threads. Queued jobs that have not started are dropped.
  void stop();

  /**
   * Submit a job.
   *
   * When the pool is not running the job executes inline on the caller's
   * thread.
   *
   * @return Future that becomes ready once the job has run.
   */
  std::future<void> submit(std::function<void()> job);

  /// Update the requests-per-minute ceiling.
  void set_max_rate(int max_rate);

  /// Number of queued plus running jobs.
  std::size_t outstanding_jobs() const;

  bool running() const { return running_; }

private:
  void worker();
  bool acquire_token();

  int workers_;
  std::atomic<bool> running_{false};
  std::vector<std::thread> threads_;
  std::queue<std::function<void()>> jobs_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;

  std::mutex rate_mutex_;
  std::chrono::steady_clock::duration min_interval_{};
  std::chrono::steady_clock::time_point next_allowed_{};

  std::atomic<std::size_t> queued_{0};
  std::atomic<std::size_t> in_flight_{0};
};

} // namespace prdeck

#endif // PRDECK_WORKER_POOL_HPP
