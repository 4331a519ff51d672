#include "worker_pool.hpp"
#include <algorithm>
#include <memory>

namespace prdeck {

namespace {
std::chrono::steady_clock::duration interval_for(int max_rate) {
  if (max_rate <= 0) {
    return std::chrono::steady_clock::duration::zero();
  }
  auto interval =
      std::chrono::duration<double>(60.0 / static_cast<double>(max_rate));
  auto out =
      std::chrono::duration_cast<std::chrono::steady_clock::duration>(interval);
  if (out.count() <= 0) {
    out = std::chrono::nanoseconds(1);
  }
  return out;
}
} // namespace

WorkerPool::WorkerPool(int workers, int max_rate)
    : workers_(std::max(1, workers)), min_interval_(interval_for(max_rate)),
      next_allowed_(std::chrono::steady_clock::now()) {}

WorkerPool::~WorkerPool() { stop(); }

void WorkerPool::start() {
  if (running_)
    return;
  running_ = true;
  next_allowed_ = std::chrono::steady_clock::now();
  threads_.reserve(static_cast<std::size_t>(workers_));
  for (int i = 0; i < workers_; ++i) {
    threads_.emplace_back(&WorkerPool::worker, this);
  }
}

void WorkerPool::stop() {
  if (!running_)
    return;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  for (auto &t : threads_) {
    if (t.joinable())
      t.join();
  }
  threads_.clear();
  std::lock_guard<std::mutex> lock(mutex_);
  std::queue<std::function<void()>>().swap(jobs_);
  queued_.store(0, std::memory_order_relaxed);
}

std::future<void> WorkerPool::submit(std::function<void()> job) {
  if (!running_) {
    std::packaged_task<void()> pt(std::move(job));
    auto fut = pt.get_future();
    pt();
    return fut;
  }
  auto task = std::make_shared<std::packaged_task<void()>>(std::move(job));
  std::future<void> fut = task->get_future();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.emplace([task]() { (*task)(); });
    queued_.fetch_add(1, std::memory_order_relaxed);
  }
  cv_.notify_one();
  return fut;
}

void WorkerPool::set_max_rate(int max_rate) {
  std::lock_guard<std::mutex> lock(rate_mutex_);
  min_interval_ = interval_for(max_rate);
  next_allowed_ = std::chrono::steady_clock::now();
}

std::size_t WorkerPool::outstanding_jobs() const {
  return queued_.load(std::memory_order_relaxed) +
         in_flight_.load(std::memory_order_relaxed);
}

/**
 * Wait until the rate limit allows another job to start.
 *
 * @return `true` if execution may proceed, `false` when the pool is stopping.
 */
bool WorkerPool::acquire_token() {
  std::unique_lock<std::mutex> lock(rate_mutex_);
  while (running_) {
    if (min_interval_ <= std::chrono::steady_clock::duration::zero()) {
      return true;
    }
    auto now = std::chrono::steady_clock::now();
    if (now >= next_allowed_) {
      next_allowed_ = std::max(next_allowed_ + min_interval_, now);
      return true;
    }
    lock.unlock();
    auto wait = next_allowed_ - now;
    if (wait > std::chrono::milliseconds(50)) {
      wait = std::chrono::milliseconds(50);
    }
    std::this_thread::sleep_for(wait);
    lock.lock();
  }
  return false;
}

void WorkerPool::worker() {
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return !running_ || !jobs_.empty(); });
      if (!running_)
        return;
      job = std::move(jobs_.front());
      jobs_.pop();
      queued_.fetch_sub(1, std::memory_order_relaxed);
      in_flight_.fetch_add(1, std::memory_order_relaxed);
    }
    if (!acquire_token()) {
      in_flight_.fetch_sub(1, std::memory_order_relaxed);
      return;
    }
    job();
    in_flight_.fetch_sub(1, std::memory_order_relaxed);
  }
}

} // namespace prdeck
