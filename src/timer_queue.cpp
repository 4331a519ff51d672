#include "timer_queue.hpp"
#include "log.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <vector>

namespace prdeck {

namespace {
std::shared_ptr<spdlog::logger> timer_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("timer");
  }();
  return logger;
}

void invoke(const std::function<void()> &fn) {
  try {
    fn();
  } catch (const std::exception &e) {
    timer_log()->error("Timer callback failed: {}", e.what());
  }
}
} // namespace

TimerQueue::~TimerQueue() { stop(); }

void TimerQueue::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_)
    return;
  running_ = true;
  thread_ = std::thread(&TimerQueue::loop, this);
}

void TimerQueue::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ && !thread_.joinable()) {
      timers_.clear();
      return;
    }
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
  std::lock_guard<std::mutex> lock(mutex_);
  timers_.clear();
}

TimerQueue::TimerId TimerQueue::add(Clock::time_point deadline, Entry entry) {
  TimerId id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    id = next_id_++;
    entry.id = id;
    timers_.emplace(deadline, std::move(entry));
  }
  cv_.notify_all();
  return id;
}

TimerQueue::TimerId TimerQueue::schedule(std::chrono::milliseconds delay,
                                         std::function<void()> fn) {
  return add(Clock::now() + delay, Entry{0, std::move(fn), {}});
}

TimerQueue::TimerId
TimerQueue::schedule_every(std::chrono::milliseconds interval,
                           std::function<void()> fn) {
  if (interval.count() <= 0) {
    throw std::invalid_argument("Timer interval must be positive");
  }
  return add(Clock::now() + interval, Entry{0, std::move(fn), interval});
}

bool TimerQueue::cancel(TimerId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = timers_.begin(); it != timers_.end(); ++it) {
    if (it->second.id == id) {
      timers_.erase(it);
      return true;
    }
  }
  return false;
}

std::size_t TimerQueue::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return timers_.size();
}

std::size_t TimerQueue::run_due(Clock::time_point now) {
  std::vector<std::function<void()>> due;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!timers_.empty() && timers_.begin()->first <= now) {
      auto node = timers_.extract(timers_.begin());
      due.push_back(node.mapped().fn);
      if (node.mapped().interval.count() > 0) {
        node.key() = now + node.mapped().interval;
        timers_.insert(std::move(node));
      }
    }
  }
  for (const auto &fn : due) {
    invoke(fn);
  }
  return due.size();
}

void TimerQueue::loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (running_) {
    if (timers_.empty()) {
      cv_.wait(lock, [this] { return !running_ || !timers_.empty(); });
      continue;
    }
    auto deadline = timers_.begin()->first;
    if (Clock::now() < deadline) {
      cv_.wait_until(lock, deadline);
      continue;
    }
    auto node = timers_.extract(timers_.begin());
    std::function<void()> fn = node.mapped().fn;
    if (node.mapped().interval.count() > 0) {
      node.key() = Clock::now() + node.mapped().interval;
      timers_.insert(std::move(node));
    }
    lock.unlock();
    invoke(fn);
    lock.lock();
  }
}

} // namespace prdeck
