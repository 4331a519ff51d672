#include "store.hpp"
#include "log.hpp"
#include "reducer.hpp"

#include <spdlog/spdlog.h>

namespace prdeck {

namespace {
std::shared_ptr<spdlog::logger> store_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("store");
  }();
  return logger;
}
} // namespace

Store::Store(AppState initial)
    : state_(std::make_shared<const AppState>(std::move(initial))) {}

Store::~Store() { stop(); }

void Store::set_effect_handler(EffectHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  handler_ = std::move(handler);
}

void Store::dispatch(Action action) {
  bool inline_drain = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(action));
    inline_drain = !running_ && !draining_;
    if (inline_drain) {
      draining_ = true;
    }
  }
  if (inline_drain) {
    drain_inline();
  } else {
    queue_cv_.notify_one();
  }
}

void Store::drain_inline() {
  while (true) {
    Action action;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (queue_.empty() || running_) {
        draining_ = false;
        return;
      }
      action = std::move(queue_.front());
      queue_.pop_front();
    }
    apply(action);
  }
}

void Store::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_)
    return;
  running_ = true;
  thread_ = std::thread(&Store::loop, this);
  store_log()->debug("Store started");
}

void Store::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_)
      return;
    running_ = false;
  }
  queue_cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
  std::lock_guard<std::mutex> lock(mutex_);
  if (!queue_.empty()) {
    store_log()->debug("Discarding {} queued actions", queue_.size());
    queue_.clear();
  }
}

std::shared_ptr<const AppState> Store::current_state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::uint64_t Store::wait_for_change(std::uint64_t seen,
                                     std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  published_cv_.wait_for(lock, timeout,
                         [this, seen] { return version_.load() > seen; });
  return version_.load();
}

void Store::loop() {
  while (true) {
    Action action;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      queue_cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });
      if (!running_)
        return;
      action = std::move(queue_.front());
      queue_.pop_front();
    }
    apply(action);
  }
}

void Store::apply(const Action &action) {
  std::shared_ptr<const AppState> prev;
  EffectHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    prev = state_;
    handler = handler_;
  }
  Reduction out = reduce(*prev, action);
  if (!std::holds_alternative<actions::ClockTick>(action)) {
    store_log()->debug("{} -> {} effects", action_name(action),
                       out.effects.size());
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = std::make_shared<const AppState>(std::move(out.state));
    ++version_;
  }
  published_cv_.notify_all();
  for (const auto &effect : out.effects) {
    store_log()->trace("effect {}", describe(effect));
    if (!handler) {
      continue;
    }
    try {
      handler(effect);
    } catch (const std::exception &e) {
      store_log()->error("Effect {} failed: {}", describe(effect), e.what());
    }
  }
}

} // namespace prdeck
