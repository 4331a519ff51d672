/**
 * @file store.hpp
 * @brief Owner of the application state and the action queue.
 *
 * Actions may be dispatched from any thread. They are reduced one at a time
 * in dispatch order; after each reduction the new state is published as an
 * immutable snapshot and the produced effects are handed to the effect
 * handler.
 */
#ifndef PRDECK_STORE_HPP
#define PRDECK_STORE_HPP

#include "action.hpp"
#include "effect.hpp"
#include "state.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace prdeck {

class Store {
public:
  /// Receives each effect produced by a reduction, in emission order.
  using EffectHandler = std::function<void(const Effect &)>;

  explicit Store(AppState initial);
  ~Store();

  Store(const Store &) = delete;
  Store &operator=(const Store &) = delete;

  void set_effect_handler(EffectHandler handler);

  /**
   * Queue an action.
   *
   * Before start() the queue is drained on the calling thread; an action
   * dispatched while draining is appended and processed by the same drain.
   */
  void dispatch(Action action);

  /// Start the reducer thread.
  void start();

  /// Stop the reducer thread. Actions still queued are discarded.
  void stop();

  /// Latest published state.
  std::shared_ptr<const AppState> current_state() const;

  /// Number of reductions published so far.
  std::uint64_t version() const { return version_.load(); }

  /**
   * Block until the version exceeds @p seen or the timeout expires.
   *
   * @return Current version.
   */
  std::uint64_t wait_for_change(std::uint64_t seen,
                                std::chrono::milliseconds timeout) const;

private:
  void loop();
  void drain_inline();
  void apply(const Action &action);

  std::shared_ptr<const AppState> state_;
  EffectHandler handler_;
  std::deque<Action> queue_;
  bool running_{false};
  bool draining_{false};
  std::thread thread_;
  std::atomic<std::uint64_t> version_{0};
  mutable std::mutex mutex_;
  mutable std::condition_variable queue_cv_;
  mutable std::condition_variable published_cv_;
};

} // namespace prdeck

#endif // PRDECK_STORE_HPP
