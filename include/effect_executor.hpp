/**
 * @file effect_executor.hpp
 * @brief Runs effect descriptors and feeds their results back as actions.
 */
#ifndef PRDECK_EFFECT_EXECUTOR_HPP
#define PRDECK_EFFECT_EXECUTOR_HPP

#include "action.hpp"
#include "effect.hpp"
#include "github_client.hpp"
#include "history.hpp"
#include "session_store.hpp"
#include "timer_queue.hpp"
#include "worker_pool.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace prdeck {

/**
 * Executes effects on the worker pool and timer queue.
 *
 * Every subsystem has an epoch. A result is dispatched only when the epoch of
 * its subsystem is unchanged since the effect started, so CancelSubsystem
 * drops every outstanding result and timer of that subsystem. The epoch check
 * and the dispatch run under a per-subsystem lock that cancellation also
 * takes: once a cancel returns, no result of that subsystem is dispatched.
 */
class EffectExecutor {
public:
  /// Dispatches a result action into the store.
  using Dispatch = std::function<void(Action)>;
  /// Runs an external command line, throwing on failure.
  using CommandRunner = std::function<void(const std::string &command)>;

  /**
   * @param api GitHub operations.
   * @param pool Pool running network jobs.
   * @param timers Queue running StartTimer effects.
   * @param dispatch Receives result actions.
   * @param history Outcome log, may be null.
   * @param session Session persistence, may be null.
   * @param runner Runs browser and IDE commands, may be empty.
   * @param browser_command Command prefix used to open URLs.
   */
  EffectExecutor(GitHubApi &api, WorkerPool &pool, TimerQueue &timers,
                 Dispatch dispatch, MergeHistory *history = nullptr,
                 SessionStore *session = nullptr, CommandRunner runner = {},
                 std::string browser_command = "xdg-open");

  EffectExecutor(const EffectExecutor &) = delete;
  EffectExecutor &operator=(const EffectExecutor &) = delete;

  /// Start running one effect. Never blocks on network I/O.
  void execute(const Effect &effect);

  /// Current epoch of @p subsystem.
  std::uint64_t epoch(Subsystem subsystem) const;

private:
  /// Submit @p job to the pool; its action is dropped if @p subsystem was
  /// cancelled meanwhile.
  void run_job(Subsystem subsystem, std::function<Action()> job);
  void deliver(Subsystem subsystem, std::uint64_t epoch, Action action);
  void cancel(Subsystem subsystem);
  Action run_pr_operation(const effects::RunPrOperation &op);

  GitHubApi &api_;
  WorkerPool &pool_;
  TimerQueue &timers_;
  Dispatch dispatch_;
  MergeHistory *history_;
  SessionStore *session_;
  CommandRunner runner_;
  std::string browser_command_;
  std::array<std::atomic<std::uint64_t>, 4> epochs_{};
  /// Serialises deliver() with cancel(). Recursive because an inline store
  /// may cancel from within a dispatch.
  std::array<std::recursive_mutex, 4> deliver_mutexes_;
  std::mutex timer_mutex_;
  std::map<Subsystem, std::vector<TimerQueue::TimerId>> timer_ids_;
};

} // namespace prdeck

#endif // PRDECK_EFFECT_EXECUTOR_HPP
