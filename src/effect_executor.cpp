#include "effect_executor.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "util/overloaded.hpp"
#include "util/shell.hpp"

#include <algorithm>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace prdeck {

namespace {
std::shared_ptr<spdlog::logger> executor_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("executor");
  }();
  return logger;
}

std::size_t slot(Subsystem subsystem) {
  return static_cast<std::size_t>(subsystem);
}
} // namespace

EffectExecutor::EffectExecutor(GitHubApi &api, WorkerPool &pool,
                               TimerQueue &timers, Dispatch dispatch,
                               MergeHistory *history, SessionStore *session,
                               CommandRunner runner,
                               std::string browser_command)
    : api_(api), pool_(pool), timers_(timers), dispatch_(std::move(dispatch)),
      history_(history), session_(session), runner_(std::move(runner)),
      browser_command_(std::move(browser_command)) {
  for (auto &e : epochs_) {
    e.store(0);
  }
}

std::uint64_t EffectExecutor::epoch(Subsystem subsystem) const {
  return epochs_[slot(subsystem)].load();
}

void EffectExecutor::deliver(Subsystem subsystem, std::uint64_t started,
                             Action action) {
  std::lock_guard<std::recursive_mutex> lock(deliver_mutexes_[slot(subsystem)]);
  if (epoch(subsystem) != started) {
    executor_log()->debug("Dropping stale {} result {}", to_string(subsystem),
                          action_name(action));
    return;
  }
  dispatch_(std::move(action));
}

void EffectExecutor::run_job(Subsystem subsystem, std::function<Action()> job) {
  const std::uint64_t started = epoch(subsystem);
  // The future is not kept; completion is reported through dispatch.
  pool_.submit([this, subsystem, started, job = std::move(job)] {
    deliver(subsystem, started, job());
  });
}

void EffectExecutor::cancel(Subsystem subsystem) {
  {
    std::lock_guard<std::recursive_mutex> lock(deliver_mutexes_[slot(subsystem)]);
    epochs_[slot(subsystem)].fetch_add(1);
  }
  std::vector<TimerQueue::TimerId> ids;
  {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    ids.swap(timer_ids_[subsystem]);
  }
  for (auto id : ids) {
    timers_.cancel(id);
  }
  executor_log()->debug("Cancelled {} ({} timers)", to_string(subsystem),
                        ids.size());
}

Action EffectExecutor::run_pr_operation(const effects::RunPrOperation &op) {
  const std::string key = op.repo.key();
  try {
    switch (op.op) {
    case PrOperation::Merge:
      api_.merge(op.repo, op.number);
      break;
    case PrOperation::Rebase:
      api_.rebase(op.repo, op.number);
      break;
    case PrOperation::RerunFailedJobs:
      api_.rerun_failed_jobs(op.repo, op.number);
      break;
    case PrOperation::Approve:
      api_.approve(op.repo, op.number, op.argument);
      break;
    case PrOperation::OpenInBrowser:
      if (!runner_) {
        throw std::runtime_error("Opening URLs is not supported");
      }
      runner_(browser_command_ + " " + shell_quote(op.argument));
      break;
    case PrOperation::OpenInIde:
      if (!runner_) {
        throw std::runtime_error("Running commands is not supported");
      }
      runner_(op.argument);
      break;
    }
  } catch (const std::exception &e) {
    executor_log()->warn("{} {}#{} failed: {}", to_string(op.op), key,
                         op.number, e.what());
    return actions::PrOperationFailed{key, op.number, op.op,
                                      failure_from_exception(e)};
  }
  return actions::PrOperationSucceeded{key, op.number, op.op};
}

void EffectExecutor::execute(const Effect &effect) {
  executor_log()->debug("execute {}", describe(effect));
  std::visit(
      overloaded{
          [&](const effects::FetchPullRequests &e) {
            run_job(Subsystem::Repositories, [this, e]() -> Action {
              try {
                return actions::PullRequestsLoaded{e.repo.key(),
                                                   api_.list_pull_requests(e.repo)};
              } catch (const std::exception &ex) {
                executor_log()->warn("Listing {} failed: {}", e.repo.key(),
                                     ex.what());
                return actions::PullRequestsLoadFailed{
                    e.repo.key(), failure_from_exception(ex)};
              }
            });
          },
          [&](const effects::FetchBuildLogs &e) {
            run_job(Subsystem::Logs, [this, e]() -> Action {
              try {
                auto logs = std::make_shared<const BuildLogs>(
                    api_.fetch_build_logs(e.repo, e.pr));
                return actions::BuildLogsLoaded{e.repo.key(), e.pr.number,
                                                std::move(logs)};
              } catch (const std::exception &ex) {
                executor_log()->warn("Build logs of {}#{} failed: {}",
                                     e.repo.key(), e.pr.number, ex.what());
                return actions::BuildLogsLoadFailed{
                    e.repo.key(), e.pr.number, failure_from_exception(ex)};
              }
            });
          },
          [&](const effects::RunPrOperation &e) {
            run_job(Subsystem::Repositories,
                    [this, e]() -> Action { return run_pr_operation(e); });
          },
          [&](const effects::CheckMergeStatus &e) {
            run_job(Subsystem::MergeBot, [this, e]() -> Action {
              try {
                return actions::MergeBotStatusChecked{
                    e.run_id, e.number, api_.pull_request_status(e.repo, e.number)};
              } catch (const std::exception &ex) {
                return actions::MergeBotCheckFailed{e.run_id, e.number,
                                                    failure_from_exception(ex)};
              }
            });
          },
          [&](const effects::MergeBotRebase &e) {
            run_job(Subsystem::MergeBot, [this, e]() -> Action {
              try {
                api_.rebase(e.repo, e.number);
                return actions::MergeBotRebased{e.run_id, e.number};
              } catch (const std::exception &ex) {
                return actions::MergeBotRebaseFailed{
                    e.run_id, e.number, failure_from_exception(ex)};
              }
            });
          },
          [&](const effects::MergeBotMerge &e) {
            run_job(Subsystem::MergeBot, [this, e]() -> Action {
              try {
                api_.merge(e.repo, e.number);
                return actions::MergeBotMerged{e.run_id, e.number};
              } catch (const std::exception &ex) {
                return actions::MergeBotMergeFailed{
                    e.run_id, e.number, failure_from_exception(ex)};
              }
            });
          },
          [&](const effects::MergeBotRerun &e) {
            run_job(Subsystem::MergeBot, [this, e]() -> Action {
              try {
                api_.rerun_failed_jobs(e.repo, e.number);
                return actions::MergeBotRerunRequested{e.run_id, e.number,
                                                       std::nullopt};
              } catch (const std::exception &ex) {
                return actions::MergeBotRerunRequested{
                    e.run_id, e.number, failure_from_exception(ex)};
              }
            });
          },
          [&](const effects::StartTimer &e) {
            const std::uint64_t started = epoch(e.subsystem);
            auto handle = std::make_shared<TimerQueue::TimerId>(0);
            std::lock_guard<std::mutex> lock(timer_mutex_);
            *handle = timers_.schedule(
                e.delay, [this, handle, subsystem = e.subsystem, started,
                          follow_up = e.follow_up] {
                  {
                    std::lock_guard<std::mutex> guard(timer_mutex_);
                    auto &ids = timer_ids_[subsystem];
                    ids.erase(std::remove(ids.begin(), ids.end(), *handle),
                              ids.end());
                  }
                  deliver(subsystem, started, follow_up);
                });
            timer_ids_[e.subsystem].push_back(*handle);
          },
          [&](const effects::CancelSubsystem &e) { cancel(e.subsystem); },
          [&](const effects::SaveSession &e) {
            if (!session_) {
              return;
            }
            try {
              session_->save(e.session);
            } catch (const std::runtime_error &ex) {
              executor_log()->error("Saving session failed: {}", ex.what());
              dispatch_(actions::ShowStatus{StatusLevel::Warning,
                                            "Session not saved"});
            }
          },
          [&](const effects::RecordMergeOutcome &e) {
            if (!history_) {
              return;
            }
            try {
              history_->record(e.outcome);
            } catch (const std::runtime_error &ex) {
              executor_log()->error("Recording merge outcome failed: {}",
                                    ex.what());
            }
          },
      },
      effect);
}

} // namespace prdeck
