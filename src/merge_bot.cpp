#include "merge_bot.hpp"
#include "state.hpp"
#include "util/overloaded.hpp"

#include <algorithm>

namespace prdeck {

const char *to_string(MergeEntryState state) {
  switch (state) {
  case MergeEntryState::Queued:
    return "queued";
  case MergeEntryState::NeedsRebase:
    return "needs rebase";
  case MergeEntryState::Rebasing:
    return "rebasing";
  case MergeEntryState::WaitingForCi:
    return "waiting for CI";
  case MergeEntryState::ReadyToMerge:
    return "ready";
  case MergeEntryState::Merging:
    return "merging";
  case MergeEntryState::Merged:
    return "merged";
  case MergeEntryState::Failed:
    return "failed";
  }
  return "unknown";
}

std::chrono::seconds backoff_delay(std::chrono::seconds base, int attempt) {
  std::chrono::seconds delay = base;
  for (int i = 1; i < attempt && delay < kMaxBackoff; ++i) {
    delay *= 2;
  }
  return std::min(delay, kMaxBackoff);
}

std::size_t in_flight_operations(const MergeBotState &bot) {
  return static_cast<std::size_t>(
      std::count_if(bot.queue.begin(), bot.queue.end(), [](const auto &e) {
        return e.state == MergeEntryState::Rebasing ||
               e.state == MergeEntryState::Merging;
      }));
}

const MergeQueueEntry *find_entry(const MergeBotState &bot, int number) {
  for (const auto &entry : bot.queue) {
    if (entry.number == number) {
      return &entry;
    }
  }
  return nullptr;
}

namespace {

/// Applies transitions to one bot slice and collects their effects.
class Transitions {
public:
  Transitions(MergeBotState &bot, std::vector<Effect> &effects)
      : bot_(bot), effects_(effects) {}

  /// Entry of the active run, or null for stale and unknown results.
  MergeQueueEntry *live(std::uint64_t run_id, int number) {
    if (!bot_.running || run_id != bot_.run_id) {
      return nullptr;
    }
    for (auto &entry : bot_.queue) {
      if (entry.number == number) {
        return &entry;
      }
    }
    return nullptr;
  }

  void start(const RepositoryData *data) {
    if (data && !data->selected.empty()) {
      cancel_outstanding();
      bot_.queue.clear();
      bot_.merged.clear();
      bot_.failures.clear();
      for (const auto &pr : data->prs) {
        if (data->selected.count(pr.number)) {
          MergeQueueEntry entry;
          entry.number = pr.number;
          entry.title = pr.title;
          bot_.queue.push_back(std::move(entry));
        }
      }
      bot_.repo = data->repo;
      bot_.run_id++;
      bot_.running = true;
      bot_.message = "Merging " + std::to_string(bot_.queue.size()) +
                     " pull request" + (bot_.queue.size() == 1 ? "" : "s");
    } else if (!bot_.queue.empty() && bot_.repo) {
      cancel_outstanding();
      for (auto &entry : bot_.queue) {
        entry.state = MergeEntryState::Queued;
        entry.in_flight = false;
        entry.timer_pending = false;
        entry.retry_at.reset();
      }
      bot_.run_id++;
      bot_.running = true;
      bot_.message = "Resumed merge queue";
    } else {
      bot_.message = "Select pull requests to merge";
      return;
    }
    schedule();
  }

  void stop() {
    if (!bot_.running) {
      return;
    }
    bot_.running = false;
    effects_.emplace_back(effects::CancelSubsystem{Subsystem::MergeBot});
    for (auto &entry : bot_.queue) {
      entry.in_flight = false;
      entry.timer_pending = false;
      entry.retry_at.reset();
    }
    bot_.message = "Merge bot stopped";
  }

  void status_checked(MergeQueueEntry &entry, const PullRequestStatus &status) {
    entry.in_flight = false;
    if (status.merged) {
      merged(entry.number);
    } else if (status.ci == CiStatus::Failed ||
               status.mergeable == MergeableStatus::BuildFailed) {
      fail(entry.number, {FailureKind::Other, "CI failed"}, RetryRoute::RerunCi);
    } else if (status.mergeable == MergeableStatus::Conflicted) {
      fail(entry.number, {FailureKind::Conflict, "merge conflict"},
           RetryRoute::Rebase);
    } else if (status.mergeable == MergeableStatus::Blocked) {
      fail(entry.number, {FailureKind::Other, "blocked by branch protection"},
           RetryRoute::Recheck);
    } else if (status.behind_base ||
               status.mergeable == MergeableStatus::NeedsRebase) {
      entry.state = MergeEntryState::NeedsRebase;
    } else if (status.mergeable == MergeableStatus::Ready &&
               status.ci != CiStatus::Pending) {
      entry.state = MergeEntryState::ReadyToMerge;
    } else {
      entry.state = MergeEntryState::WaitingForCi;
    }
    schedule();
  }

  void rebased(MergeQueueEntry &entry) {
    if (entry.state != MergeEntryState::Rebasing) {
      return;
    }
    entry.in_flight = false;
    entry.state = MergeEntryState::WaitingForCi;
    schedule();
  }

  void poll(MergeQueueEntry &entry) {
    if (entry.state != MergeEntryState::WaitingForCi || !entry.timer_pending) {
      return;
    }
    entry.timer_pending = false;
    check(entry);
    schedule();
  }

  void retry(MergeQueueEntry &entry) {
    if (entry.state != MergeEntryState::Failed || !entry.timer_pending) {
      return;
    }
    entry.timer_pending = false;
    entry.retry_at.reset();
    switch (entry.retry_route) {
    case RetryRoute::Rebase:
      entry.state = MergeEntryState::NeedsRebase;
      break;
    case RetryRoute::RerunCi:
      entry.state = MergeEntryState::WaitingForCi;
      entry.in_flight = true;
      effects_.emplace_back(effects::MergeBotRerun{bot_.run_id, *bot_.repo,
                                                   entry.number});
      break;
    case RetryRoute::Recheck:
      entry.state = MergeEntryState::Queued;
      break;
    }
    schedule();
  }

  void rerun_requested(MergeQueueEntry &entry,
                       const std::optional<GitHubFailure> &failure) {
    entry.in_flight = false;
    if (failure) {
      fail(entry.number, *failure, RetryRoute::RerunCi);
    }
    schedule();
  }

  /// Record a failed attempt. The entry leaves the queue once the budget is
  /// spent or the failure cannot be retried.
  void fail(int number, const GitHubFailure &failure, RetryRoute route) {
    auto it = position(number);
    if (it == bot_.queue.end()) {
      return;
    }
    auto &entry = *it;
    entry.in_flight = false;
    entry.attempts++;
    entry.last_error = failure;
    entry.state = MergeEntryState::Failed;
    entry.retry_route = route;
    if (failure.kind == FailureKind::AuthFailed ||
        entry.attempts > bot_.settings.retry_budget) {
      const std::string reason = describe_failure(failure);
      bot_.failures.push_back({entry.number, entry.title, entry.attempts, reason});
      record(entry, false, reason);
      bot_.queue.erase(it);
      return;
    }
    const auto delay = backoff_delay(bot_.settings.backoff_base, entry.attempts);
    entry.retry_at = bot_.now + delay;
    entry.timer_pending = true;
    effects_.emplace_back(effects::StartTimer{
        Subsystem::MergeBot,
        std::chrono::duration_cast<std::chrono::milliseconds>(delay),
        actions::MergeBotRetry{bot_.run_id, entry.number}});
  }

  void merged(int number) {
    auto it = position(number);
    if (it == bot_.queue.end()) {
      return;
    }
    it->state = MergeEntryState::Merged;
    bot_.merged.push_back({it->number, it->title, it->attempts});
    record(*it, true, "");
    bot_.queue.erase(it);
  }

  void remove(int number) {
    auto it = position(number);
    if (it == bot_.queue.end()) {
      return;
    }
    bot_.queue.erase(it);
    schedule();
  }

  /// Start every operation the queue is waiting on, within the concurrency
  /// limit, and finish the run once the queue is empty.
  void schedule() {
    if (!bot_.running) {
      return;
    }
    if (bot_.queue.empty()) {
      bot_.running = false;
      bot_.message = "Merge queue finished: " +
                     std::to_string(bot_.merged.size()) + " merged, " +
                     std::to_string(bot_.failures.size()) + " failed";
      if (bot_.repo) {
        effects_.emplace_back(effects::FetchPullRequests{*bot_.repo});
      }
      return;
    }
    std::size_t active = in_flight_operations(bot_);
    for (auto &entry : bot_.queue) {
      switch (entry.state) {
      case MergeEntryState::Queued:
        if (!entry.in_flight) {
          check(entry);
        }
        break;
      case MergeEntryState::NeedsRebase:
        if (active < bot_.settings.concurrency) {
          entry.state = MergeEntryState::Rebasing;
          entry.in_flight = true;
          ++active;
          effects_.emplace_back(effects::MergeBotRebase{bot_.run_id, *bot_.repo,
                                                        entry.number});
        }
        break;
      case MergeEntryState::ReadyToMerge:
        if (active < bot_.settings.concurrency) {
          entry.state = MergeEntryState::Merging;
          entry.in_flight = true;
          ++active;
          effects_.emplace_back(effects::MergeBotMerge{bot_.run_id, *bot_.repo,
                                                       entry.number});
        }
        break;
      case MergeEntryState::WaitingForCi:
        if (!entry.in_flight && !entry.timer_pending) {
          entry.timer_pending = true;
          effects_.emplace_back(effects::StartTimer{
              Subsystem::MergeBot,
              std::chrono::duration_cast<std::chrono::milliseconds>(
                  bot_.settings.ci_poll_interval),
              actions::MergeBotPoll{bot_.run_id, entry.number}});
        }
        break;
      default:
        break;
      }
    }
  }

private:
  std::vector<MergeQueueEntry>::iterator position(int number) {
    return std::find_if(bot_.queue.begin(), bot_.queue.end(),
                        [number](const auto &e) { return e.number == number; });
  }

  void check(MergeQueueEntry &entry) {
    entry.in_flight = true;
    effects_.emplace_back(
        effects::CheckMergeStatus{bot_.run_id, *bot_.repo, entry.number});
  }

  void cancel_outstanding() {
    if (bot_.running) {
      effects_.emplace_back(effects::CancelSubsystem{Subsystem::MergeBot});
    }
  }

  void record(const MergeQueueEntry &entry, bool merged,
              const std::string &reason) {
    MergeOutcome outcome;
    outcome.repo_key = bot_.repo ? bot_.repo->key() : std::string();
    outcome.number = entry.number;
    outcome.title = entry.title;
    outcome.merged = merged;
    outcome.attempts = entry.attempts;
    outcome.reason = reason;
    effects_.emplace_back(effects::RecordMergeOutcome{std::move(outcome)});
  }

  static std::string describe_failure(const GitHubFailure &failure) {
    std::string text = to_string(failure.kind);
    if (!failure.message.empty()) {
      text += ": " + failure.message;
    }
    return text;
  }

  MergeBotState &bot_;
  std::vector<Effect> &effects_;
};

bool has_countdown(const MergeBotState &bot) {
  return std::any_of(bot.queue.begin(), bot.queue.end(),
                     [](const auto &e) { return e.retry_at.has_value(); });
}

} // namespace

MergeBotState reduce_merge_bot(const AppState &prev, const Action &action,
                               const Theme &theme, std::vector<Effect> &effects) {
  MergeBotState next = prev.merge_bot;
  Transitions t(next, effects);
  bool changed = true;

  std::visit(
      overloaded{
          [&](const actions::StartMergeBot &) {
            t.start(current_repository(prev.repositories));
          },
          [&](const actions::StopMergeBot &) {
            changed = next.running;
            t.stop();
          },
          [&](const actions::RemoveFromMergeQueue &a) {
            changed = find_entry(next, a.number) != nullptr;
            t.remove(a.number);
          },
          [&](const actions::DismissMergeBotFailures &) {
            next.failures.clear();
            if (!next.running) {
              next.merged.clear();
            }
          },
          [&](const actions::MergeBotStatusChecked &a) {
            auto *entry = t.live(a.run_id, a.number);
            if (!entry || (entry->state != MergeEntryState::Queued &&
                           entry->state != MergeEntryState::WaitingForCi)) {
              changed = false;
              return;
            }
            t.status_checked(*entry, a.status);
          },
          [&](const actions::MergeBotCheckFailed &a) {
            if (!t.live(a.run_id, a.number)) {
              changed = false;
              return;
            }
            t.fail(a.number, a.failure, RetryRoute::Recheck);
            t.schedule();
          },
          [&](const actions::MergeBotRebased &a) {
            auto *entry = t.live(a.run_id, a.number);
            if (!entry) {
              changed = false;
              return;
            }
            t.rebased(*entry);
          },
          [&](const actions::MergeBotRebaseFailed &a) {
            if (!t.live(a.run_id, a.number)) {
              changed = false;
              return;
            }
            t.fail(a.number, a.failure, RetryRoute::Rebase);
            t.schedule();
          },
          [&](const actions::MergeBotMerged &a) {
            if (!t.live(a.run_id, a.number)) {
              changed = false;
              return;
            }
            t.merged(a.number);
            t.schedule();
          },
          [&](const actions::MergeBotMergeFailed &a) {
            if (!t.live(a.run_id, a.number)) {
              changed = false;
              return;
            }
            t.fail(a.number, a.failure, RetryRoute::Recheck);
            t.schedule();
          },
          [&](const actions::MergeBotRerunRequested &a) {
            auto *entry = t.live(a.run_id, a.number);
            if (!entry) {
              changed = false;
              return;
            }
            t.rerun_requested(*entry, a.failure);
          },
          [&](const actions::MergeBotPoll &a) {
            auto *entry = t.live(a.run_id, a.number);
            if (!entry) {
              changed = false;
              return;
            }
            t.poll(*entry);
          },
          [&](const actions::MergeBotRetry &a) {
            auto *entry = t.live(a.run_id, a.number);
            if (!entry) {
              changed = false;
              return;
            }
            t.retry(*entry);
          },
          [&](const actions::ClockTick &a) {
            next.now = a.now;
            changed = has_countdown(next);
          },
          [&](const actions::ToggleTheme &) {},
          [&](const auto &) { changed = false; },
      },
      action);

  if (changed) {
    next.view = recompute_merge_bot(next, theme);
  }
  return next;
}

} // namespace prdeck
