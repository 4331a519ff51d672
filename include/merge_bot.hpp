/**
 * @file merge_bot.hpp
 * @brief Merge bot queue state machine.
 *
 * Each queued pull request moves through
 * Queued -> NeedsRebase -> Rebasing -> WaitingForCi -> ReadyToMerge ->
 * Merging -> Merged, with Failed reachable from the in-flight states. All
 * transitions are pure and emit effect descriptors; the executor feeds
 * results back as actions tagged with the run id.
 */

#ifndef PRDECK_MERGE_BOT_HPP
#define PRDECK_MERGE_BOT_HPP

#include "action.hpp"
#include "effect.hpp"
#include "errors.hpp"
#include "pull_request.hpp"
#include "theme.hpp"
#include "view_model.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace prdeck {

enum class MergeEntryState {
  Queued,
  NeedsRebase,
  Rebasing,
  WaitingForCi,
  ReadyToMerge,
  Merging,
  Merged,
  Failed
};

const char *to_string(MergeEntryState state);

/// Where a failed entry resumes once its backoff delay has elapsed.
enum class RetryRoute {
  Rebase,  ///< Back to NeedsRebase
  RerunCi, ///< Rerun failed jobs, then wait for CI
  Recheck  ///< Fresh status check
};

/// One pull request tracked by the bot.
struct MergeQueueEntry {
  int number{0};
  std::string title;
  MergeEntryState state{MergeEntryState::Queued};
  int attempts{0};
  std::optional<GitHubFailure> last_error;
  bool in_flight{false};     ///< A check/rebase/merge/rerun effect is outstanding
  bool timer_pending{false}; ///< A poll or backoff timer is outstanding
  RetryRoute retry_route{RetryRoute::Recheck};
  std::optional<Clock::time_point> retry_at;
};

struct MergeSummaryItem {
  int number{0};
  std::string title;
  int attempts{0};
};

struct MergeFailureItem {
  int number{0};
  std::string title;
  int attempts{0};
  std::string reason;
};

/// Tunables taken from configuration.
struct MergeBotSettings {
  std::size_t concurrency{2};
  int retry_budget{3};
  std::chrono::seconds backoff_base{30};
  std::chrono::seconds ci_poll_interval{15};
};

/// Largest delay between two attempts of the same entry.
constexpr std::chrono::seconds kMaxBackoff{600};

/// `base * 2^(attempt-1)`, capped at kMaxBackoff.
std::chrono::seconds backoff_delay(std::chrono::seconds base, int attempt);

struct MergeBotState {
  bool running{false};
  std::uint64_t run_id{0};
  std::optional<Repository> repo;
  std::vector<MergeQueueEntry> queue;
  std::vector<MergeSummaryItem> merged;
  std::vector<MergeFailureItem> failures;
  MergeBotSettings settings;
  Clock::time_point now{};
  std::string message;
  std::shared_ptr<const MergeBotViewModel> view;
};

/// Number of entries currently Rebasing or Merging.
std::size_t in_flight_operations(const MergeBotState &bot);

/// Find an entry by pull request number.
const MergeQueueEntry *find_entry(const MergeBotState &bot, int number);

struct AppState;

/**
 * Apply an action to the merge bot slice.
 *
 * @param prev Whole previous state; the bot reads the current repository
 *        and its selection when starting.
 * @param action Action to apply.
 * @param theme Theme used for the view model.
 * @param effects Receives produced effects.
 * @return Updated slice. Unrelated actions return the slice unchanged.
 */
MergeBotState reduce_merge_bot(const AppState &prev, const Action &action,
                               const Theme &theme, std::vector<Effect> &effects);

} // namespace prdeck

#endif // PRDECK_MERGE_BOT_HPP
