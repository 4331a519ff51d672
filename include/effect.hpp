/**
 * @file effect.hpp
 * @brief Descriptors of side effects produced by reducers.
 *
 * An effect carries everything needed to run it without looking at state,
 * including the identifiers of the follow-up action it produces.
 */

#ifndef PRDECK_EFFECT_HPP
#define PRDECK_EFFECT_HPP

#include "action.hpp"
#include "pull_request.hpp"
#include "session_store.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace prdeck {

/// Background subsystem owning an effect. Cancellation works per subsystem.
enum class Subsystem { Repositories, Logs, MergeBot, Ui };

const char *to_string(Subsystem subsystem);

/// Terminal outcome of a merge bot entry.
struct MergeOutcome {
  std::string repo_key;
  int number{0};
  std::string title;
  bool merged{false};
  int attempts{0};
  std::string reason;
};

namespace effects {

struct FetchPullRequests {
  Repository repo;
};
struct FetchBuildLogs {
  Repository repo;
  PullRequest pr;
};
/// One user operation on a pull request.
struct RunPrOperation {
  Repository repo;
  int number{0};
  PrOperation op{PrOperation::Merge};
  std::string argument; ///< Approval message, URL or IDE command
};
struct CheckMergeStatus {
  std::uint64_t run_id{0};
  Repository repo;
  int number{0};
};
struct MergeBotRebase {
  std::uint64_t run_id{0};
  Repository repo;
  int number{0};
};
struct MergeBotMerge {
  std::uint64_t run_id{0};
  Repository repo;
  int number{0};
};
struct MergeBotRerun {
  std::uint64_t run_id{0};
  Repository repo;
  int number{0};
};
/// Dispatch @c follow_up once @c delay has elapsed.
struct StartTimer {
  Subsystem subsystem{Subsystem::Ui};
  std::chrono::milliseconds delay{0};
  Action follow_up;
};
/// Drop pending timers and in-flight follow-ups of a subsystem.
struct CancelSubsystem {
  Subsystem subsystem{Subsystem::Ui};
};
struct SaveSession {
  SessionState session;
};
struct RecordMergeOutcome {
  MergeOutcome outcome;
};

} // namespace effects

using Effect =
    std::variant<effects::FetchPullRequests, effects::FetchBuildLogs,
                 effects::RunPrOperation, effects::CheckMergeStatus,
                 effects::MergeBotRebase, effects::MergeBotMerge,
                 effects::MergeBotRerun, effects::StartTimer,
                 effects::CancelSubsystem, effects::SaveSession,
                 effects::RecordMergeOutcome>;

/// Subsystem an effect belongs to.
Subsystem subsystem_of(const Effect &effect);

/**
 * One-line description, e.g. `merge_bot.merge org/repo@main#12 run=3`.
 *
 * Two effects with equal descriptions are interchangeable for the executor.
 */
std::string describe(const Effect &effect);

/// Describe a list of effects, one per element.
std::vector<std::string> describe(const std::vector<Effect> &effects);

} // namespace prdeck

#endif // PRDECK_EFFECT_HPP
