/**
 * @file action.hpp
 * @brief Closed set of events that drive every state change.
 *
 * Actions are plain values. Each reducer matches on the variant with
 * std::visit, so adding an alternative surfaces every reducer that needs to
 * handle it.
 */

#ifndef PRDECK_ACTION_HPP
#define PRDECK_ACTION_HPP

#include "errors.hpp"
#include "log_tree.hpp"
#include "pull_request.hpp"
#include "session_store.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace prdeck {

/// Clock used for countdowns and timer deadlines.
using Clock = std::chrono::steady_clock;

/// Severity of a status bar message.
enum class StatusLevel { Info, Warning, Error };

/// User operations applied to selected pull requests.
enum class PrOperation { Merge, Rebase, RerunFailedJobs, Approve, OpenInBrowser, OpenInIde };

const char *to_string(PrOperation op);

namespace actions {

// Lifecycle and chrome
struct Bootstrap {
  SessionState session;
};
struct Quit {};
struct ClockTick {
  Clock::time_point now;
};
struct ToggleTheme {};
struct ToggleHelp {};
struct ToggleDebugConsole {};
struct ShowStatus {
  StatusLevel level{StatusLevel::Info};
  std::string text;
};
struct DismissStatus {};
struct ResizeViewport {
  std::size_t table_rows{20};
  std::size_t log_rows{20};
};

// Repositories and pull requests
struct AddRepository {
  Repository repo;
};
struct RemoveCurrentRepository {};
struct SelectRepository {
  std::size_t index{0};
};
struct NextRepository {};
struct PreviousRepository {};
struct RefreshCurrentRepository {};
struct RefreshRepository {
  std::string repo_key;
};
struct PullRequestsLoaded {
  std::string repo_key;
  std::vector<PullRequest> prs;
};
struct PullRequestsLoadFailed {
  std::string repo_key;
  GitHubFailure failure;
};
struct PrCursorUp {};
struct PrCursorDown {};
struct TogglePrSelection {};
struct SelectAllPrs {};
struct ClearPrSelection {};
struct CycleFilter {};
struct RunPrOperation {
  PrOperation op{PrOperation::Merge};
};
struct PrOperationSucceeded {
  std::string repo_key;
  int number{0};
  PrOperation op{PrOperation::Merge};
};
struct PrOperationFailed {
  std::string repo_key;
  int number{0};
  PrOperation op{PrOperation::Merge};
  GitHubFailure failure;
};

// Build log panel
struct OpenBuildLogs {};
struct BuildLogsLoaded {
  std::string repo_key;
  int number{0};
  std::shared_ptr<const BuildLogs> logs;
};
struct BuildLogsLoadFailed {
  std::string repo_key;
  int number{0};
  GitHubFailure failure;
};
struct CloseLogPanel {};
struct LogCursorUp {};
struct LogCursorDown {};
struct LogPageUp {};
struct LogPageDown {};
struct LogScrollLeft {};
struct LogScrollRight {};
struct ToggleLogNode {};
struct NextError {};
struct PreviousError {};
struct ToggleTimestamps {};

// Command palette
struct OpenCommandPalette {};
struct CloseCommandPalette {};
/// Append @p text to the palette query.
struct CommandPaletteInput {
  std::string text;
};
struct CommandPaletteBackspace {};
struct CommandPaletteNext {};
struct CommandPalettePrevious {};
/// Close the palette and run the selected command.
struct CommandPaletteExecute {};

// Merge bot
struct StartMergeBot {};
struct StopMergeBot {};
struct RemoveFromMergeQueue {
  int number{0};
};
struct DismissMergeBotFailures {};
struct MergeBotStatusChecked {
  std::uint64_t run_id{0};
  int number{0};
  PullRequestStatus status;
};
struct MergeBotCheckFailed {
  std::uint64_t run_id{0};
  int number{0};
  GitHubFailure failure;
};
struct MergeBotRebased {
  std::uint64_t run_id{0};
  int number{0};
};
struct MergeBotRebaseFailed {
  std::uint64_t run_id{0};
  int number{0};
  GitHubFailure failure;
};
struct MergeBotMerged {
  std::uint64_t run_id{0};
  int number{0};
};
struct MergeBotMergeFailed {
  std::uint64_t run_id{0};
  int number{0};
  GitHubFailure failure;
};
struct MergeBotRerunRequested {
  std::uint64_t run_id{0};
  int number{0};
  std::optional<GitHubFailure> failure;
};
/// CI poll interval elapsed for an entry waiting on CI.
struct MergeBotPoll {
  std::uint64_t run_id{0};
  int number{0};
};
/// Backoff delay elapsed for a failed entry.
struct MergeBotRetry {
  std::uint64_t run_id{0};
  int number{0};
};

} // namespace actions

using Action = std::variant<
    actions::Bootstrap, actions::Quit, actions::ClockTick,
    actions::ToggleTheme, actions::ToggleHelp, actions::ToggleDebugConsole,
    actions::ShowStatus, actions::DismissStatus, actions::ResizeViewport,
    actions::AddRepository, actions::RemoveCurrentRepository,
    actions::SelectRepository, actions::NextRepository,
    actions::PreviousRepository, actions::RefreshCurrentRepository,
    actions::RefreshRepository, actions::PullRequestsLoaded,
    actions::PullRequestsLoadFailed, actions::PrCursorUp,
    actions::PrCursorDown, actions::TogglePrSelection, actions::SelectAllPrs,
    actions::ClearPrSelection, actions::CycleFilter, actions::RunPrOperation,
    actions::PrOperationSucceeded, actions::PrOperationFailed,
    actions::OpenBuildLogs, actions::BuildLogsLoaded,
    actions::BuildLogsLoadFailed, actions::CloseLogPanel,
    actions::LogCursorUp, actions::LogCursorDown, actions::LogPageUp,
    actions::LogPageDown, actions::LogScrollLeft, actions::LogScrollRight,
    actions::ToggleLogNode, actions::NextError, actions::PreviousError,
    actions::ToggleTimestamps, actions::OpenCommandPalette,
    actions::CloseCommandPalette, actions::CommandPaletteInput,
    actions::CommandPaletteBackspace, actions::CommandPaletteNext,
    actions::CommandPalettePrevious, actions::CommandPaletteExecute,
    actions::StartMergeBot, actions::StopMergeBot,
    actions::RemoveFromMergeQueue, actions::DismissMergeBotFailures,
    actions::MergeBotStatusChecked, actions::MergeBotCheckFailed,
    actions::MergeBotRebased, actions::MergeBotRebaseFailed,
    actions::MergeBotMerged, actions::MergeBotMergeFailed,
    actions::MergeBotRerunRequested, actions::MergeBotPoll,
    actions::MergeBotRetry>;

/// Name of the action alternative, used in debug logging.
const char *action_name(const Action &action);

} // namespace prdeck

#endif // PRDECK_ACTION_HPP
