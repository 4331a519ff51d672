#include "action.hpp"

#include <array>

namespace prdeck {

namespace {

constexpr std::array<const char *, 61> kActionNames = {
    "Bootstrap",
    "Quit",
    "ClockTick",
    "ToggleTheme",
    "ToggleHelp",
    "ToggleDebugConsole",
    "ShowStatus",
    "DismissStatus",
    "ResizeViewport",
    "AddRepository",
    "RemoveCurrentRepository",
    "SelectRepository",
    "NextRepository",
    "PreviousRepository",
    "RefreshCurrentRepository",
    "RefreshRepository",
    "PullRequestsLoaded",
    "PullRequestsLoadFailed",
    "PrCursorUp",
    "PrCursorDown",
    "TogglePrSelection",
    "SelectAllPrs",
    "ClearPrSelection",
    "CycleFilter",
    "RunPrOperation",
    "PrOperationSucceeded",
    "PrOperationFailed",
    "OpenBuildLogs",
    "BuildLogsLoaded",
    "BuildLogsLoadFailed",
    "CloseLogPanel",
    "LogCursorUp",
    "LogCursorDown",
    "LogPageUp",
    "LogPageDown",
    "LogScrollLeft",
    "LogScrollRight",
    "ToggleLogNode",
    "NextError",
    "PreviousError",
    "ToggleTimestamps",
    "OpenCommandPalette",
    "CloseCommandPalette",
    "CommandPaletteInput",
    "CommandPaletteBackspace",
    "CommandPaletteNext",
    "CommandPalettePrevious",
    "CommandPaletteExecute",
    "StartMergeBot",
    "StopMergeBot",
    "RemoveFromMergeQueue",
    "DismissMergeBotFailures",
    "MergeBotStatusChecked",
    "MergeBotCheckFailed",
    "MergeBotRebased",
    "MergeBotRebaseFailed",
    "MergeBotMerged",
    "MergeBotMergeFailed",
    "MergeBotRerunRequested",
    "MergeBotPoll",
    "MergeBotRetry",
};

static_assert(kActionNames.size() == std::variant_size_v<Action>,
              "every action needs a name");

} // namespace

const char *to_string(PrOperation op) {
  switch (op) {
  case PrOperation::Merge:
    return "merge";
  case PrOperation::Rebase:
    return "rebase";
  case PrOperation::RerunFailedJobs:
    return "rerun failed jobs";
  case PrOperation::Approve:
    return "approve";
  case PrOperation::OpenInBrowser:
    return "open in browser";
  case PrOperation::OpenInIde:
    return "open in IDE";
  }
  return "operation";
}

const char *action_name(const Action &action) {
  return kActionNames[action.index()];
}

} // namespace prdeck
