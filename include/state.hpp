/**
 * @file state.hpp
 * @brief Application state tree.
 *
 * Each slice is owned by its reducer. View models are cached alongside the
 * data they are derived from and replaced whenever that data changes.
 */

#ifndef PRDECK_STATE_HPP
#define PRDECK_STATE_HPP

#include "action.hpp"
#include "key_map.hpp"
#include "log_navigator.hpp"
#include "log_tree.hpp"
#include "merge_bot.hpp"
#include "pull_request.hpp"
#include "theme.hpp"
#include "view_model.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace prdeck {

/// Fetch state of one repository.
enum class LoadState { Idle, Loading, Loaded, Failed };

struct RepositoryData {
  Repository repo;
  std::vector<PullRequest> prs;
  std::set<int> selected; ///< Selected pull request numbers
  std::size_t cursor{0};  ///< Index into the filtered rows
  std::size_t scroll{0};
  LoadState load{LoadState::Idle};
  std::optional<GitHubFailure> error;
};

struct RepositoriesState {
  std::vector<RepositoryData> repos;
  std::size_t current{0};
  PrFilter filter{PrFilter::None};
  std::size_t viewport_height{20};
  std::shared_ptr<const PrTableViewModel> view;
};

struct LogPanelState {
  bool open{false};
  bool loading{false};
  std::string repo_key;
  PullRequest pr; ///< Pull request the logs belong to
  std::shared_ptr<const BuildLogs> logs;
  ExpansionSet expanded;
  LogPath cursor;
  std::size_t scroll{0};
  std::size_t horizontal_scroll{0};
  std::size_t viewport_height{20};
  bool show_timestamps{false};
  std::optional<std::string> error;
  std::shared_ptr<const LogPanelViewModel> view;
};

struct CommandPaletteState {
  bool open{false};
  std::string query;
  /// Indices into AppSettings::palette_commands, best match first.
  std::vector<std::size_t> matches;
  std::size_t selected{0}; ///< Index into matches
  std::size_t viewport_height{10};
  std::shared_ptr<const CommandPaletteViewModel> view;
};

struct StatusMessage {
  StatusLevel level{StatusLevel::Info};
  std::string text;
};

struct UiState {
  ThemeKind theme{ThemeKind::Dark};
  bool show_help{false};
  bool show_debug_console{false};
  std::optional<StatusMessage> status;
  bool quit{false};
  bool bootstrapped{false};
  Clock::time_point now{};
};

/// Values from configuration that reducers need.
struct AppSettings {
  MergeBotSettings merge_bot;
  std::string approval_message{"Approved"};
  std::string ide_command;
  std::string web_base{"https://github.com"};
  std::size_t viewport_height{20};
  std::vector<PaletteCommand> palette_commands; ///< From the key map
};

struct AppState {
  AppSettings settings;
  RepositoriesState repositories;
  LogPanelState log_panel;
  MergeBotState merge_bot;
  CommandPaletteState palette;
  UiState ui;
};

/// Initial state built from settings, before Bootstrap.
AppState make_initial_state(const AppSettings &settings);

/// Current repository, or null when none is configured.
const RepositoryData *current_repository(const RepositoriesState &repos);

/// Pull requests of @p data that pass @p filter, in list order.
std::vector<const PullRequest *> visible_pull_requests(const RepositoryData &data,
                                                       PrFilter filter);

/// Session snapshot built from the slices it persists.
SessionState capture_session(const RepositoriesState &repos,
                             bool show_timestamps, ThemeKind theme);

/// Session snapshot of the whole state.
SessionState capture_session(const AppState &state);

} // namespace prdeck

#endif // PRDECK_STATE_HPP
