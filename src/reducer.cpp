#include "reducer.hpp"
#include "command_palette.hpp"
#include "key_map.hpp"
#include "log_navigator.hpp"
#include "util/overloaded.hpp"

#include <iterator>
#include <utility>

namespace prdeck {

namespace {

StatusLevel level_for(const GitHubFailure &failure) {
  return is_transient(failure.kind) ? StatusLevel::Warning : StatusLevel::Error;
}

std::string failure_text(const GitHubFailure &failure) {
  std::string text = to_string(failure.kind);
  if (!failure.message.empty()) {
    text += ": " + failure.message;
  }
  return text;
}

/// Whether an error jump from the current log cursor would find nothing.
bool error_jump_exhausted(const LogPanelState &panel, Direction direction) {
  if (!panel.open || !panel.logs) {
    return false;
  }
  return !find_next_error(panel.logs->tree, panel.cursor, direction).has_value();
}

/// Run the command the palette had selected in @p prev on top of @p closed.
Reduction run_palette_selection(const AppState &prev, Reduction closed) {
  const PaletteCommand *command = selected_palette_command(prev);
  if (!command) {
    return closed;
  }
  if (!palette_command_available(*command, palette_context(prev))) {
    closed.state.ui.status = StatusMessage{
        StatusLevel::Warning, command->title + " is not available here"};
    return closed;
  }
  auto chosen = action_for_command(command->name);
  if (!chosen) {
    return closed;
  }
  Reduction chained = reduce(closed.state, *chosen);
  closed.effects.insert(closed.effects.end(),
                        std::make_move_iterator(chained.effects.begin()),
                        std::make_move_iterator(chained.effects.end()));
  chained.effects = std::move(closed.effects);
  return chained;
}

} // namespace

UiState reduce_ui(const AppState &prev, const Action &action,
                  std::vector<Effect> &effects) {
  (void)effects;
  UiState next = prev.ui;
  std::visit(
      overloaded{
          [&](const actions::Bootstrap &a) {
            next.theme = a.session.theme;
            next.bootstrapped = true;
          },
          [&](const actions::Quit &) { next.quit = true; },
          [&](const actions::ClockTick &a) { next.now = a.now; },
          [&](const actions::ToggleTheme &) { next.theme = toggled(next.theme); },
          [&](const actions::ToggleHelp &) { next.show_help = !next.show_help; },
          [&](const actions::ToggleDebugConsole &) {
            next.show_debug_console = !next.show_debug_console;
          },
          [&](const actions::ShowStatus &a) {
            next.status = StatusMessage{a.level, a.text};
          },
          [&](const actions::DismissStatus &) { next.status.reset(); },
          [&](const actions::PullRequestsLoadFailed &a) {
            next.status = StatusMessage{level_for(a.failure),
                                        a.repo_key + ": " +
                                            failure_text(a.failure)};
          },
          [&](const actions::RunPrOperation &a) {
            const auto *data = current_repository(prev.repositories);
            bool has_target = false;
            if (data) {
              has_target = !data->selected.empty() ||
                           data->cursor <
                               visible_pull_requests(*data, prev.repositories.filter)
                                   .size();
            }
            if (!has_target) {
              next.status = StatusMessage{
                  StatusLevel::Warning,
                  std::string("No pull request to ") + to_string(a.op)};
            } else if (a.op == PrOperation::OpenInIde &&
                       prev.settings.ide_command.empty()) {
              next.status = StatusMessage{StatusLevel::Warning,
                                          "No IDE command configured"};
            }
          },
          [&](const actions::PrOperationSucceeded &a) {
            next.status = StatusMessage{
                StatusLevel::Info, std::string(to_string(a.op)) + " #" +
                                       std::to_string(a.number) + " done"};
          },
          [&](const actions::PrOperationFailed &a) {
            next.status = StatusMessage{
                level_for(a.failure),
                std::string(to_string(a.op)) + " #" +
                    std::to_string(a.number) + " failed: " +
                    failure_text(a.failure)};
          },
          [&](const actions::BuildLogsLoadFailed &a) {
            next.status = StatusMessage{
                level_for(a.failure), "Build logs for #" +
                                          std::to_string(a.number) + ": " +
                                          failure_text(a.failure)};
          },
          [&](const actions::StartMergeBot &) {
            const auto *data = current_repository(prev.repositories);
            if ((!data || data->selected.empty()) &&
                prev.merge_bot.queue.empty()) {
              next.status = StatusMessage{StatusLevel::Warning,
                                          "Select pull requests to merge"};
            }
          },
          [&](const actions::NextError &) {
            if (error_jump_exhausted(prev.log_panel, Direction::Forward)) {
              next.status = StatusMessage{StatusLevel::Info, "No further errors"};
            }
          },
          [&](const actions::PreviousError &) {
            if (error_jump_exhausted(prev.log_panel, Direction::Backward)) {
              next.status =
                  StatusMessage{StatusLevel::Info, "No previous errors"};
            }
          },
          [&](const auto &) {},
      },
      action);
  return next;
}

Reduction reduce(const AppState &state, const Action &action) {
  Reduction out{state, {}};
  out.state.ui = reduce_ui(state, action, out.effects);
  const Theme theme = Theme::for_kind(out.state.ui.theme);
  out.state.repositories =
      reduce_repositories(state, action, theme, out.effects);
  out.state.log_panel = reduce_log_panel(state, action, theme, out.effects);
  out.state.merge_bot = reduce_merge_bot(state, action, theme, out.effects);
  out.state.palette = reduce_command_palette(state, action, theme, out.effects);
  if (std::holds_alternative<actions::CommandPaletteExecute>(action) &&
      state.palette.open) {
    return run_palette_selection(state, std::move(out));
  }
  return out;
}

} // namespace prdeck
