#include "reducer.hpp"
#include "log_navigator.hpp"
#include "util/overloaded.hpp"

#include <algorithm>

namespace prdeck {

namespace {

constexpr std::size_t kHorizontalStep = 4;

std::optional<std::size_t> row_of(const std::vector<LogPath> &visible,
                                  const LogPath &cursor) {
  auto it = std::find(visible.begin(), visible.end(), cursor);
  if (it == visible.end()) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(it - visible.begin());
}

/// Move the cursor to its nearest visible ancestor and scroll it into view.
void settle_cursor(LogPanelState &panel) {
  if (!panel.logs) {
    return;
  }
  const auto visible = flatten_visible(panel.logs->tree, panel.expanded);
  if (visible.empty()) {
    panel.cursor.clear();
    panel.scroll = 0;
    return;
  }
  auto row = row_of(visible, panel.cursor);
  while (!row && !panel.cursor.empty()) {
    panel.cursor.pop_back();
    row = row_of(visible, panel.cursor);
  }
  if (!row) {
    panel.cursor = visible.front();
    row = 0;
  }
  const std::size_t viewport = std::max<std::size_t>(panel.viewport_height, 1);
  if (*row < panel.scroll) {
    panel.scroll = *row;
  } else if (*row >= panel.scroll + viewport) {
    panel.scroll = *row - viewport + 1;
  }
  const std::size_t max_scroll =
      visible.size() > viewport ? visible.size() - viewport : 0;
  panel.scroll = std::min(panel.scroll, max_scroll);
}

/// Move the cursor by @p delta visible rows, clamped to the list.
bool move_cursor(LogPanelState &panel, long delta) {
  if (!panel.logs) {
    return false;
  }
  const auto visible = flatten_visible(panel.logs->tree, panel.expanded);
  if (visible.empty()) {
    return false;
  }
  const auto row = row_of(visible, panel.cursor).value_or(0);
  long target = static_cast<long>(row) + delta;
  target = std::max(0L, std::min(target, static_cast<long>(visible.size()) - 1));
  if (static_cast<std::size_t>(target) == row && panel.cursor == visible[row]) {
    return false;
  }
  panel.cursor = visible[static_cast<std::size_t>(target)];
  settle_cursor(panel);
  return true;
}

/// Width in code points of the longest visible log line.
std::size_t longest_visible_line(const LogPanelState &panel) {
  std::size_t longest = 0;
  for (const auto &path : flatten_visible(panel.logs->tree, panel.expanded)) {
    const LogLine *line = panel.logs->tree.line_at(path);
    if (!line) {
      continue;
    }
    const std::size_t width = static_cast<std::size_t>(std::count_if(
        line->display.begin(), line->display.end(), [](char c) {
          return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
        }));
    longest = std::max(longest, width);
  }
  return longest;
}

bool matches_open(const LogPanelState &panel, const std::string &repo_key,
                  int number) {
  return panel.open && panel.repo_key == repo_key && panel.pr.number == number;
}

} // namespace

LogPanelState reduce_log_panel(const AppState &prev, const Action &action,
                               const Theme &theme,
                               std::vector<Effect> &effects) {
  LogPanelState next = prev.log_panel;
  bool changed = false;

  std::visit(
      overloaded{
          [&](const actions::Bootstrap &a) {
            if (next.show_timestamps != a.session.show_timestamps) {
              next.show_timestamps = a.session.show_timestamps;
              changed = true;
            }
          },
          [&](const actions::ToggleTheme &) { changed = true; },
          [&](const actions::ResizeViewport &a) {
            if (a.log_rows == next.viewport_height) {
              return;
            }
            next.viewport_height = a.log_rows;
            settle_cursor(next);
            changed = true;
          },
          [&](const actions::OpenBuildLogs &) {
            const auto *data = current_repository(prev.repositories);
            if (!data) {
              return;
            }
            const auto visible =
                visible_pull_requests(*data, prev.repositories.filter);
            if (data->cursor >= visible.size()) {
              return;
            }
            if (next.loading) {
              effects.emplace_back(effects::CancelSubsystem{Subsystem::Logs});
            }
            LogPanelState fresh;
            fresh.viewport_height = next.viewport_height;
            fresh.show_timestamps = next.show_timestamps;
            fresh.open = true;
            fresh.loading = true;
            fresh.repo_key = data->repo.key();
            fresh.pr = *visible[data->cursor];
            next = std::move(fresh);
            effects.emplace_back(effects::FetchBuildLogs{data->repo, next.pr});
          },
          [&](const actions::BuildLogsLoaded &a) {
            if (!matches_open(next, a.repo_key, a.number) || !a.logs) {
              return;
            }
            next.logs = a.logs;
            next.loading = false;
            next.error.reset();
            next.expanded = default_expansion(next.logs->tree);
            next.cursor.clear();
            if (!next.logs->tree.empty()) {
              next.cursor = LogPath{0};
            }
            next.scroll = 0;
            next.horizontal_scroll = 0;
            changed = true;
          },
          [&](const actions::BuildLogsLoadFailed &a) {
            if (!matches_open(next, a.repo_key, a.number)) {
              return;
            }
            next.loading = false;
            next.error = a.failure.message.empty()
                             ? std::string(to_string(a.failure.kind))
                             : a.failure.message;
            changed = true;
          },
          [&](const actions::CloseLogPanel &) {
            if (!next.open) {
              return;
            }
            if (next.loading) {
              effects.emplace_back(effects::CancelSubsystem{Subsystem::Logs});
            }
            LogPanelState closed;
            closed.viewport_height = next.viewport_height;
            closed.show_timestamps = next.show_timestamps;
            next = std::move(closed);
          },
          [&](const actions::LogCursorUp &) { changed = move_cursor(next, -1); },
          [&](const actions::LogCursorDown &) { changed = move_cursor(next, 1); },
          [&](const actions::LogPageUp &) {
            changed = move_cursor(
                next, -static_cast<long>(std::max<std::size_t>(
                          next.viewport_height, 1)));
          },
          [&](const actions::LogPageDown &) {
            changed = move_cursor(next, static_cast<long>(std::max<std::size_t>(
                                            next.viewport_height, 1)));
          },
          [&](const actions::LogScrollLeft &) {
            if (!next.logs || next.horizontal_scroll == 0) {
              return;
            }
            next.horizontal_scroll -=
                std::min(next.horizontal_scroll, kHorizontalStep);
            changed = true;
          },
          [&](const actions::LogScrollRight &) {
            if (!next.logs) {
              return;
            }
            const std::size_t limit = longest_visible_line(next);
            const std::size_t target =
                std::min(next.horizontal_scroll + kHorizontalStep, limit);
            if (target <= next.horizontal_scroll) {
              return;
            }
            next.horizontal_scroll = target;
            changed = true;
          },
          [&](const actions::ToggleLogNode &) {
            if (!next.logs) {
              return;
            }
            auto expanded = toggle(next.logs->tree, next.expanded, next.cursor);
            if (expanded == next.expanded) {
              return;
            }
            next.expanded = std::move(expanded);
            settle_cursor(next);
            changed = true;
          },
          [&](const actions::NextError &) {
            if (!next.open || !next.logs) {
              return;
            }
            auto target =
                find_next_error(next.logs->tree, next.cursor, Direction::Forward);
            if (!target) {
              return;
            }
            next.expanded = expand_ancestors(next.expanded, *target);
            next.cursor = *target;
            settle_cursor(next);
            changed = true;
          },
          [&](const actions::PreviousError &) {
            if (!next.open || !next.logs) {
              return;
            }
            auto target = find_next_error(next.logs->tree, next.cursor,
                                          Direction::Backward);
            if (!target) {
              return;
            }
            next.expanded = expand_ancestors(next.expanded, *target);
            next.cursor = *target;
            settle_cursor(next);
            changed = true;
          },
          [&](const actions::ToggleTimestamps &) {
            next.show_timestamps = !next.show_timestamps;
            changed = true;
          },
          [](const auto &) {},
      },
      action);

  if (changed) {
    next.view = recompute_log_panel(next, theme);
  }
  return next;
}

} // namespace prdeck
