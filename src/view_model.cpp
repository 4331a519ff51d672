#include "view_model.hpp"
#include "log_navigator.hpp"
#include "merge_bot.hpp"
#include "state.hpp"
#include "util/duration.hpp"

#include <algorithm>

namespace prdeck {

namespace {

std::string indent_of(std::size_t depth) {
  std::string out;
  for (std::size_t i = 1; i < depth; ++i) {
    out += "  ";
  }
  return out;
}

std::string error_suffix(std::size_t errors) {
  if (errors == 0) {
    return {};
  }
  return " (" + std::to_string(errors) + (errors == 1 ? " error)" : " errors)");
}

/// Drop the first @p count code points of a UTF-8 string.
std::string skip_code_points(const std::string &text, std::size_t count) {
  std::size_t pos = 0;
  while (count > 0 && pos < text.size()) {
    ++pos;
    while (pos < text.size() &&
           (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80) {
      ++pos;
    }
    --count;
  }
  return text.substr(pos);
}

const char *job_status_icon(JobStatus status) {
  switch (status) {
  case JobStatus::Success:
    return "✓";
  case JobStatus::Failure:
    return "✗";
  case JobStatus::Cancelled:
    return "⊘";
  case JobStatus::Skipped:
    return "⊝";
  case JobStatus::InProgress:
    return "⋯";
  case JobStatus::Unknown:
    break;
  }
  return "?";
}

RowStyle job_status_style(JobStatus status) {
  switch (status) {
  case JobStatus::Success:
    return RowStyle::Success;
  case JobStatus::Failure:
    return RowStyle::Error;
  default:
    return RowStyle::Normal;
  }
}

Color style_color(RowStyle style, const Theme &theme) {
  switch (style) {
  case RowStyle::Error:
    return theme.status_error;
  case RowStyle::Success:
    return theme.status_success;
  case RowStyle::Selected:
    return theme.selected_fg;
  case RowStyle::Normal:
    break;
  }
  return theme.text_primary;
}

TreeRowViewModel build_tree_row(const LogPanelState &panel, const LogPath &path) {
  const LogTree &tree = panel.logs->tree;
  TreeRowViewModel row;
  row.path = path;
  row.indent_level = path.empty() ? 0 : path.size() - 1;
  row.is_cursor = path == panel.cursor;

  const std::string indent = indent_of(path.size());
  const char *icon = " ";
  if (tree.child_count(path) > 0) {
    icon = panel.expanded.count(path) ? "▼" : "▶";
  }

  switch (path.size()) {
  case 1: {
    const auto *workflow = tree.workflow_at(path);
    row.node_type = NodeType::Workflow;
    row.style = workflow->has_failures() ? RowStyle::Error : RowStyle::Success;
    row.text = indent + icon + " " + (workflow->has_failures() ? "✗" : "✓") +
               " " + workflow->name() + error_suffix(workflow->error_count());
    break;
  }
  case 2: {
    const auto *workflow = tree.workflow_at(path);
    const auto *job = tree.job_at(path);
    row.node_type = NodeType::Job;
    JobStatus status =
        job->error_count() > 0 ? JobStatus::Failure : JobStatus::Success;
    std::string duration;
    auto meta = panel.logs->metadata.find(
        job_metadata_key(workflow->name(), job->name()));
    if (meta != panel.logs->metadata.end()) {
      status = meta->second.status;
      if (meta->second.duration) {
        duration = ", " + format_minutes_seconds(*meta->second.duration);
      }
    }
    row.style = job_status_style(status);
    row.text = indent + "├─ " + icon + " " + job_status_icon(status) + " " +
               job->name() + error_suffix(job->error_count()) + duration;
    break;
  }
  case 3: {
    const auto *step = tree.step_at(path);
    row.node_type = NodeType::Step;
    row.style = step->error_count() > 0 ? RowStyle::Error : RowStyle::Normal;
    row.text = indent + "│  ├─ " + icon + " " +
               (step->error_count() > 0 ? "✗" : "✓") + " " + step->name() +
               error_suffix(step->error_count());
    break;
  }
  default: {
    const auto *line = tree.line_at(path);
    row.node_type = NodeType::LogLine;
    row.style = line->is_error ? RowStyle::Error : RowStyle::Normal;
    std::string stamp;
    if (panel.show_timestamps && line->timestamp) {
      stamp = "[" + *line->timestamp + "] ";
    }
    row.text = indent + "│     " + stamp +
               skip_code_points(line->display, panel.horizontal_scroll);
    break;
  }
  }
  return row;
}

std::string plural(std::size_t n, const char *word) {
  return std::to_string(n) + " " + word + (n == 1 ? "" : "s");
}

Color mergeable_color(MergeableStatus status, const Theme &theme) {
  switch (status) {
  case MergeableStatus::Ready:
    return theme.status_success;
  case MergeableStatus::BuildFailed:
  case MergeableStatus::Conflicted:
    return theme.status_error;
  case MergeableStatus::NeedsRebase:
  case MergeableStatus::Blocked:
  case MergeableStatus::BuildInProgress:
    return theme.status_warning;
  case MergeableStatus::Rebasing:
  case MergeableStatus::Merging:
    return theme.status_info;
  case MergeableStatus::Unknown:
    break;
  }
  return theme.text_muted;
}

Color entry_color(MergeEntryState state, const Theme &theme) {
  switch (state) {
  case MergeEntryState::Failed:
    return theme.status_error;
  case MergeEntryState::ReadyToMerge:
  case MergeEntryState::Merging:
  case MergeEntryState::Merged:
    return theme.status_success;
  case MergeEntryState::NeedsRebase:
  case MergeEntryState::Rebasing:
  case MergeEntryState::WaitingForCi:
    return theme.status_warning;
  case MergeEntryState::Queued:
    break;
  }
  return theme.text_muted;
}

constexpr std::size_t kShortcutColumn = 12;

} // namespace

std::shared_ptr<const LogPanelViewModel>
recompute_log_panel(const LogPanelState &panel, const Theme &theme) {
  if (!panel.logs) {
    return nullptr;
  }
  auto vm = std::make_shared<LogPanelViewModel>();
  vm->header.number_text = "#" + std::to_string(panel.pr.number);
  vm->header.title = panel.pr.title;
  vm->header.author_text = "by " + panel.pr.author;
  vm->header.number_color = theme.accent;
  vm->header.title_color = theme.text_primary;
  vm->header.author_color = theme.text_muted;

  const auto visible = flatten_visible(panel.logs->tree, panel.expanded);
  vm->total_rows = visible.size();
  vm->viewport_height = panel.viewport_height;
  vm->scroll_offset = std::min(panel.scroll, visible.size());
  const std::size_t end =
      std::min(visible.size(), vm->scroll_offset + panel.viewport_height);
  for (std::size_t i = vm->scroll_offset; i < end; ++i) {
    auto row = build_tree_row(panel, visible[i]);
    if (row.is_cursor) {
      row.fg = theme.selected_fg;
      row.bg = theme.selected_bg;
    } else {
      row.fg = style_color(row.style, theme);
      row.bg = theme.background;
    }
    vm->rows.push_back(std::move(row));
  }

  const LogTree &tree = panel.logs->tree;
  if (tree.empty()) {
    vm->summary = "No build logs";
  } else if (!tree.has_failures()) {
    vm->summary = "No errors";
  } else {
    std::size_t failing = 0;
    for (const auto &wf : tree.workflows()) {
      failing += wf.has_failures() ? 1 : 0;
    }
    vm->summary = plural(tree.error_count(), "error") + " in " +
                  plural(failing, "workflow");
  }
  return vm;
}

std::shared_ptr<const PrTableViewModel>
recompute_pr_table(const RepositoriesState &repos, const Theme &theme) {
  if (repos.repos.empty()) {
    return nullptr;
  }
  auto vm = std::make_shared<PrTableViewModel>();
  for (std::size_t i = 0; i < repos.repos.size(); ++i) {
    const auto &data = repos.repos[i];
    RepositoryTabViewModel tab;
    tab.label = data.repo.display_name();
    if (data.repo.branch != "main") {
      tab.label += "@" + data.repo.branch;
    }
    tab.active = i == repos.current;
    tab.loading = data.load == LoadState::Loading;
    tab.failed = data.load == LoadState::Failed;
    vm->tabs.push_back(std::move(tab));
  }
  vm->filter_label = std::string("filter: ") + to_string(repos.filter);

  const auto *data = current_repository(repos);
  if (!data) {
    return vm;
  }
  vm->selected_count = data->selected.size();
  const auto visible = visible_pull_requests(*data, repos.filter);
  vm->total_rows = visible.size();
  vm->scroll_offset = std::min(data->scroll, visible.size());
  const std::size_t end =
      std::min(visible.size(), vm->scroll_offset + repos.viewport_height);
  for (std::size_t i = vm->scroll_offset; i < end; ++i) {
    const PullRequest &pr = *visible[i];
    PrRowViewModel row;
    row.number = pr.number;
    row.text = "#" + std::to_string(pr.number) + " " + pr.title + " (" +
               pr.author + ", " + plural(static_cast<std::size_t>(pr.comments),
                                         "comment") +
               ")";
    row.status_label = to_string(pr.mergeable);
    row.status_color = mergeable_color(pr.mergeable, theme);
    row.selected = data->selected.count(pr.number) > 0;
    row.is_cursor = i == data->cursor;
    if (row.is_cursor) {
      row.fg = theme.selected_fg;
      row.bg = theme.selected_bg;
    } else {
      row.fg = row.selected ? theme.accent : theme.text_primary;
      row.bg = theme.background;
    }
    vm->rows.push_back(std::move(row));
  }

  if (visible.empty()) {
    if (data->load == LoadState::Loading) {
      vm->empty_message = "Loading pull requests...";
    } else if (data->load == LoadState::Failed && data->error) {
      vm->empty_message = "Failed to load: " + data->error->message;
    } else if (repos.filter != PrFilter::None && !data->prs.empty()) {
      vm->empty_message = std::string("No pull requests match ") +
                          to_string(repos.filter);
    } else {
      vm->empty_message = "No open pull requests";
    }
  }
  return vm;
}

std::shared_ptr<const MergeBotViewModel>
recompute_merge_bot(const MergeBotState &bot, const Theme &theme) {
  if (!bot.running && bot.queue.empty() && bot.merged.empty() &&
      bot.failures.empty()) {
    return nullptr;
  }
  auto vm = std::make_shared<MergeBotViewModel>();
  vm->running = bot.running;
  vm->summary = std::string(bot.running ? "running" : "stopped") + ": " +
                std::to_string(bot.queue.size()) + " queued, " +
                std::to_string(bot.merged.size()) + " merged, " +
                std::to_string(bot.failures.size()) + " failed";
  if (!bot.message.empty()) {
    vm->summary += " | " + bot.message;
  }
  for (const auto &entry : bot.queue) {
    MergeQueueRowViewModel row;
    row.number = entry.number;
    row.text = "#" + std::to_string(entry.number) + " " + entry.title;
    row.state_label = to_string(entry.state);
    row.attempts = std::to_string(entry.attempts) + "/" +
                   std::to_string(bot.settings.retry_budget);
    if (entry.retry_at) {
      if (*entry.retry_at > bot.now) {
        auto remaining = std::chrono::ceil<std::chrono::seconds>(
            *entry.retry_at - bot.now);
        row.countdown = "retry in " + format_minutes_seconds(remaining);
      } else {
        row.countdown = "retrying";
      }
    }
    if (entry.last_error) {
      row.last_error = entry.last_error->message.empty()
                           ? std::string(to_string(entry.last_error->kind))
                           : entry.last_error->message;
    }
    row.color = entry_color(entry.state, theme);
    vm->rows.push_back(std::move(row));
  }
  for (const auto &failure : bot.failures) {
    vm->failures.push_back("#" + std::to_string(failure.number) + " " +
                           failure.title + ": " + failure.reason + " (" +
                           plural(static_cast<std::size_t>(failure.attempts),
                                  "attempt") +
                           ")");
  }
  return vm;
}

std::size_t palette_window_start(std::size_t selected, std::size_t total,
                                 std::size_t height) {
  if (height == 0 || total <= height) {
    return 0;
  }
  const std::size_t half = height / 2;
  if (selected < half) {
    return 0;
  }
  if (selected >= total - half) {
    return total - height;
  }
  return selected - half;
}

std::shared_ptr<const CommandPaletteViewModel>
recompute_command_palette(const CommandPaletteState &palette,
                          const std::vector<PaletteCommand> &commands,
                          const Theme &theme) {
  if (!palette.open) {
    return nullptr;
  }
  auto vm = std::make_shared<CommandPaletteViewModel>();
  vm->input_text = "> " + palette.query;
  vm->total_commands = palette.matches.size();
  if (palette.matches.empty()) {
    vm->empty_message = palette.query.empty() ? "No commands available"
                                              : "No matching commands";
    return vm;
  }
  const std::size_t selected =
      std::min(palette.selected, palette.matches.size() - 1);
  vm->scroll_offset = palette_window_start(selected, palette.matches.size(),
                                           palette.viewport_height);
  const std::size_t end = std::min(palette.matches.size(),
                                   vm->scroll_offset + palette.viewport_height);

  std::size_t category_width = 0;
  for (std::size_t i = vm->scroll_offset; i < end; ++i) {
    if (palette.matches[i] < commands.size()) {
      category_width = std::max(
          category_width, commands[palette.matches[i]].category.size() + 2);
    }
  }
  for (std::size_t i = vm->scroll_offset; i < end; ++i) {
    if (palette.matches[i] >= commands.size()) {
      continue;
    }
    const PaletteCommand &command = commands[palette.matches[i]];
    CommandPaletteRowViewModel row;
    row.is_selected = i == selected;
    row.indicator = row.is_selected ? "> " : "  ";
    row.shortcut = command.shortcut;
    if (row.shortcut.size() < kShortcutColumn) {
      row.shortcut.resize(kShortcutColumn, ' ');
    }
    row.shortcut += ' ';
    row.title = command.title;
    row.category = "[" + command.category + "]";
    row.category.insert(0, category_width - row.category.size(), ' ');
    if (row.is_selected) {
      row.fg = theme.selected_fg;
      row.bg = theme.selected_bg;
      row.shortcut_color = theme.selected_fg;
      row.category_color = theme.selected_fg;
    } else {
      row.fg = theme.text_primary;
      row.bg = theme.background;
      row.shortcut_color = theme.accent;
      row.category_color = theme.text_muted;
    }
    vm->rows.push_back(std::move(row));
  }
  const std::size_t chosen = palette.matches[selected];
  if (chosen < commands.size()) {
    vm->selected_command = commands[chosen].name;
  }
  return vm;
}

} // namespace prdeck
