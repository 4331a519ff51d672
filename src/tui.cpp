/**
 * @file tui.cpp
 * @brief Implementation of the terminal UI for prdeck.
 *
 * Renders the pull request table, the build log panel, the merge bot queue
 * and the debug console from the view models in the store.
 */

#include "tui.hpp"
#include "log.hpp"
#include <algorithm>
#include <clocale>
#include <cstdio>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace prdeck {

namespace {

std::shared_ptr<spdlog::logger> tui_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("tui");
  }();
  return logger;
}

constexpr std::size_t kMaxQueueRows = 5;
constexpr std::size_t kMaxFailureRows = 3;

short curses_color(Color color) {
  switch (color) {
  case Color::Black:
    return COLOR_BLACK;
  case Color::Red:
    return COLOR_RED;
  case Color::Green:
    return COLOR_GREEN;
  case Color::Yellow:
    return COLOR_YELLOW;
  case Color::Blue:
    return COLOR_BLUE;
  case Color::Magenta:
    return COLOR_MAGENTA;
  case Color::Cyan:
    return COLOR_CYAN;
  case Color::White:
    return COLOR_WHITE;
  case Color::Default:
    break;
  }
  return -1;
}

/// Longest prefix of @p text spanning at most @p width code points.
std::string clip(const std::string &text, int width) {
  if (width <= 0) {
    return {};
  }
  int count = 0;
  std::size_t i = 0;
  for (; i < text.size(); ++i) {
    const auto byte = static_cast<unsigned char>(text[i]);
    if ((byte & 0xC0) != 0x80) {
      if (count == width) {
        break;
      }
      ++count;
    }
  }
  return text.substr(0, i);
}

Color status_color(const Theme &theme, StatusLevel level) {
  switch (level) {
  case StatusLevel::Warning:
    return theme.status_warning;
  case StatusLevel::Error:
    return theme.status_error;
  case StatusLevel::Info:
    break;
  }
  return theme.status_info;
}

} // namespace

Tui::Tui(Store &store, KeyMap keys, std::size_t log_limit)
    : store_(store), keys_(std::move(keys)), log_limit_(log_limit) {
  ensure_default_logger();
}

Tui::~Tui() { cleanup(); }

/**
 * Initialize the curses environment.
 *
 * @throws std::runtime_error When the curses subsystem cannot be initialized.
 */
void Tui::init() {
  if (!isatty(fileno(stdout)) || !isatty(fileno(stdin))) {
    tui_log()->warn("Not a terminal; the dashboard is not shown");
    return;
  }
  std::setlocale(LC_ALL, "");
  if (initscr() == nullptr) {
    throw std::runtime_error("Failed to initialize curses");
  }
  cbreak();
  noecho();
  keypad(stdscr, TRUE);
  set_escdelay(25);
  curs_set(0);
  colors_ = has_colors();
  if (colors_) {
    start_color();
    use_default_colors();
  }
  refresh();
  initialized_ = true;
  tui_log()->debug("Curses initialized (colors={})", colors_);
}

int Tui::color_pair(Color fg, Color bg) {
  if (!colors_) {
    return 0;
  }
  auto key = std::make_pair(static_cast<int>(fg), static_cast<int>(bg));
  auto it = pairs_.find(key);
  if (it != pairs_.end()) {
    return COLOR_PAIR(it->second);
  }
  if (next_pair_ >= COLOR_PAIRS) {
    return 0;
  }
  const int pair = next_pair_++;
  init_pair(static_cast<short>(pair), curses_color(fg), curses_color(bg));
  pairs_.emplace(key, pair);
  return COLOR_PAIR(pair);
}

void Tui::put_line(int row, int col, const std::string &text, int width,
                   int attrs) {
  if (width <= 0) {
    return;
  }
  attron(attrs);
  mvaddstr(row, col, clip(text, width).c_str());
  attroff(attrs);
}

void Tui::draw_tabs(const PrTableViewModel &vm, int width) {
  int col = 0;
  for (const auto &tab : vm.tabs) {
    std::string label = " " + tab.label;
    if (tab.loading) {
      label += " ...";
    } else if (tab.failed) {
      label += " !";
    }
    label += " ";
    int attrs = tab.active ? A_REVERSE | A_BOLD : A_NORMAL;
    put_line(0, col, label, width - col, attrs);
    col += static_cast<int>(label.size()) + 1;
    if (col >= width) {
      break;
    }
  }
  std::string info = vm.filter_label;
  if (vm.selected_count > 0) {
    info += "  " + std::to_string(vm.selected_count) + " selected";
  }
  put_line(1, 0, info, width, A_DIM);
}

void Tui::draw_table(const PrTableViewModel &vm, int top, int height,
                     int width) {
  if (vm.rows.empty()) {
    put_line(top, 1, vm.empty_message, width - 1, A_DIM);
    return;
  }
  int row = top;
  for (const auto &pr : vm.rows) {
    if (row >= top + height) {
      break;
    }
    std::string mark = pr.selected ? "[x] " : "[ ] ";
    int attrs = color_pair(pr.fg, pr.bg);
    if (pr.is_cursor && !colors_) {
      attrs |= A_REVERSE;
    }
    const int status_width = static_cast<int>(pr.status_label.size()) + 1;
    put_line(row, 0, mark + pr.text, width - status_width, attrs);
    put_line(row, std::max(0, width - status_width + 1), pr.status_label,
             status_width, color_pair(pr.status_color, pr.bg));
    ++row;
  }
}

void Tui::draw_log_panel(const LogPanelState &panel, int top, int height,
                         int width) {
  const auto &vm = panel.view;
  if (vm) {
    const auto &header = vm->header;
    int col = 0;
    put_line(top, col, header.number_text, width,
             color_pair(header.number_color, Color::Default) | A_BOLD);
    col += static_cast<int>(header.number_text.size()) + 1;
    put_line(top, col, header.title, width - col,
             color_pair(header.title_color, Color::Default));
    col += static_cast<int>(header.title.size()) + 1;
    put_line(top, col, header.author_text, width - col,
             color_pair(header.author_color, Color::Default));
  } else {
    put_line(top, 0, "#" + std::to_string(panel.pr.number) + " " + panel.pr.title,
             width, A_BOLD);
  }
  if (panel.loading) {
    put_line(top + 1, 1, "Loading build logs...", width - 1, A_DIM);
    return;
  }
  if (panel.error) {
    put_line(top + 1, 1, "Failed to load build logs: " + *panel.error,
             width - 1, A_BOLD);
    return;
  }
  if (!vm) {
    return;
  }
  int row = top + 1;
  for (const auto &line : vm->rows) {
    if (row >= top + height - 1) {
      break;
    }
    int attrs = color_pair(line.fg, line.bg);
    if (line.is_cursor && !colors_) {
      attrs |= A_REVERSE;
    }
    if (line.style == RowStyle::Error) {
      attrs |= A_BOLD;
    }
    put_line(row++, 0, line.text, width, attrs);
  }
  std::string footer = vm->summary;
  if (vm->total_rows > 0) {
    footer += "  [" +
              std::to_string(std::min(vm->scroll_offset + 1, vm->total_rows)) +
              "/" + std::to_string(vm->total_rows) + "]";
  }
  put_line(top + height - 1, 0, footer, width, A_DIM);
}

int Tui::draw_merge_bot(const MergeBotViewModel &vm, int bottom, int width) {
  const std::size_t queue_rows = std::min(vm.rows.size(), kMaxQueueRows);
  const std::size_t failure_rows = std::min(vm.failures.size(), kMaxFailureRows);
  const int height = 1 + static_cast<int>(queue_rows + failure_rows);
  int row = bottom - height;
  put_line(row++, 0, vm.summary, width, A_BOLD);
  for (std::size_t i = 0; i < queue_rows; ++i) {
    const auto &entry = vm.rows[i];
    std::string text = "  " + entry.text + "  " + entry.state_label + " " +
                       entry.attempts;
    if (!entry.countdown.empty()) {
      text += "  " + entry.countdown;
    }
    if (!entry.last_error.empty()) {
      text += "  (" + entry.last_error + ")";
    }
    put_line(row++, 0, text, width, color_pair(entry.color, Color::Default));
  }
  for (std::size_t i = 0; i < failure_rows; ++i) {
    put_line(row++, 0, "  ! " + vm.failures[i], width,
             color_pair(Color::Red, Color::Default));
  }
  return height;
}

void Tui::draw_status(const UiState &ui, const Theme &theme, int row,
                      int width) {
  if (ui.status) {
    put_line(row, 0, ui.status->text, width,
             color_pair(status_color(theme, ui.status->level), Color::Default) |
                 A_BOLD);
    return;
  }
  put_line(row, 0, "? help  : commands  q quit", width, A_DIM);
}

void Tui::draw_help(const AppState &state, int height, int width) {
  KeyContext ctx{state.log_panel.open, false};
  auto entries = keys_.help_entries(ctx);
  const int win_h = std::min(height - 2, static_cast<int>(entries.size()) + 2);
  const int win_w = std::min(width - 4, 60);
  if (win_h < 3 || win_w < 10) {
    return;
  }
  WINDOW *win = newwin(win_h, win_w, (height - win_h) / 2, (width - win_w) / 2);
  if (win == nullptr) {
    return;
  }
  box(win, 0, 0);
  mvwaddstr(win, 0, 2, " Keys ");
  int row = 1;
  for (const auto &entry : entries) {
    if (row >= win_h - 1) {
      break;
    }
    std::string line = entry.keys;
    line.resize(std::max<std::size_t>(line.size() + 1, 22), ' ');
    line += entry.description;
    mvwaddstr(win, row++, 2, clip(line, win_w - 4).c_str());
  }
  wnoutrefresh(win);
  delwin(win);
}

void Tui::draw_palette(const CommandPaletteViewModel &vm, int height,
                       int width) {
  const int list_rows = std::max<int>(1, static_cast<int>(vm.rows.size()));
  const int win_h = std::min(height - 2, list_rows + 4);
  const int win_w = std::min(width - 4, 72);
  if (win_h < 5 || win_w < 20) {
    return;
  }
  WINDOW *win = newwin(win_h, win_w, (height - win_h) / 3, (width - win_w) / 2);
  if (win == nullptr) {
    return;
  }
  box(win, 0, 0);
  mvwaddstr(win, 0, 2, " Commands ");
  const int inner = win_w - 4;
  wattron(win, A_BOLD);
  mvwaddstr(win, 1, 2, clip(vm.input_text, inner).c_str());
  wattroff(win, A_BOLD);
  int row = 2;
  if (vm.rows.empty()) {
    wattron(win, A_DIM);
    mvwaddstr(win, row, 2, clip(vm.empty_message, inner).c_str());
    wattroff(win, A_DIM);
  }
  for (const auto &entry : vm.rows) {
    if (row >= win_h - 2) {
      break;
    }
    int attrs = color_pair(entry.fg, entry.bg);
    if (entry.is_selected && !colors_) {
      attrs |= A_REVERSE;
    }
    mvwhline(win, row, 2, static_cast<chtype>(' ') | static_cast<chtype>(attrs),
             inner);
    wattron(win, attrs);
    mvwaddstr(win, row, 2, clip(entry.indicator, inner).c_str());
    wattroff(win, attrs);
    int col = static_cast<int>(entry.indicator.size());
    const int shortcut_attrs = color_pair(entry.shortcut_color, entry.bg);
    wattron(win, shortcut_attrs);
    mvwaddstr(win, row, 2 + col, clip(entry.shortcut, inner - col).c_str());
    wattroff(win, shortcut_attrs);
    col += static_cast<int>(entry.shortcut.size());
    const int category_col =
        std::max(col, inner - static_cast<int>(entry.category.size()));
    wattron(win, attrs);
    mvwaddstr(win, row, 2 + col,
              clip(entry.title, category_col - col - 1).c_str());
    wattroff(win, attrs);
    const int category_attrs = color_pair(entry.category_color, entry.bg);
    wattron(win, category_attrs);
    mvwaddstr(win, row, 2 + category_col,
              clip(entry.category, inner - category_col).c_str());
    wattroff(win, category_attrs);
    ++row;
  }
  std::string footer = std::to_string(vm.total_commands) + " commands";
  if (!vm.selected_command.empty()) {
    footer += "  " + vm.selected_command;
  }
  wattron(win, A_DIM);
  mvwaddstr(win, win_h - 2, 2, clip(footer, inner).c_str());
  wattroff(win, A_DIM);
  wnoutrefresh(win);
  delwin(win);
}

void Tui::draw_debug_console(int top, int height, int width) {
  mvhline(top, 0, ACS_HLINE, width);
  put_line(top, 2, " Debug ", width - 2, A_BOLD);
  const int rows = height - 1;
  if (rows <= 0) {
    return;
  }
  auto lines = recent_log_lines(std::min<std::size_t>(rows, log_limit_));
  int row = top + 1;
  for (const auto &line : lines) {
    put_line(row++, 0, line, width, A_DIM);
  }
}

void Tui::resize_viewport(const AppState &state, int table_rows, int log_rows) {
  const auto table = static_cast<std::size_t>(std::max(1, table_rows));
  const auto logs = static_cast<std::size_t>(std::max(1, log_rows));
  if (table == last_table_rows_ && logs == last_log_rows_ &&
      state.repositories.viewport_height == table &&
      state.log_panel.viewport_height == logs) {
    return;
  }
  last_table_rows_ = table;
  last_log_rows_ = logs;
  store_.dispatch(actions::ResizeViewport{table, logs});
}

/**
 * Redraw the entire user interface based on current state.
 */
void Tui::draw(const AppState &state) {
  if (!initialized_)
    return;
  const Theme theme = Theme::for_kind(state.ui.theme);
  int h = 0;
  int w = 0;
  getmaxyx(stdscr, h, w);
  erase();
  if (colors_) {
    bkgdset(static_cast<chtype>(color_pair(theme.text_primary, theme.background)));
  }

  int bottom = h - 1; // status line
  draw_status(state.ui, theme, bottom, w);
  if (state.merge_bot.view) {
    bottom -= draw_merge_bot(*state.merge_bot.view, bottom, w);
  }
  if (state.ui.show_debug_console) {
    const int console_height = std::max(3, h / 3);
    bottom -= console_height;
    draw_debug_console(bottom, console_height, w);
  }
  const int top = 2;
  const int main_height = std::max(1, bottom - top);
  if (state.repositories.view) {
    draw_tabs(*state.repositories.view, w);
  } else {
    put_line(0, 0, "No repositories. Press 'a' to add one.", w, A_DIM);
  }
  resize_viewport(state, main_height, main_height - 2);
  if (state.log_panel.open) {
    draw_log_panel(state.log_panel, top, main_height, w);
  } else if (state.repositories.view) {
    draw_table(*state.repositories.view, top, main_height, w);
  }
  wnoutrefresh(stdscr);
  if (state.ui.show_help) {
    draw_help(state, h, w);
  }
  if (state.palette.view) {
    draw_palette(*state.palette.view, h, w);
  }
  doupdate();
}

void Tui::prompt_repository() {
  int h = 0;
  int w = 0;
  getmaxyx(stdscr, h, w);
  move(h - 1, 0);
  clrtoeol();
  const std::string label = "Add repository (org/repo[@branch]): ";
  put_line(h - 1, 0, label, w, A_BOLD);
  echo();
  curs_set(1);
  timeout(-1);
  char buf[256] = {0};
  int rc = getnstr(buf, static_cast<int>(sizeof(buf) - 1));
  noecho();
  curs_set(0);
  if (rc == ERR || buf[0] == '\0') {
    return;
  }
  std::string input(buf);
  auto repo = parse_repository(input);
  if (!repo) {
    store_.dispatch(actions::ShowStatus{StatusLevel::Warning,
                                        "Invalid repository '" + input + "'"});
    return;
  }
  tui_log()->info("Adding repository {}", repo->key());
  store_.dispatch(actions::AddRepository{*repo});
}

void Tui::dequeue_cursor_row() {
  auto state = store_.current_state();
  const auto &vm = state->repositories.view;
  if (!vm) {
    return;
  }
  for (const auto &row : vm->rows) {
    if (row.is_cursor) {
      store_.dispatch(actions::RemoveFromMergeQueue{row.number});
      return;
    }
  }
}

void Tui::handle_key(int ch) {
  if (!initialized_)
    return;
  tui_log()->debug("Key pressed: {}", ch);
  auto state = store_.current_state();
  KeyContext ctx{state->log_panel.open, state->ui.show_help,
                 state->palette.open};
  if (!ctx.help_open && !ctx.palette_open) {
    auto command = keys_.command_for_key(ch, ctx);
    if (command && *command == "add_repository") {
      prompt_repository();
      return;
    }
    if (command && *command == "dequeue") {
      dequeue_cursor_row();
      return;
    }
  }
  auto action = keys_.action_for_key(ch, ctx);
  if (!action) {
    tui_log()->debug("Unhandled key: {}", ch);
    return;
  }
  store_.dispatch(std::move(*action));
}

/**
 * Enter the main UI loop, processing input until the state requests quit.
 */
void Tui::run() {
  if (!initialized_)
    return;
  std::uint64_t drawn = 0;
  bool force = true;
  while (true) {
    const std::uint64_t version = store_.version();
    auto state = store_.current_state();
    if (state->ui.quit) {
      break;
    }
    if (force || version != drawn) {
      draw(*state);
      drawn = version;
      force = false;
    }
    timeout(100);
    int ch = getch();
    if (ch == ERR) {
      continue;
    }
    if (ch == KEY_RESIZE) {
      force = true;
      continue;
    }
    handle_key(ch);
    force = true;
  }
}

/**
 * Restore terminal state after the UI terminates.
 */
void Tui::cleanup() {
  if (!initialized_)
    return;
  endwin();
  initialized_ = false;
}

} // namespace prdeck
