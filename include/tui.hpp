#ifndef PRDECK_TUI_HPP
#define PRDECK_TUI_HPP

#include <curses.h>

#include "key_map.hpp"
#include "state.hpp"
#include "store.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>

namespace prdeck {

/**
 * Curses renderer over the view models of the store's current state.
 *
 * Key presses are translated through a KeyMap and dispatched; the TUI keeps
 * no state of its own apart from windows and the color pair cache.
 */
class Tui {
public:
  /**
   * @param store Store rendered and dispatched to.
   * @param keys Key bindings.
   * @param log_limit Lines shown by the debug console.
   */
  Tui(Store &store, KeyMap keys, std::size_t log_limit = 200);
  ~Tui();

  Tui(const Tui &) = delete;
  Tui &operator=(const Tui &) = delete;

  /// Initialize curses. Does nothing when stdin or stdout is not a terminal.
  void init();

  /// Process input and redraw until the state requests quit.
  void run();

  /// Restore the terminal.
  void cleanup();

  /// Draw @p state once.
  void draw(const AppState &state);

  /**
   * Handle a single key press.
   *
   * @param ch Character code received from curses.
   */
  void handle_key(int ch);

  bool initialized() const { return initialized_; }

private:
  int color_pair(Color fg, Color bg);
  void draw_tabs(const PrTableViewModel &vm, int width);
  void draw_table(const PrTableViewModel &vm, int top, int height, int width);
  void draw_log_panel(const LogPanelState &panel, int top, int height,
                      int width);
  int draw_merge_bot(const MergeBotViewModel &vm, int bottom, int width);
  void draw_status(const UiState &ui, const Theme &theme, int row, int width);
  void draw_help(const AppState &state, int height, int width);
  void draw_palette(const CommandPaletteViewModel &vm, int height, int width);
  void draw_debug_console(int top, int height, int width);
  void resize_viewport(const AppState &state, int table_rows, int log_rows);
  void prompt_repository();
  void dequeue_cursor_row();
  void put_line(int row, int col, const std::string &text, int width,
                int attrs);

  Store &store_;
  KeyMap keys_;
  std::size_t log_limit_;
  bool initialized_{false};
  bool colors_{false};
  std::map<std::pair<int, int>, int> pairs_;
  int next_pair_{1};
  std::size_t last_table_rows_{0};
  std::size_t last_log_rows_{0};
};

} // namespace prdeck

#endif // PRDECK_TUI_HPP
