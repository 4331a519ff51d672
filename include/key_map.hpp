/**
 * @file key_map.hpp
 * @brief Configurable translation of key presses into actions.
 */

#ifndef PRDECK_KEY_MAP_HPP
#define PRDECK_KEY_MAP_HPP

#include "action.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace prdeck {

/// Where a command is available.
enum class KeyScope { Global, Table, LogPanel };

/// UI facts that decide which bindings apply to a key.
struct KeyContext {
  bool log_panel_open{false};
  bool help_open{false};
  bool palette_open{false};
};

/// One line of the help overlay.
struct HelpEntry {
  std::string keys;        ///< "j, Down Arrow"
  std::string description; ///< "Next pull request"
};

/// A command offered by the command palette.
struct PaletteCommand {
  std::string name;     ///< Key map command name, e.g. "merge"
  std::string title;    ///< "Merge"
  std::string category; ///< "Pull Requests"
  std::string shortcut; ///< Bound keys, empty when unbound
  KeyScope scope{KeyScope::Global};
  bool needs_pull_requests{false};
};

/**
 * Key bindings of every command.
 *
 * Commands are named (`merge`, `next_error`, ...) and bound to one or more
 * keys. Table and log panel commands may share keys; global commands apply
 * in both.
 */
class KeyMap {
public:
  /// Build the default bindings.
  KeyMap();

  /**
   * Override bindings from configuration.
   *
   * @param bindings Command name to a comma or pipe separated list of key
   *        descriptors such as `ctrl+r`, `enter` or `x`. `none` or an empty
   *        string unbinds the command, `default` keeps its defaults.
   */
  void configure(const std::unordered_map<std::string, std::string> &bindings);

  /// When disabled only navigation, help and quit keys are active.
  void set_hotkeys_enabled(bool enabled) { hotkeys_enabled_ = enabled; }
  bool hotkeys_enabled() const { return hotkeys_enabled_; }

  /// Command bound to @p key in @p ctx, if any.
  std::optional<std::string> command_for_key(int key,
                                             const KeyContext &ctx) const;

  /**
   * Action for @p key in @p ctx.
   *
   * Returns `std::nullopt` for unbound keys and for commands that need input
   * from the terminal (`add_repository`, `dequeue`). While the help overlay
   * is open every key except quit closes it. While the command palette is
   * open keys edit the query, move the selection, run or close it.
   */
  std::optional<Action> action_for_key(int key, const KeyContext &ctx) const;

  /// Help overlay lines for the commands available in @p ctx.
  std::vector<HelpEntry> help_entries(const KeyContext &ctx) const;

  /// Keys bound to @p command, in binding order.
  std::vector<int> keys_for(const std::string &command) const;

  /**
   * Commands the palette can run, in help overlay order.
   *
   * Commands that need terminal input are left out, as are commands that
   * disabled hotkeys switch off.
   */
  std::vector<PaletteCommand> palette_commands() const;

private:
  struct Binding {
    int key;
    std::string label;
  };
  void bind(const std::string &command, std::vector<Binding> bindings);
  std::string binding_labels(const std::string &command) const;

  bool hotkeys_enabled_{true};
  std::unordered_map<std::string, std::vector<Binding>> bindings_;
  std::unordered_map<int, std::string> global_keys_;
  std::unordered_map<int, std::string> table_keys_;
  std::unordered_map<int, std::string> log_keys_;
};

/**
 * Action of a named command.
 *
 * @return `std::nullopt` for unknown commands and commands that need terminal
 *         input.
 */
std::optional<Action> action_for_command(const std::string &command);

/// Palette action for @p key while the command palette is open.
std::optional<Action> palette_action_for_key(int key);

} // namespace prdeck

#endif // PRDECK_KEY_MAP_HPP
