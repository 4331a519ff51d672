/**
 * @file key_map.cpp
 * @brief Default hotkeys, binding parser and key to action lookup.
 */

#include "key_map.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <curses.h>
#include <iterator>
#include <memory>
#include <spdlog/spdlog.h>
#include <unordered_set>

namespace prdeck {

namespace {

std::shared_ptr<spdlog::logger> tui_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("tui");
  }();
  return logger;
}

struct ParsedBinding {
  int key;
  std::string label;
};

struct CommandSpec {
  const char *name;
  const char *description;
  const char *category;
  KeyScope scope;
  const char *defaults;
  bool navigation; ///< Stays active when hotkeys are disabled
};

constexpr int kEscape = 27;

constexpr const char *kGeneral = "General";
constexpr const char *kView = "View";
constexpr const char *kMergeBot = "Merge Bot";
constexpr const char *kNavigation = "Navigation";
constexpr const char *kRepositories = "Repositories";
constexpr const char *kPullRequests = "Pull Requests";
constexpr const char *kLogViewer = "Log Viewer";

// Help overlay order.
const std::vector<CommandSpec> &command_specs() {
  static const std::vector<CommandSpec> specs{
      {"quit", "Quit", kGeneral, KeyScope::Global, "q", true},
      {"help", "Toggle help", kGeneral, KeyScope::Global, "?", true},
      {"palette", "Command palette", kGeneral, KeyScope::Global, "ctrl+p,:",
       false},
      {"toggle_theme", "Switch theme", kView, KeyScope::Global, "t", false},
      {"debug_console", "Toggle debug console", kView, KeyScope::Global, "~",
       true},
      {"timestamps", "Toggle log timestamps", kView, KeyScope::Global, "T",
       false},
      {"merge_bot_start", "Start merge bot", kMergeBot, KeyScope::Global, "M",
       false},
      {"merge_bot_stop", "Stop merge bot", kMergeBot, KeyScope::Global, "S",
       false},
      {"dismiss_failures", "Dismiss merge failures", kMergeBot,
       KeyScope::Global, "X", false},
      {"up", "Previous pull request", kNavigation, KeyScope::Table, "k,up",
       true},
      {"down", "Next pull request", kNavigation, KeyScope::Table, "j,down",
       true},
      {"next_repo", "Next repository", kNavigation, KeyScope::Table,
       "tab,l,right", true},
      {"prev_repo", "Previous repository", kNavigation, KeyScope::Table,
       "shift+tab,h,left", true},
      {"refresh", "Refresh repository", kRepositories, KeyScope::Table, "r",
       false},
      {"add_repository", "Add repository", kRepositories, KeyScope::Table, "a",
       false},
      {"remove_repository", "Remove repository", kRepositories,
       KeyScope::Table, "D", false},
      {"filter", "Cycle filter", kRepositories, KeyScope::Table, "f", false},
      {"select", "Select pull request", kPullRequests, KeyScope::Table,
       "space", false},
      {"select_all", "Select all", kPullRequests, KeyScope::Table, "A", false},
      {"clear_selection", "Clear selection", kPullRequests, KeyScope::Table,
       "c", false},
      {"merge", "Merge", kPullRequests, KeyScope::Table, "m", false},
      {"rebase", "Update branch", kPullRequests, KeyScope::Table, "b", false},
      {"rerun", "Rerun failed jobs", kPullRequests, KeyScope::Table, "R",
       false},
      {"approve", "Approve", kPullRequests, KeyScope::Table, "p", false},
      {"open", "Open in browser", kPullRequests, KeyScope::Table, "o", false},
      {"open_ide", "Open in IDE", kPullRequests, KeyScope::Table, "i", false},
      {"logs", "Build logs", kPullRequests, KeyScope::Table, "enter,L", false},
      {"dequeue", "Remove from merge queue", kMergeBot, KeyScope::Table, "u",
       false},
      {"dismiss_status", "Dismiss message", kGeneral, KeyScope::Table, "esc",
       true},
      {"log_up", "Previous line", kLogViewer, KeyScope::LogPanel, "k,up", true},
      {"log_down", "Next line", kLogViewer, KeyScope::LogPanel, "j,down", true},
      {"page_up", "Page up", kLogViewer, KeyScope::LogPanel, "pgup,ctrl+u",
       true},
      {"page_down", "Page down", kLogViewer, KeyScope::LogPanel, "pgdn,ctrl+d",
       true},
      {"scroll_left", "Scroll left", kLogViewer, KeyScope::LogPanel, "h,left",
       true},
      {"scroll_right", "Scroll right", kLogViewer, KeyScope::LogPanel,
       "l,right", true},
      {"toggle_node", "Expand or collapse", kLogViewer, KeyScope::LogPanel,
       "enter,space", true},
      {"next_error", "Next error", kLogViewer, KeyScope::LogPanel, "n,e", true},
      {"prev_error", "Previous error", kLogViewer, KeyScope::LogPanel, "N,E",
       true},
      {"close_logs", "Close logs", kLogViewer, KeyScope::LogPanel, "esc,L",
       true},
  };
  return specs;
}

const CommandSpec *find_spec(const std::string &name) {
  const auto &specs = command_specs();
  auto it = std::find_if(specs.begin(), specs.end(), [&](const CommandSpec &s) {
    return name == s.name;
  });
  return it == specs.end() ? nullptr : &*it;
}

std::string trim_copy(const std::string &s) {
  auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char ch) {
    return static_cast<bool>(std::isspace(ch));
  });
  auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char ch) {
               return static_cast<bool>(std::isspace(ch));
             }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string to_lower_copy(const std::string &s) {
  std::string result;
  result.reserve(s.size());
  std::transform(s.begin(), s.end(), std::back_inserter(result),
                 [](unsigned char ch) {
                   return static_cast<char>(std::tolower(ch));
                 });
  return result;
}

/**
 * Split a binding list specification into individual tokens.
 *
 * @param spec Comma- or pipe-separated list of bindings.
 * @return Vector of trimmed binding strings.
 */
std::vector<std::string> split_binding_list(const std::string &spec) {
  std::vector<std::string> parts;
  std::string current;
  for (char ch : spec) {
    if (ch == ',' || ch == '|') {
      std::string trimmed = trim_copy(current);
      if (!trimmed.empty()) {
        parts.push_back(trimmed);
      }
      current.clear();
    } else {
      current.push_back(ch);
    }
  }
  std::string trimmed = trim_copy(current);
  if (!trimmed.empty()) {
    parts.push_back(trimmed);
  }
  return parts;
}

/**
 * Parse a textual binding specification into key codes and labels.
 *
 * @param spec Binding description string such as `"ctrl+c"`.
 * @return Parsed key codes paired with human-friendly labels.
 */
std::vector<ParsedBinding> parse_binding_spec(const std::string &spec) {
  std::vector<ParsedBinding> result;
  if (spec.empty()) {
    return result;
  }
  std::string lower = to_lower_copy(spec);
  if (lower == "\\n" || lower == "enter" || lower == "return" ||
      lower == "newline" || lower == "key_enter") {
    result.push_back({KEY_ENTER, "Enter"});
    result.push_back({static_cast<int>('\n'), "Enter"});
    return result;
  }
  if (lower == "space" || lower == "spacebar") {
    result.push_back({static_cast<int>(' '), "Space"});
    return result;
  }
  if (lower == "\\t" || lower == "tab") {
    result.push_back({static_cast<int>('\t'), "Tab"});
    return result;
  }
  if (lower == "shift+tab" || lower == "backtab") {
    result.push_back({KEY_BTAB, "Shift+Tab"});
    return result;
  }
  if (lower == "escape" || lower == "esc") {
    result.push_back({kEscape, "Escape"});
    return result;
  }
  if (lower == "backspace") {
    result.push_back({KEY_BACKSPACE, "Backspace"});
    result.push_back({127, "Backspace"});
    return result;
  }
  if (lower == "up" || lower == "arrow_up" || lower == "key_up") {
    result.push_back({KEY_UP, "Up Arrow"});
    return result;
  }
  if (lower == "down" || lower == "arrow_down" || lower == "key_down") {
    result.push_back({KEY_DOWN, "Down Arrow"});
    return result;
  }
  if (lower == "left" || lower == "arrow_left" || lower == "key_left") {
    result.push_back({KEY_LEFT, "Left Arrow"});
    return result;
  }
  if (lower == "right" || lower == "arrow_right" || lower == "key_right") {
    result.push_back({KEY_RIGHT, "Right Arrow"});
    return result;
  }
  if (lower == "pgup" || lower == "pageup" || lower == "page_up") {
    result.push_back({KEY_PPAGE, "Page Up"});
    return result;
  }
  if (lower == "pgdn" || lower == "pagedown" || lower == "page_down") {
    result.push_back({KEY_NPAGE, "Page Down"});
    return result;
  }
  if (lower.rfind("ctrl+", 0) == 0) {
    std::string suffix = trim_copy(spec.substr(5));
    if (suffix.size() == 1) {
      unsigned char ch = static_cast<unsigned char>(suffix[0]);
      unsigned char upper = static_cast<unsigned char>(std::toupper(ch));
      int key = static_cast<int>(upper & 0x1F);
      std::string label = "Ctrl+";
      label.push_back(static_cast<char>(upper));
      result.push_back({key, label});
    }
    return result;
  }
  if (lower.size() == 1) {
    unsigned char ch = static_cast<unsigned char>(spec[0]);
    std::string label(1, static_cast<char>(spec[0]));
    result.push_back({static_cast<int>(ch), label});
    return result;
  }
  return result;
}

std::vector<ParsedBinding> parse_binding_list(const std::string &list) {
  std::vector<ParsedBinding> out;
  for (const auto &spec : split_binding_list(list)) {
    auto parsed = parse_binding_spec(spec);
    if (parsed.empty()) {
      tui_log()->warn("Ignoring unrecognized hotkey binding '{}'", spec);
    }
    out.insert(out.end(), parsed.begin(), parsed.end());
  }
  return out;
}

} // namespace

std::optional<Action> action_for_command(const std::string &command) {
  using namespace actions;
  if (command == "quit")
    return Quit{};
  if (command == "help")
    return ToggleHelp{};
  if (command == "palette")
    return OpenCommandPalette{};
  if (command == "toggle_theme")
    return ToggleTheme{};
  if (command == "debug_console")
    return ToggleDebugConsole{};
  if (command == "timestamps")
    return ToggleTimestamps{};
  if (command == "merge_bot_start")
    return StartMergeBot{};
  if (command == "merge_bot_stop")
    return StopMergeBot{};
  if (command == "dismiss_failures")
    return DismissMergeBotFailures{};
  if (command == "up")
    return PrCursorUp{};
  if (command == "down")
    return PrCursorDown{};
  if (command == "next_repo")
    return NextRepository{};
  if (command == "prev_repo")
    return PreviousRepository{};
  if (command == "refresh")
    return RefreshCurrentRepository{};
  if (command == "remove_repository")
    return RemoveCurrentRepository{};
  if (command == "select")
    return TogglePrSelection{};
  if (command == "select_all")
    return SelectAllPrs{};
  if (command == "clear_selection")
    return ClearPrSelection{};
  if (command == "filter")
    return CycleFilter{};
  if (command == "merge")
    return RunPrOperation{PrOperation::Merge};
  if (command == "rebase")
    return RunPrOperation{PrOperation::Rebase};
  if (command == "rerun")
    return RunPrOperation{PrOperation::RerunFailedJobs};
  if (command == "approve")
    return RunPrOperation{PrOperation::Approve};
  if (command == "open")
    return RunPrOperation{PrOperation::OpenInBrowser};
  if (command == "open_ide")
    return RunPrOperation{PrOperation::OpenInIde};
  if (command == "logs")
    return OpenBuildLogs{};
  if (command == "dismiss_status")
    return DismissStatus{};
  if (command == "log_up")
    return LogCursorUp{};
  if (command == "log_down")
    return LogCursorDown{};
  if (command == "page_up")
    return LogPageUp{};
  if (command == "page_down")
    return LogPageDown{};
  if (command == "scroll_left")
    return LogScrollLeft{};
  if (command == "scroll_right")
    return LogScrollRight{};
  if (command == "toggle_node")
    return ToggleLogNode{};
  if (command == "next_error")
    return NextError{};
  if (command == "prev_error")
    return PreviousError{};
  if (command == "close_logs")
    return CloseLogPanel{};
  return std::nullopt;
}

std::optional<Action> palette_action_for_key(int key) {
  using namespace actions;
  switch (key) {
  case kEscape:
    return CloseCommandPalette{};
  case KEY_ENTER:
  case '\n':
  case '\r':
    return CommandPaletteExecute{};
  case KEY_DOWN:
  case 0x0E: // Ctrl+N
    return CommandPaletteNext{};
  case KEY_UP:
  case 0x10: // Ctrl+P
    return CommandPalettePrevious{};
  case KEY_BACKSPACE:
  case 127:
  case 8:
    return CommandPaletteBackspace{};
  default:
    break;
  }
  if (key >= 0x20 && key < 0x7F) {
    return CommandPaletteInput{std::string(1, static_cast<char>(key))};
  }
  return std::nullopt;
}

KeyMap::KeyMap() {
  for (const auto &spec : command_specs()) {
    std::vector<Binding> bindings;
    for (auto &parsed : parse_binding_list(spec.defaults)) {
      bindings.push_back({parsed.key, std::move(parsed.label)});
    }
    bind(spec.name, std::move(bindings));
  }
}

void KeyMap::bind(const std::string &command, std::vector<Binding> bindings) {
  const CommandSpec *spec = find_spec(command);
  if (spec == nullptr) {
    return;
  }
  auto &keys = spec->scope == KeyScope::Global  ? global_keys_
               : spec->scope == KeyScope::Table ? table_keys_
                                                : log_keys_;
  auto &current = bindings_[command];
  for (const auto &old : current) {
    auto it = keys.find(old.key);
    if (it != keys.end() && it->second == command) {
      keys.erase(it);
    }
  }
  current.clear();
  std::unordered_set<int> seen;
  for (auto &binding : bindings) {
    if (!seen.insert(binding.key).second) {
      continue;
    }
    auto existing = keys.find(binding.key);
    if (existing != keys.end() && existing->second != command) {
      tui_log()->warn("Hotkey '{}' reassigned from '{}' to '{}'",
                      binding.label, existing->second, command);
      auto &other = bindings_[existing->second];
      other.erase(std::remove_if(other.begin(), other.end(),
                                 [&](const Binding &b) {
                                   return b.key == binding.key;
                                 }),
                  other.end());
    }
    keys[binding.key] = command;
    current.push_back(std::move(binding));
  }
}

/**
 * Apply user-provided hotkey configuration overrides.
 *
 * @param bindings Mapping from command names to binding lists.
 */
void KeyMap::configure(
    const std::unordered_map<std::string, std::string> &bindings) {
  for (const auto &entry : bindings) {
    const std::string command = to_lower_copy(trim_copy(entry.first));
    const CommandSpec *spec = find_spec(command);
    if (spec == nullptr) {
      tui_log()->warn("Unknown hotkey action '{}' in configuration",
                      entry.first);
      continue;
    }
    const std::string value = to_lower_copy(trim_copy(entry.second));
    if (value == "default") {
      continue;
    }
    if (value.empty() || value == "none" || value == "disabled") {
      tui_log()->info("Disabling hotkey bindings for action '{}'", command);
      bind(command, {});
      continue;
    }
    std::vector<Binding> parsed_bindings;
    for (auto &parsed : parse_binding_list(entry.second)) {
      parsed_bindings.push_back({parsed.key, std::move(parsed.label)});
    }
    if (parsed_bindings.empty()) {
      tui_log()->warn(
          "No valid hotkey bindings provided for action '{}'; keeping existing "
          "bindings",
          command);
      continue;
    }
    bind(command, std::move(parsed_bindings));
  }
}

std::optional<std::string> KeyMap::command_for_key(int key,
                                                   const KeyContext &ctx) const {
  const auto &scoped = ctx.log_panel_open ? log_keys_ : table_keys_;
  std::optional<std::string> command;
  if (auto it = scoped.find(key); it != scoped.end()) {
    command = it->second;
  } else if (auto git = global_keys_.find(key); git != global_keys_.end()) {
    command = git->second;
  }
  if (!command) {
    return std::nullopt;
  }
  if (!hotkeys_enabled_) {
    const CommandSpec *spec = find_spec(*command);
    if (spec == nullptr || !spec->navigation) {
      tui_log()->debug("Hotkeys disabled; ignoring action {}", *command);
      return std::nullopt;
    }
  }
  return command;
}

std::optional<Action> KeyMap::action_for_key(int key,
                                             const KeyContext &ctx) const {
  if (ctx.palette_open) {
    return palette_action_for_key(key);
  }
  auto command = command_for_key(key, ctx);
  if (ctx.help_open) {
    if (command && *command == "quit") {
      return actions::Quit{};
    }
    return actions::ToggleHelp{};
  }
  if (!command) {
    return std::nullopt;
  }
  return action_for_command(*command);
}

std::vector<HelpEntry> KeyMap::help_entries(const KeyContext &ctx) const {
  std::vector<HelpEntry> out;
  const KeyScope scope = ctx.log_panel_open ? KeyScope::LogPanel
                                            : KeyScope::Table;
  for (const auto &spec : command_specs()) {
    if (spec.scope != KeyScope::Global && spec.scope != scope) {
      continue;
    }
    if (!hotkeys_enabled_ && !spec.navigation) {
      continue;
    }
    auto it = bindings_.find(spec.name);
    if (it == bindings_.end() || it->second.empty()) {
      continue;
    }
    HelpEntry entry;
    entry.description = spec.description;
    entry.keys = binding_labels(spec.name);
    out.push_back(std::move(entry));
  }
  return out;
}

std::string KeyMap::binding_labels(const std::string &command) const {
  std::string out;
  auto it = bindings_.find(command);
  if (it == bindings_.end()) {
    return out;
  }
  std::unordered_set<std::string> labels;
  for (const auto &binding : it->second) {
    if (!labels.insert(binding.label).second) {
      continue;
    }
    if (!out.empty()) {
      out += ", ";
    }
    out += binding.label;
  }
  return out;
}

std::vector<PaletteCommand> KeyMap::palette_commands() const {
  std::vector<PaletteCommand> out;
  for (const auto &spec : command_specs()) {
    const std::string name = spec.name;
    if (name == "palette" || !action_for_command(name)) {
      continue;
    }
    if (!hotkeys_enabled_ && !spec.navigation) {
      continue;
    }
    PaletteCommand command;
    command.name = name;
    command.title = spec.description;
    command.category = spec.category;
    command.shortcut = binding_labels(name);
    command.scope = spec.scope;
    command.needs_pull_requests = command.category == kPullRequests;
    out.push_back(std::move(command));
  }
  return out;
}

std::vector<int> KeyMap::keys_for(const std::string &command) const {
  std::vector<int> out;
  auto it = bindings_.find(command);
  if (it != bindings_.end()) {
    for (const auto &binding : it->second) {
      out.push_back(binding.key);
    }
  }
  return out;
}

} // namespace prdeck
