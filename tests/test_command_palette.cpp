#include "command_palette.hpp"
#include "reducer.hpp"
#include <catch2/catch_test_macros.hpp>
#include <curses.h>

#include <algorithm>
#include <string>
#include <variant>
#include <vector>

using namespace prdeck;

namespace {

const Repository kWidgets{"acme", "widgets", "main"};

PullRequest make_pr(int number, const std::string &title) {
  PullRequest pr;
  pr.number = number;
  pr.title = title;
  pr.author = "octocat";
  pr.mergeable = MergeableStatus::Ready;
  return pr;
}

AppState apply(AppState state, const std::vector<Action> &actions) {
  for (const auto &a : actions) {
    state = reduce(state, a).state;
  }
  return state;
}

/// One repository with two open pull requests and the default palette.
AppState palette_state() {
  AppSettings settings;
  settings.palette_commands = KeyMap().palette_commands();
  SessionState session;
  session.repositories = {kWidgets};
  return apply(make_initial_state(settings),
               {actions::Bootstrap{session},
                actions::PullRequestsLoaded{
                    kWidgets.key(),
                    {make_pr(1, "feat: add search"),
                     make_pr(2, "fix: crash")}}});
}

std::vector<std::string> names_of(const std::vector<PaletteCommand> &commands,
                                  const std::vector<std::size_t> &indices) {
  std::vector<std::string> out;
  for (auto i : indices) {
    out.push_back(commands[i].name);
  }
  return out;
}

/// Names of the commands matching @p query in @p ctx, best first.
std::vector<std::string> search(const std::vector<PaletteCommand> &commands,
                                const std::string &query,
                                const PaletteContext &ctx) {
  return names_of(commands, filter_palette_commands(commands, query, ctx));
}

bool contains(const std::vector<std::string> &names, const std::string &name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace

TEST_CASE("fuzzy scores favour tight matches") {
  CHECK(fuzzy_score("Merge", "mrg").has_value());
  CHECK(fuzzy_score("Merge", "MERGE").has_value());
  CHECK_FALSE(fuzzy_score("Merge", "xyz").has_value());
  CHECK_FALSE(fuzzy_score("Merge", "egrem").has_value());
  CHECK(fuzzy_score("Merge", "") == 0);
  CHECK(fuzzy_score("Merge", "   ") == 0);
  CHECK(fuzzy_score("Next error", "next error").has_value());

  CHECK(*fuzzy_score("abc", "abc") > *fuzzy_score("a_b_c", "abc"));
  CHECK(*fuzzy_score("Merge", "mer") > *fuzzy_score("Start merge bot", "mer"));
}

TEST_CASE("palette commands come from the key map") {
  KeyMap map;
  auto commands = map.palette_commands();
  REQUIRE_FALSE(commands.empty());
  CHECK(commands[0].name == "quit");
  CHECK(commands[0].shortcut == "q");

  std::vector<std::string> names;
  for (const auto &c : commands) {
    names.push_back(c.name);
    if (c.name == "logs") {
      CHECK(c.shortcut == "Enter, L");
      CHECK(c.category == "Pull Requests");
      CHECK(c.needs_pull_requests);
    }
  }
  CHECK(contains(names, "next_error"));
  CHECK_FALSE(contains(names, "add_repository"));
  CHECK_FALSE(contains(names, "dequeue"));
  CHECK_FALSE(contains(names, "palette"));

  map.configure({{"merge", "none"}});
  for (const auto &c : map.palette_commands()) {
    if (c.name == "merge") {
      CHECK(c.shortcut.empty());
    }
  }

  map.set_hotkeys_enabled(false);
  std::vector<std::string> limited;
  for (const auto &c : map.palette_commands()) {
    limited.push_back(c.name);
  }
  CHECK(contains(limited, "down"));
  CHECK_FALSE(contains(limited, "merge"));
}

TEST_CASE("availability follows the focused view") {
  const auto commands = KeyMap().palette_commands();

  auto bare = search(commands, "", {false, false});
  REQUIRE_FALSE(bare.empty());
  CHECK(bare[0] == "quit");
  CHECK(contains(bare, "refresh"));
  CHECK_FALSE(contains(bare, "merge"));
  CHECK_FALSE(contains(bare, "log_up"));

  auto table = search(commands, "", {false, true});
  CHECK(contains(table, "merge"));
  CHECK(contains(table, "logs"));
  CHECK_FALSE(contains(table, "next_error"));

  auto logs = search(commands, "", {true, true});
  CHECK(contains(logs, "next_error"));
  CHECK(contains(logs, "toggle_theme"));
  CHECK_FALSE(contains(logs, "merge"));
}

TEST_CASE("queries rank the closest command first") {
  const auto commands = KeyMap().palette_commands();

  auto merge = search(commands, "merge", {false, true});
  REQUIRE_FALSE(merge.empty());
  CHECK(merge[0] == "merge");
  CHECK(contains(merge, "merge_bot_start"));

  auto error = search(commands, "nxterr", {true, true});
  REQUIRE(error.size() == 1);
  CHECK(error[0] == "next_error");

  CHECK(filter_palette_commands(commands, "zzz", {false, true}).empty());
}

TEST_CASE("palette keys edit the query while it is open") {
  KeyMap map;
  const KeyContext table{};
  const KeyContext open{false, false, true};

  auto opener = map.action_for_key(':', table);
  REQUIRE(opener);
  CHECK(std::holds_alternative<actions::OpenCommandPalette>(*opener));
  auto ctrl_p = map.action_for_key(0x10, table);
  REQUIRE(ctrl_p);
  CHECK(std::holds_alternative<actions::OpenCommandPalette>(*ctrl_p));

  auto typed = map.action_for_key('m', open);
  REQUIRE(typed);
  auto *input = std::get_if<actions::CommandPaletteInput>(&*typed);
  REQUIRE(input);
  CHECK(input->text == "m");

  auto is = [&](int key, auto tag) {
    auto action = map.action_for_key(key, open);
    return action && std::holds_alternative<decltype(tag)>(*action);
  };
  CHECK(is(27, actions::CloseCommandPalette{}));
  CHECK(is('\n', actions::CommandPaletteExecute{}));
  CHECK(is(KEY_ENTER, actions::CommandPaletteExecute{}));
  CHECK(is(KEY_DOWN, actions::CommandPaletteNext{}));
  CHECK(is(KEY_UP, actions::CommandPalettePrevious{}));
  CHECK(is(127, actions::CommandPaletteBackspace{}));
  CHECK(is('q', actions::CommandPaletteInput{}));
  CHECK_FALSE(map.action_for_key(KEY_F(1), open));
}

TEST_CASE("opening the palette builds its view and leaves other slices alone") {
  auto state = palette_state();
  auto r = reduce(state, actions::OpenCommandPalette{});
  const auto &palette = r.state.palette;
  CHECK(palette.open);
  CHECK(palette.selected == 0);
  CHECK(r.effects.empty());
  CHECK(r.state.repositories.view == state.repositories.view);

  REQUIRE(palette.view);
  const auto &vm = *palette.view;
  CHECK(vm.input_text == "> ");
  CHECK(vm.total_commands == palette.matches.size());
  REQUIRE(vm.rows.size() == std::min<std::size_t>(10, palette.matches.size()));
  CHECK(vm.rows[0].indicator == "> ");
  CHECK(vm.rows[0].is_selected);
  CHECK(vm.rows[0].title == "Quit");
  CHECK(vm.rows[0].shortcut == "q            ");
  CHECK(vm.rows[1].indicator == "  ");
  CHECK(vm.selected_command == "quit");
  for (const auto &row : vm.rows) {
    CHECK(row.category.size() == vm.rows[0].category.size());
    CHECK(row.category.back() == ']');
  }

  auto again = reduce(r.state, actions::OpenCommandPalette{});
  CHECK(again.state.palette.view == palette.view);
}

TEST_CASE("typing narrows the palette and backspace widens it") {
  auto state = apply(palette_state(), {actions::OpenCommandPalette{}});
  const std::size_t all = state.palette.matches.size();

  state = apply(state, {actions::CommandPaletteInput{"mer"},
                        actions::CommandPaletteInput{"ge"}});
  CHECK(state.palette.query == "merge");
  REQUIRE(state.palette.view);
  REQUIRE_FALSE(state.palette.view->rows.empty());
  CHECK(state.palette.view->rows[0].title == "Merge");
  CHECK(state.palette.view->input_text == "> merge");
  CHECK(state.palette.matches.size() < all);

  for (int i = 0; i < 5; ++i) {
    state = reduce(state, actions::CommandPaletteBackspace{}).state;
  }
  CHECK(state.palette.query.empty());
  CHECK(state.palette.matches.size() == all);
  auto unchanged = reduce(state, actions::CommandPaletteBackspace{});
  CHECK(unchanged.state.palette.view == state.palette.view);

  state = reduce(state, actions::CommandPaletteInput{"zzz"}).state;
  REQUIRE(state.palette.view);
  CHECK(state.palette.view->rows.empty());
  CHECK(state.palette.view->total_commands == 0);
  CHECK(state.palette.view->empty_message == "No matching commands");
}

TEST_CASE("the palette window follows the selection") {
  CHECK(palette_window_start(0, 26, 10) == 0);
  CHECK(palette_window_start(5, 26, 10) == 0);
  CHECK(palette_window_start(6, 26, 10) == 1);
  CHECK(palette_window_start(15, 26, 10) == 10);
  CHECK(palette_window_start(21, 26, 10) == 16);
  CHECK(palette_window_start(25, 26, 10) == 16);
  CHECK(palette_window_start(3, 5, 10) == 0);

  auto state = apply(palette_state(), {actions::OpenCommandPalette{}});
  const std::size_t total = state.palette.matches.size();
  REQUIRE(total > 16);

  auto first = reduce(state, actions::CommandPalettePrevious{});
  CHECK(first.state.palette.view == state.palette.view);

  for (int i = 0; i < 15; ++i) {
    state = reduce(state, actions::CommandPaletteNext{}).state;
  }
  CHECK(state.palette.selected == 15);
  REQUIRE(state.palette.view);
  const auto &vm = *state.palette.view;
  CHECK(vm.scroll_offset == palette_window_start(15, total, 10));
  REQUIRE(vm.rows.size() == 10);
  CHECK(vm.rows[15 - vm.scroll_offset].is_selected);
  CHECK(vm.selected_command ==
        state.settings.palette_commands[state.palette.matches[15]].name);

  for (std::size_t i = 0; i < total + 5; ++i) {
    state = reduce(state, actions::CommandPaletteNext{}).state;
  }
  CHECK(state.palette.selected == total - 1);
  CHECK(state.palette.view->scroll_offset == total - 10);
  CHECK(state.palette.view->rows.back().is_selected);
}

TEST_CASE("executing runs the selected command and closes the palette") {
  auto state = apply(palette_state(), {actions::OpenCommandPalette{},
                                       actions::CommandPaletteInput{"merge"}});
  auto r = reduce(state, actions::CommandPaletteExecute{});
  CHECK_FALSE(r.state.palette.open);
  CHECK_FALSE(r.state.palette.view);
  CHECK(r.state.palette.query.empty());

  std::vector<effects::RunPrOperation> ops;
  for (const auto &e : r.effects) {
    if (auto *op = std::get_if<effects::RunPrOperation>(&e)) {
      ops.push_back(*op);
    }
  }
  REQUIRE(ops.size() == 1);
  CHECK(ops[0].op == PrOperation::Merge);
  CHECK(ops[0].number == 1);
  CHECK(r.state.repositories.repos[0].prs[0].mergeable ==
        MergeableStatus::Merging);

  auto themed = apply(palette_state(), {actions::OpenCommandPalette{},
                                        actions::CommandPaletteInput{"theme"},
                                        actions::CommandPaletteExecute{}});
  CHECK(themed.ui.theme == ThemeKind::Light);
  CHECK_FALSE(themed.palette.open);
}

TEST_CASE("a command that no longer applies is refused") {
  auto state = apply(palette_state(),
                     {actions::OpenCommandPalette{},
                      actions::CommandPaletteInput{"merge"},
                      actions::PullRequestsLoaded{kWidgets.key(), {}}});
  REQUIRE(state.palette.open);

  auto r = reduce(state, actions::CommandPaletteExecute{});
  CHECK_FALSE(r.state.palette.open);
  for (const auto &e : r.effects) {
    CHECK_FALSE(std::holds_alternative<effects::RunPrOperation>(e));
  }
  REQUIRE(r.state.ui.status);
  CHECK(r.state.ui.status->level == StatusLevel::Warning);
  CHECK(r.state.ui.status->text == "Merge is not available here");
}

TEST_CASE("closing the palette discards the query") {
  auto state = apply(palette_state(), {actions::OpenCommandPalette{},
                                       actions::CommandPaletteInput{"x"},
                                       actions::CloseCommandPalette{}});
  CHECK_FALSE(state.palette.open);
  CHECK(state.palette.query.empty());
  CHECK(state.palette.matches.empty());
  CHECK_FALSE(state.palette.view);

  auto nothing = reduce(state, actions::CommandPaletteExecute{});
  CHECK(nothing.effects.empty());
  CHECK_FALSE(nothing.state.ui.status);

  auto reopened = reduce(state, actions::OpenCommandPalette{});
  CHECK(reopened.state.palette.query.empty());
}

TEST_CASE("the palette offers log viewer commands while logs are open") {
  auto state = palette_state();
  state.log_panel.open = true;
  state = reduce(state, actions::OpenCommandPalette{}).state;
  auto names = names_of(state.settings.palette_commands, state.palette.matches);
  CHECK(contains(names, "next_error"));
  CHECK(contains(names, "close_logs"));
  CHECK_FALSE(contains(names, "merge"));
  CHECK_FALSE(contains(names, "down"));
}
