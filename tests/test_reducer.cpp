#include "reducer.hpp"
#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <variant>
#include <vector>

using namespace prdeck;

namespace {

const Repository kWidgets{"acme", "widgets", "main"};
const Repository kGadgets{"acme", "gadgets", "develop"};

PullRequest make_pr(int number, const std::string &title) {
  PullRequest pr;
  pr.number = number;
  pr.title = title;
  pr.author = "octocat";
  pr.mergeable = MergeableStatus::Ready;
  return pr;
}

template <typename T> std::vector<T> effects_of(const Reduction &r) {
  std::vector<T> out;
  for (const auto &e : r.effects) {
    if (auto *p = std::get_if<T>(&e)) {
      out.push_back(*p);
    }
  }
  return out;
}

AppState apply(AppState state, const std::vector<Action> &actions) {
  for (const auto &a : actions) {
    state = reduce(state, a).state;
  }
  return state;
}

/// One repository with four open pull requests.
AppState loaded_state(AppSettings settings = {}) {
  SessionState session;
  session.repositories = {kWidgets};
  return apply(make_initial_state(settings),
               {actions::Bootstrap{session},
                actions::PullRequestsLoaded{
                    kWidgets.key(),
                    {make_pr(1, "feat: add search"), make_pr(2, "fix: crash"),
                     make_pr(3, "chore: bump deps"),
                     make_pr(4, "feat(ui): dark mode")}}});
}

} // namespace

TEST_CASE("bootstrap restores the session and fetches every repository") {
  SessionState session;
  session.repositories = {kWidgets, kGadgets};
  session.selected_tab = 1;
  session.theme = ThemeKind::Light;
  session.filter = PrFilter::Fix;
  session.selected_prs[kGadgets.key()] = {7};

  auto r = reduce(make_initial_state({}), actions::Bootstrap{session});
  CHECK(r.state.ui.bootstrapped);
  CHECK(r.state.ui.theme == ThemeKind::Light);
  REQUIRE(r.state.repositories.repos.size() == 2);
  CHECK(r.state.repositories.current == 1);
  CHECK(r.state.repositories.filter == PrFilter::Fix);
  CHECK(r.state.repositories.repos[1].selected.count(7) == 1);
  CHECK(r.state.repositories.repos[0].load == LoadState::Loading);

  auto fetches = effects_of<effects::FetchPullRequests>(r);
  REQUIRE(fetches.size() == 2);
  CHECK(fetches[0].repo == kWidgets);
  CHECK(fetches[1].repo == kGadgets);
  REQUIRE(r.state.repositories.view);
  CHECK(r.state.repositories.view->tabs.size() == 2);
  CHECK(r.state.repositories.view->tabs[1].label == "acme/gadgets@develop");
}

TEST_CASE("bootstrap clamps an out of range tab") {
  SessionState session;
  session.repositories = {kWidgets};
  session.selected_tab = 5;
  auto state = reduce(make_initial_state({}), actions::Bootstrap{session}).state;
  CHECK(state.repositories.current == 0);
}

TEST_CASE("ui chrome actions") {
  auto state = make_initial_state({});
  state = reduce(state, actions::ToggleHelp{}).state;
  CHECK(state.ui.show_help);
  state = reduce(state, actions::ToggleDebugConsole{}).state;
  CHECK(state.ui.show_debug_console);
  state = reduce(state, actions::ShowStatus{StatusLevel::Error, "boom"}).state;
  REQUIRE(state.ui.status);
  CHECK(state.ui.status->text == "boom");
  state = reduce(state, actions::DismissStatus{}).state;
  CHECK_FALSE(state.ui.status);
  state = reduce(state, actions::Quit{}).state;
  CHECK(state.ui.quit);
}

TEST_CASE("unrelated slices keep their cached view models") {
  auto state = loaded_state();
  const auto table = state.repositories.view;
  REQUIRE(table);
  auto next = reduce(state, actions::ToggleHelp{}).state;
  CHECK(next.repositories.view == table);
  next = reduce(next, actions::ClockTick{Clock::now()}).state;
  CHECK(next.repositories.view == table);
  CHECK_FALSE(next.merge_bot.view);
}

TEST_CASE("toggling the theme rebuilds views and saves the session") {
  auto state = loaded_state();
  const auto table = state.repositories.view;
  auto r = reduce(state, actions::ToggleTheme{});
  CHECK(r.state.ui.theme == ThemeKind::Light);
  CHECK(r.state.repositories.view != table);
  auto saves = effects_of<effects::SaveSession>(r);
  REQUIRE(saves.size() == 1);
  CHECK(saves[0].session.theme == ThemeKind::Light);
  CHECK(saves[0].session.repositories == std::vector<Repository>{kWidgets});
}

TEST_CASE("cursor movement is clamped to the visible rows") {
  auto state = loaded_state();
  state = reduce(state, actions::PrCursorUp{}).state;
  CHECK(state.repositories.repos[0].cursor == 0);
  state = apply(state, {actions::PrCursorDown{}, actions::PrCursorDown{},
                        actions::PrCursorDown{}, actions::PrCursorDown{},
                        actions::PrCursorDown{}});
  CHECK(state.repositories.repos[0].cursor == 3);
  REQUIRE(state.repositories.view);
  CHECK(state.repositories.view->rows[3].is_cursor);
}

TEST_CASE("the cursor scrolls the table") {
  AppSettings settings;
  settings.viewport_height = 2;
  auto state = loaded_state(settings);
  state = apply(state, {actions::PrCursorDown{}, actions::PrCursorDown{}});
  CHECK(state.repositories.repos[0].scroll == 1);
  REQUIRE(state.repositories.view);
  CHECK(state.repositories.view->rows.size() == 2);
  CHECK(state.repositories.view->rows.front().number == 2);
}

TEST_CASE("filter cycles through commit prefixes") {
  auto state = loaded_state();
  auto r = reduce(state, actions::CycleFilter{});
  CHECK(r.state.repositories.filter == PrFilter::Feat);
  REQUIRE(r.state.repositories.view);
  REQUIRE(r.state.repositories.view->rows.size() == 2);
  CHECK(r.state.repositories.view->rows[0].number == 1);
  CHECK(r.state.repositories.view->rows[1].number == 4);
  CHECK(effects_of<effects::SaveSession>(r).size() == 1);

  state = apply(r.state, {actions::CycleFilter{}, actions::CycleFilter{},
                          actions::CycleFilter{}});
  CHECK(state.repositories.filter == PrFilter::None);
  CHECK(state.repositories.view->rows.size() == 4);
}

TEST_CASE("selection follows the cursor and survives reloads") {
  auto state = loaded_state();
  state = apply(state, {actions::PrCursorDown{}, actions::TogglePrSelection{}});
  CHECK(state.repositories.repos[0].selected == std::set<int>{2});
  state = reduce(state, actions::SelectAllPrs{}).state;
  CHECK(state.repositories.repos[0].selected.size() == 4);

  auto r = reduce(state, actions::PullRequestsLoaded{
                             kWidgets.key(), {make_pr(2, "fix: crash")}});
  CHECK(r.state.repositories.repos[0].selected == std::set<int>{2});
  CHECK(r.state.repositories.repos[0].cursor == 0);
  CHECK(effects_of<effects::SaveSession>(r).size() == 1);

  state = reduce(r.state, actions::ClearPrSelection{}).state;
  CHECK(state.repositories.repos[0].selected.empty());
}

TEST_CASE("operations target the selection") {
  AppSettings settings;
  settings.approval_message = "LGTM";
  auto state = loaded_state(settings);
  state = apply(state, {actions::TogglePrSelection{}, actions::PrCursorDown{},
                        actions::PrCursorDown{}, actions::TogglePrSelection{}});

  auto r = reduce(state, actions::RunPrOperation{PrOperation::Approve});
  auto ops = effects_of<effects::RunPrOperation>(r);
  REQUIRE(ops.size() == 2);
  CHECK(ops[0].number == 1);
  CHECK(ops[1].number == 3);
  CHECK(ops[0].argument == "LGTM");
  CHECK(ops[0].repo == kWidgets);
}

TEST_CASE("operations fall back to the cursor row") {
  auto state = loaded_state();
  state = reduce(state, actions::PrCursorDown{}).state;

  auto r = reduce(state, actions::RunPrOperation{PrOperation::Merge});
  auto ops = effects_of<effects::RunPrOperation>(r);
  REQUIRE(ops.size() == 1);
  CHECK(ops[0].number == 2);
  CHECK(ops[0].op == PrOperation::Merge);
  CHECK(r.state.repositories.repos[0].prs[1].mergeable ==
        MergeableStatus::Merging);
  CHECK(r.state.repositories.view->rows[1].status_label == "merging");
}

TEST_CASE("browser and IDE operations build their arguments") {
  AppSettings settings;
  settings.web_base = "https://github.example.com/";
  settings.ide_command = "code --goto {org}/{repo}:{number} {branch}";
  auto state = loaded_state(settings);

  auto browser = effects_of<effects::RunPrOperation>(
      reduce(state, actions::RunPrOperation{PrOperation::OpenInBrowser}));
  REQUIRE(browser.size() == 1);
  CHECK(browser[0].argument == "https://github.example.com/acme/widgets/pull/1");

  auto ide = effects_of<effects::RunPrOperation>(
      reduce(state, actions::RunPrOperation{PrOperation::OpenInIde}));
  REQUIRE(ide.size() == 1);
  CHECK(ide[0].argument == "code --goto 'acme'/'widgets':1 'main'");
}

TEST_CASE("IDE commands quote repository names") {
  AppSettings settings;
  settings.ide_command = "code ~/src/{repo} --branch {branch}";
  SessionState session;
  session.repositories = {Repository{"acme", "widgets", "main; rm -rf ~"}};
  auto state = apply(make_initial_state(settings),
                     {actions::Bootstrap{session},
                      actions::PullRequestsLoaded{session.repositories[0].key(),
                                                  {make_pr(1, "feat: x")}}});
  auto ide = effects_of<effects::RunPrOperation>(
      reduce(state, actions::RunPrOperation{PrOperation::OpenInIde}));
  REQUIRE(ide.size() == 1);
  CHECK(ide[0].argument == "code ~/src/'widgets' --branch 'main; rm -rf ~'");
}

TEST_CASE("opening an IDE without a command only warns") {
  auto state = loaded_state();
  auto r = reduce(state, actions::RunPrOperation{PrOperation::OpenInIde});
  CHECK(effects_of<effects::RunPrOperation>(r).empty());
  REQUIRE(r.state.ui.status);
  CHECK(r.state.ui.status->level == StatusLevel::Warning);
}

TEST_CASE("operations without a target warn") {
  auto r = reduce(make_initial_state({}),
                  actions::RunPrOperation{PrOperation::Merge});
  CHECK(r.effects.empty());
  REQUIRE(r.state.ui.status);
  CHECK(r.state.ui.status->text == "No pull request to merge");
}

TEST_CASE("operation results refresh the repository") {
  auto state = loaded_state();
  auto ok = reduce(state, actions::PrOperationSucceeded{kWidgets.key(), 1,
                                                        PrOperation::Merge});
  CHECK(effects_of<effects::FetchPullRequests>(ok).size() == 1);
  REQUIRE(ok.state.ui.status);
  CHECK(ok.state.ui.status->level == StatusLevel::Info);

  auto approve = reduce(state, actions::PrOperationSucceeded{
                                   kWidgets.key(), 1, PrOperation::Approve});
  CHECK(effects_of<effects::FetchPullRequests>(approve).empty());

  auto failed = reduce(
      state, actions::PrOperationFailed{kWidgets.key(), 1, PrOperation::Rebase,
                                        {FailureKind::Conflict, "dirty"}});
  CHECK(effects_of<effects::FetchPullRequests>(failed).size() == 1);
  REQUIRE(failed.state.ui.status);
  CHECK(failed.state.ui.status->level == StatusLevel::Error);
  CHECK(failed.state.ui.status->text == "rebase #1 failed: conflict: dirty");
}

TEST_CASE("load failures mark the repository and report transient errors as "
          "warnings") {
  auto state = loaded_state();
  auto r = reduce(state, actions::PullRequestsLoadFailed{
                             kWidgets.key(), {FailureKind::RateLimited, ""}});
  CHECK(r.state.repositories.repos[0].load == LoadState::Failed);
  REQUIRE(r.state.ui.status);
  CHECK(r.state.ui.status->level == StatusLevel::Warning);
  CHECK(r.state.repositories.view->tabs[0].failed);
}

TEST_CASE("repositories can be added, switched and removed") {
  auto state = loaded_state();
  auto r = reduce(state, actions::AddRepository{kGadgets});
  CHECK(r.state.repositories.repos.size() == 2);
  CHECK(r.state.repositories.current == 1);
  CHECK(effects_of<effects::FetchPullRequests>(r).size() == 1);
  CHECK(effects_of<effects::SaveSession>(r).size() == 1);

  auto dup = reduce(r.state, actions::AddRepository{kWidgets});
  CHECK(dup.state.repositories.repos.size() == 2);
  CHECK(dup.state.repositories.current == 0);
  CHECK(effects_of<effects::FetchPullRequests>(dup).empty());

  state = reduce(dup.state, actions::PreviousRepository{}).state;
  CHECK(state.repositories.current == 1);
  state = reduce(state, actions::NextRepository{}).state;
  CHECK(state.repositories.current == 0);
  state = reduce(state, actions::SelectRepository{1}).state;
  CHECK(state.repositories.current == 1);

  state = reduce(state, actions::RemoveCurrentRepository{}).state;
  REQUIRE(state.repositories.repos.size() == 1);
  CHECK(state.repositories.current == 0);
  CHECK(state.repositories.repos[0].repo == kWidgets);

  state = reduce(state, actions::RemoveCurrentRepository{}).state;
  CHECK(state.repositories.repos.empty());
  CHECK_FALSE(state.repositories.view);
}

TEST_CASE("refresh only touches the requested repository") {
  auto state = reduce(loaded_state(), actions::AddRepository{kGadgets}).state;
  auto r = reduce(state, actions::RefreshRepository{kWidgets.key()});
  auto fetches = effects_of<effects::FetchPullRequests>(r);
  REQUIRE(fetches.size() == 1);
  CHECK(fetches[0].repo == kWidgets);
  CHECK(reduce(state, actions::RefreshRepository{"nope/nope@main"}).effects.empty());
}

TEST_CASE("resizing clamps scroll offsets") {
  auto state = loaded_state();
  state = apply(state, {actions::PrCursorDown{}, actions::PrCursorDown{},
                        actions::PrCursorDown{}});
  state = reduce(state, actions::ResizeViewport{1, 5}).state;
  CHECK(state.repositories.viewport_height == 1);
  CHECK(state.repositories.repos[0].scroll == 3);
  CHECK(state.log_panel.viewport_height == 5);
  REQUIRE(state.repositories.view);
  CHECK(state.repositories.view->rows.size() == 1);
}

namespace {

template <typename Row, typename Field>
std::vector<Field> column(const std::vector<Row> &rows, Field Row::*field) {
  std::vector<Field> out;
  for (const auto &row : rows) {
    out.push_back(row.*field);
  }
  return out;
}

template <typename T>
void check_same_view(const std::shared_ptr<const T> &a,
                     const std::shared_ptr<const T> &b) {
  CHECK(static_cast<bool>(a) == static_cast<bool>(b));
}

void check_same_reduction(const Reduction &a, const Reduction &b) {
  CHECK(describe(a.effects) == describe(b.effects));
  for (std::size_t i = 0; i < a.effects.size() && i < b.effects.size(); ++i) {
    CHECK(a.effects[i].index() == b.effects[i].index());
    auto *ta = std::get_if<effects::StartTimer>(&a.effects[i]);
    auto *tb = std::get_if<effects::StartTimer>(&b.effects[i]);
    if (ta && tb) {
      CHECK(ta->follow_up.index() == tb->follow_up.index());
    }
  }

  const auto &ra = a.state.repositories;
  const auto &rb = b.state.repositories;
  CHECK(capture_session(a.state) == capture_session(b.state));
  REQUIRE(ra.repos.size() == rb.repos.size());
  for (std::size_t i = 0; i < ra.repos.size(); ++i) {
    CHECK(ra.repos[i].prs == rb.repos[i].prs);
    CHECK(ra.repos[i].cursor == rb.repos[i].cursor);
    CHECK(ra.repos[i].load == rb.repos[i].load);
  }
  check_same_view(ra.view, rb.view);
  if (ra.view && rb.view) {
    CHECK(column(ra.view->rows, &PrRowViewModel::text) ==
          column(rb.view->rows, &PrRowViewModel::text));
    CHECK(column(ra.view->tabs, &RepositoryTabViewModel::label) ==
          column(rb.view->tabs, &RepositoryTabViewModel::label));
  }

  const auto &la = a.state.log_panel;
  const auto &lb = b.state.log_panel;
  CHECK(la.open == lb.open);
  CHECK(la.cursor == lb.cursor);
  CHECK(la.expanded == lb.expanded);
  CHECK(la.scroll == lb.scroll);
  check_same_view(la.view, lb.view);
  if (la.view && lb.view) {
    CHECK(column(la.view->rows, &TreeRowViewModel::text) ==
          column(lb.view->rows, &TreeRowViewModel::text));
    CHECK(column(la.view->rows, &TreeRowViewModel::is_cursor) ==
          column(lb.view->rows, &TreeRowViewModel::is_cursor));
    CHECK(la.view->summary == lb.view->summary);
  }

  const auto &ma = a.state.merge_bot;
  const auto &mb = b.state.merge_bot;
  CHECK(ma.running == mb.running);
  CHECK(ma.run_id == mb.run_id);
  CHECK(ma.message == mb.message);
  REQUIRE(ma.queue.size() == mb.queue.size());
  for (std::size_t i = 0; i < ma.queue.size(); ++i) {
    CHECK(ma.queue[i].state == mb.queue[i].state);
    CHECK(ma.queue[i].attempts == mb.queue[i].attempts);
    CHECK(ma.queue[i].last_error == mb.queue[i].last_error);
    CHECK(ma.queue[i].retry_at == mb.queue[i].retry_at);
  }
  check_same_view(ma.view, mb.view);
  if (ma.view && mb.view) {
    CHECK(column(ma.view->rows, &MergeQueueRowViewModel::state_label) ==
          column(mb.view->rows, &MergeQueueRowViewModel::state_label));
    CHECK(column(ma.view->rows, &MergeQueueRowViewModel::countdown) ==
          column(mb.view->rows, &MergeQueueRowViewModel::countdown));
    CHECK(ma.view->failures == mb.view->failures);
  }

  CHECK(static_cast<bool>(a.state.ui.status) ==
        static_cast<bool>(b.state.ui.status));
  if (a.state.ui.status && b.state.ui.status) {
    CHECK(a.state.ui.status->text == b.state.ui.status->text);
  }
}

std::shared_ptr<const BuildLogs> failing_logs() {
  LogLine ok;
  ok.display = "compiling";
  LogLine bad;
  bad.display = "error: boom";
  bad.is_error = true;
  std::vector<JobNode> jobs;
  jobs.emplace_back("JobX", std::vector<StepNode>{StepNode("Step1", {ok}),
                                                  StepNode("Step2", {ok, bad})});
  std::vector<WorkflowNode> workflows;
  workflows.emplace_back("WorkflowA", std::move(jobs));
  auto logs = std::make_shared<BuildLogs>();
  logs->tree = LogTree(std::move(workflows));
  return logs;
}

} // namespace

TEST_CASE("reducing the same input twice gives the same result") {
  SessionState session;
  session.repositories = {kWidgets, kGadgets};
  session.selected_prs[kWidgets.key()] = {1, 2};
  const AppState initial = make_initial_state({});
  check_same_reduction(reduce(initial, actions::Bootstrap{session}),
                       reduce(initial, actions::Bootstrap{session}));

  AppState state = loaded_state();
  state = apply(state, {actions::OpenBuildLogs{},
                        actions::BuildLogsLoaded{kWidgets.key(), 1, failing_logs()},
                        actions::ToggleLogNode{}});
  REQUIRE(state.log_panel.open);
  check_same_reduction(reduce(state, actions::NextError{}),
                       reduce(state, actions::NextError{}));

  state = reduce(state, actions::CloseLogPanel{}).state;
  state = apply(state, {actions::SelectAllPrs{}, actions::StartMergeBot{}});
  REQUIRE(state.merge_bot.running);
  PullRequestStatus behind;
  behind.mergeable = MergeableStatus::NeedsRebase;
  behind.behind_base = true;
  const actions::MergeBotStatusChecked checked{state.merge_bot.run_id, 1, behind};
  check_same_reduction(reduce(state, checked), reduce(state, checked));

  const actions::MergeBotCheckFailed failed{
      state.merge_bot.run_id, 2, {FailureKind::Network, "timeout"}};
  auto first = reduce(state, failed);
  auto second = reduce(state, failed);
  check_same_reduction(first, second);
  CHECK_FALSE(first.effects.empty());
}
