#include "reducer.hpp"
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <variant>
#include <vector>

using namespace prdeck;

namespace {

const Repository kRepo{"acme", "widgets", "main"};

LogLine make_line(const std::string &text, bool error = false) {
  LogLine line;
  line.raw = text;
  line.display = text;
  line.is_error = error;
  return line;
}

/**
 * Build:   [JobX(Step1 ok, Step2 error at {0,0,1,1})]
 * Release: [JobZ(Step4 error at {1,0,0,1})]
 */
std::shared_ptr<const BuildLogs> make_logs() {
  auto step1_line = make_line("compiling");
  step1_line.timestamp = "2024-05-01T10:00:00Z";
  std::vector<JobNode> build_jobs;
  build_jobs.emplace_back(
      "JobX", std::vector<StepNode>{
                  StepNode("Step1", {step1_line}),
                  StepNode("Step2", {make_line("running"),
                                     make_line("error: bad", true)})});
  std::vector<JobNode> release_jobs;
  release_jobs.emplace_back(
      "JobZ", std::vector<StepNode>{StepNode(
                  "Step4", {make_line("warming up"),
                            make_line("error: later", true)})});
  std::vector<WorkflowNode> workflows;
  workflows.emplace_back("Build", std::move(build_jobs));
  workflows.emplace_back("Release", std::move(release_jobs));

  auto logs = std::make_shared<BuildLogs>();
  logs->tree = LogTree(std::move(workflows));
  JobMetadata meta;
  meta.workflow = "Build";
  meta.name = "JobX";
  meta.status = JobStatus::Failure;
  meta.duration = std::chrono::seconds(83);
  logs->metadata[job_metadata_key("Build", "JobX")] = meta;
  return logs;
}

AppState with_open_panel() {
  SessionState session;
  session.repositories = {kRepo};
  PullRequest pr;
  pr.number = 42;
  pr.title = "feat: logs";
  pr.author = "octocat";
  AppState state = make_initial_state({});
  state = reduce(state, actions::Bootstrap{session}).state;
  state = reduce(state, actions::PullRequestsLoaded{kRepo.key(), {pr}}).state;
  state = reduce(state, actions::OpenBuildLogs{}).state;
  return reduce(state, actions::BuildLogsLoaded{kRepo.key(), 42, make_logs()})
      .state;
}

} // namespace

TEST_CASE("opening logs fetches them for the cursor row") {
  SessionState session;
  session.repositories = {kRepo};
  PullRequest pr;
  pr.number = 42;
  AppState state = make_initial_state({});
  state = reduce(state, actions::Bootstrap{session}).state;
  state = reduce(state, actions::PullRequestsLoaded{kRepo.key(), {pr}}).state;

  auto r = reduce(state, actions::OpenBuildLogs{});
  CHECK(r.state.log_panel.open);
  CHECK(r.state.log_panel.loading);
  CHECK(r.state.log_panel.pr.number == 42);
  REQUIRE(r.effects.size() == 1);
  auto *fetch = std::get_if<effects::FetchBuildLogs>(&r.effects[0]);
  REQUIRE(fetch);
  CHECK(fetch->repo == kRepo);
  CHECK(fetch->pr.number == 42);

  SECTION("reopening while loading cancels the previous request") {
    auto again = reduce(r.state, actions::OpenBuildLogs{});
    REQUIRE(again.effects.size() == 2);
    auto *cancel = std::get_if<effects::CancelSubsystem>(&again.effects[0]);
    REQUIRE(cancel);
    CHECK(cancel->subsystem == Subsystem::Logs);
  }

  SECTION("closing while loading cancels the request") {
    auto closed = reduce(r.state, actions::CloseLogPanel{});
    CHECK_FALSE(closed.state.log_panel.open);
    REQUIRE(closed.effects.size() == 1);
    CHECK(std::holds_alternative<effects::CancelSubsystem>(closed.effects[0]));
  }

  SECTION("failures are shown in the panel") {
    auto failed = reduce(r.state, actions::BuildLogsLoadFailed{
                                      kRepo.key(), 42,
                                      {FailureKind::NotFound, "no runs"}});
    CHECK_FALSE(failed.state.log_panel.loading);
    REQUIRE(failed.state.log_panel.error);
    CHECK(*failed.state.log_panel.error == "no runs");
  }
}

TEST_CASE("logs for another pull request are ignored") {
  auto state = with_open_panel();
  const auto logs = state.log_panel.logs;
  auto next =
      reduce(state, actions::BuildLogsLoaded{kRepo.key(), 7, make_logs()}).state;
  CHECK(next.log_panel.logs == logs);
}

TEST_CASE("loaded logs expand failing nodes") {
  auto state = with_open_panel();
  const auto &panel = state.log_panel;
  CHECK_FALSE(panel.loading);
  CHECK(panel.cursor == LogPath{0});
  CHECK(panel.expanded ==
        ExpansionSet{{0}, {0, 0}, {0, 0, 1}, {1}, {1, 0}, {1, 0, 0}});
  REQUIRE(panel.view);
  CHECK(panel.view->total_rows == 11);
  CHECK(panel.view->summary == "2 errors in 2 workflows");
  CHECK(panel.view->header.number_text == "#42");
  CHECK(panel.view->header.author_text == "by octocat");
  CHECK(panel.view->rows[0].is_cursor);
  CHECK(panel.view->rows[0].node_type == NodeType::Workflow);
  CHECK(panel.view->rows[1].text.find("JobX (1 error), 1m 23s") !=
        std::string::npos);
}

TEST_CASE("error jumps walk forward and backward through the tree") {
  auto state = with_open_panel();
  state = reduce(state, actions::NextError{}).state;
  CHECK(state.log_panel.cursor == LogPath{0, 0, 1, 1});
  state = reduce(state, actions::NextError{}).state;
  CHECK(state.log_panel.cursor == LogPath{1, 0, 0, 1});

  auto r = reduce(state, actions::NextError{});
  CHECK(r.state.log_panel.cursor == LogPath{1, 0, 0, 1});
  REQUIRE(r.state.ui.status);
  CHECK(r.state.ui.status->text == "No further errors");

  state = reduce(r.state, actions::PreviousError{}).state;
  CHECK(state.log_panel.cursor == LogPath{0, 0, 1, 1});
  auto back = reduce(state, actions::PreviousError{});
  CHECK(back.state.log_panel.cursor == LogPath{0, 0, 1, 1});
  REQUIRE(back.state.ui.status);
  CHECK(back.state.ui.status->text == "No previous errors");
}

TEST_CASE("an error jump expands collapsed ancestors") {
  auto state = with_open_panel();
  state = reduce(state, actions::ToggleLogNode{}).state;
  CHECK(state.log_panel.expanded.count(LogPath{0}) == 0);
  CHECK(state.log_panel.view->total_rows == 6);

  state = reduce(state, actions::NextError{}).state;
  CHECK(state.log_panel.cursor == LogPath{0, 0, 1, 1});
  CHECK(state.log_panel.expanded.count(LogPath{0}) == 1);
  CHECK(state.log_panel.expanded.count(LogPath{0, 0}) == 1);
  CHECK(state.log_panel.expanded.count(LogPath{0, 0, 1}) == 1);
}

TEST_CASE("the viewport follows the cursor") {
  auto state = with_open_panel();
  state = reduce(state, actions::ResizeViewport{20, 2}).state;
  state = reduce(state, actions::NextError{}).state;
  state = reduce(state, actions::NextError{}).state;
  CHECK(state.log_panel.scroll == 9);
  REQUIRE(state.log_panel.view);
  REQUIRE(state.log_panel.view->rows.size() == 2);
  CHECK(state.log_panel.view->rows[1].is_cursor);
  CHECK(state.log_panel.view->rows[1].style == RowStyle::Error);

  state = reduce(state, actions::LogPageUp{}).state;
  state = reduce(state, actions::LogPageUp{}).state;
  CHECK(state.log_panel.cursor == LogPath{1});
  state = reduce(state, actions::LogPageUp{}).state;
  state = reduce(state, actions::LogPageUp{}).state;
  state = reduce(state, actions::LogPageUp{}).state;
  CHECK(state.log_panel.cursor == LogPath{0});
  CHECK(state.log_panel.scroll == 0);
}

TEST_CASE("collapsing a step hides its lines") {
  auto state = with_open_panel();
  state = reduce(state, actions::NextError{}).state;
  REQUIRE(state.log_panel.cursor == LogPath{0, 0, 1, 1});
  // Toggling a line is a no-op.
  auto same = reduce(state, actions::ToggleLogNode{}).state;
  CHECK(same.log_panel.expanded == state.log_panel.expanded);

  state = reduce(state, actions::LogCursorUp{}).state;
  state = reduce(state, actions::LogCursorUp{}).state;
  CHECK(state.log_panel.cursor == LogPath{0, 0, 1});
  state = reduce(state, actions::ToggleLogNode{}).state;
  CHECK(state.log_panel.expanded.count(LogPath{0, 0, 1}) == 0);
  CHECK(state.log_panel.cursor == LogPath{0, 0, 1});
  CHECK(state.log_panel.view->total_rows == 9);
}

TEST_CASE("horizontal scroll stops at the longest visible line") {
  auto state = with_open_panel();
  for (int i = 0; i < 10; ++i) {
    state = reduce(state, actions::LogScrollRight{}).state;
  }
  // Longest visible line is "error: later".
  CHECK(state.log_panel.horizontal_scroll == 12);
  const auto view = state.log_panel.view;
  auto r = reduce(state, actions::LogScrollRight{});
  CHECK(r.state.log_panel.horizontal_scroll == 12);
  CHECK(r.state.log_panel.view == view);
}

TEST_CASE("horizontal scroll and timestamps change the line text") {
  auto state = with_open_panel();
  state = reduce(state, actions::NextError{}).state;
  state = reduce(state, actions::LogScrollRight{}).state;
  CHECK(state.log_panel.horizontal_scroll == 4);
  const auto &rows = state.log_panel.view->rows;
  auto cursor_row = std::find_if(rows.begin(), rows.end(),
                                 [](const auto &r) { return r.is_cursor; });
  REQUIRE(cursor_row != rows.end());
  CHECK(cursor_row->text.find("r: bad") != std::string::npos);
  CHECK(cursor_row->text.find("error") == std::string::npos);

  state = reduce(state, actions::LogScrollLeft{}).state;
  state = reduce(state, actions::LogScrollLeft{}).state;
  CHECK(state.log_panel.horizontal_scroll == 0);

  state = reduce(state, actions::LogCursorUp{}).state;
  state = reduce(state, actions::LogCursorUp{}).state;
  state = reduce(state, actions::LogCursorUp{}).state;
  CHECK(state.log_panel.cursor == LogPath{0, 0, 0});
  state = reduce(state, actions::ToggleLogNode{}).state;
  auto r = reduce(state, actions::ToggleTimestamps{});
  CHECK(r.state.log_panel.show_timestamps);
  bool saved = false;
  for (const auto &e : r.effects) {
    if (auto *save = std::get_if<effects::SaveSession>(&e)) {
      saved = save->session.show_timestamps;
    }
  }
  CHECK(saved);
  bool stamped = false;
  for (const auto &row : r.state.log_panel.view->rows) {
    stamped = stamped ||
              row.text.find("[2024-05-01T10:00:00Z] compiling") != std::string::npos;
  }
  CHECK(stamped);
}

TEST_CASE("closing the panel keeps the display preferences") {
  auto state = with_open_panel();
  state = reduce(state, actions::ToggleTimestamps{}).state;
  auto r = reduce(state, actions::CloseLogPanel{});
  CHECK(r.effects.empty());
  CHECK_FALSE(r.state.log_panel.open);
  CHECK_FALSE(r.state.log_panel.logs);
  CHECK_FALSE(r.state.log_panel.view);
  CHECK(r.state.log_panel.show_timestamps);
}
