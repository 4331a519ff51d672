#include "store.hpp"
#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace prdeck;

TEST_CASE("dispatch before start reduces inline") {
  Store store(make_initial_state({}));
  CHECK(store.version() == 0);
  store.dispatch(actions::ToggleHelp{});
  CHECK(store.version() == 1);
  CHECK(store.current_state()->ui.show_help);
}

TEST_CASE("published snapshots are immutable") {
  Store store(make_initial_state({}));
  auto before = store.current_state();
  store.dispatch(actions::ToggleTheme{});
  CHECK(before->ui.theme == ThemeKind::Dark);
  CHECK(store.current_state()->ui.theme == ThemeKind::Light);
}

TEST_CASE("effects reach the handler and results feed back") {
  Store store(make_initial_state({}));
  std::vector<std::string> seen;
  store.set_effect_handler([&](const Effect &effect) {
    seen.push_back(describe(effect));
    if (auto *fetch = std::get_if<effects::FetchPullRequests>(&effect)) {
      PullRequest pr;
      pr.number = 9;
      pr.title = "fix: it";
      store.dispatch(actions::PullRequestsLoaded{fetch->repo.key(), {pr}});
    }
  });

  SessionState session;
  session.repositories = {Repository{"acme", "widgets", "main"}};
  store.dispatch(actions::Bootstrap{session});

  REQUIRE(seen.size() == 1);
  auto state = store.current_state();
  REQUIRE(state->repositories.repos.size() == 1);
  CHECK(state->repositories.repos[0].load == LoadState::Loaded);
  REQUIRE(state->repositories.repos[0].prs.size() == 1);
  CHECK(store.version() == 2);
}

TEST_CASE("a throwing effect handler does not break the store") {
  Store store(make_initial_state({}));
  store.set_effect_handler(
      [](const Effect &) { throw std::runtime_error("handler failed"); });
  store.dispatch(actions::AddRepository{Repository{"acme", "widgets", "main"}});
  store.dispatch(actions::ToggleHelp{});
  CHECK(store.version() == 2);
  CHECK(store.current_state()->ui.show_help);
}

TEST_CASE("actions from many threads are reduced one at a time") {
  Store store(make_initial_state({}));
  store.start();
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&store] {
      for (int i = 0; i < 25; ++i) {
        store.dispatch(actions::ToggleHelp{});
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  std::uint64_t version = 0;
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (version < 100 && std::chrono::steady_clock::now() < deadline) {
    version = store.wait_for_change(version, std::chrono::milliseconds(100));
  }
  CHECK(version == 100);
  CHECK_FALSE(store.current_state()->ui.show_help);
  store.stop();
}

TEST_CASE("wait_for_change times out without actions") {
  Store store(make_initial_state({}));
  store.start();
  auto start = std::chrono::steady_clock::now();
  CHECK(store.wait_for_change(0, std::chrono::milliseconds(30)) == 0);
  CHECK(std::chrono::steady_clock::now() - start >=
        std::chrono::milliseconds(25));
  store.stop();
}
