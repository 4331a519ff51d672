#include "app.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using namespace prdeck;
using namespace std::chrono_literals;

TEST_CASE("cli overrides take precedence over config") {
  Config cfg;
  cfg.set_repositories({"acme/widgets"});
  cfg.set_log_level("warn");
  cfg.set_session_file("session.json");
  cfg.set_log_category("store", "info");

  CliOptions opts;
  opts.repositories = {"acme/widgets", "acme/gadgets@develop"};
  opts.api_keys = {"tok"};
  opts.merge_bot_concurrency = 4;
  opts.merge_bot_retry_budget = 0;
  opts.ci_poll_interval = "45s";
  opts.theme = "light";
  opts.dry_run = true;
  opts.log_categories = {{"store", "trace"}, {"merge_bot", "debug"}};
  apply_cli_overrides(opts, cfg);

  CHECK(cfg.repositories() ==
        std::vector<std::string>{"acme/widgets", "acme/gadgets@develop"});
  CHECK(cfg.api_keys() == std::vector<std::string>{"tok"});
  CHECK(cfg.merge_bot_concurrency() == 4);
  CHECK(cfg.merge_bot_retry_budget() == 0);
  CHECK(cfg.ci_poll_interval() == 45s);
  CHECK(cfg.theme() == "light");
  CHECK(cfg.dry_run());
  CHECK(cfg.log_categories().at("store") == "trace");
  CHECK(cfg.log_categories().at("merge_bot") == "debug");
  // Not given on the command line.
  CHECK(cfg.log_level() == "warn");
  CHECK(cfg.session_file() == "session.json");
  CHECK(cfg.http_retries() == 3);

  CliOptions no_session;
  no_session.no_session = true;
  apply_cli_overrides(no_session, cfg);
  CHECK(cfg.session_file().empty());
}

TEST_CASE("verbose raises the default log level") {
  Config cfg;
  CliOptions opts;
  opts.verbose = true;
  apply_cli_overrides(opts, cfg);
  CHECK(cfg.verbose());
  CHECK(cfg.log_level() == "debug");

  Config explicit_cfg;
  opts.log_level = "error";
  opts.log_level_explicit = true;
  apply_cli_overrides(opts, explicit_cfg);
  CHECK(explicit_cfg.log_level() == "error");
}

TEST_CASE("settings follow the configuration") {
  Config cfg;
  cfg.set_merge_bot_concurrency(5);
  cfg.set_merge_bot_retry_budget(2);
  cfg.set_merge_bot_backoff(10s);
  cfg.set_ci_poll_interval(5s);
  cfg.set_approval_message("LGTM");
  cfg.set_ide_command("code {repo}");
  cfg.set_web_base("https://ghe.example.com");
  cfg.set_viewport_height(12);
  AppSettings settings = settings_from_config(cfg);
  CHECK(settings.merge_bot.concurrency == 5);
  CHECK(settings.merge_bot.retry_budget == 2);
  CHECK(settings.merge_bot.backoff_base == 10s);
  CHECK(settings.merge_bot.ci_poll_interval == 5s);
  CHECK(settings.approval_message == "LGTM");
  CHECK(settings.ide_command == "code {repo}");
  CHECK(settings.web_base == "https://ghe.example.com");
  CHECK(settings.viewport_height == 12);
}

TEST_CASE("configured repositories are parsed and merged into the session") {
  Config cfg;
  cfg.set_repositories({"acme/widgets", "bogus", "acme/gadgets@develop",
                        "acme/widgets@main"});
  auto repos = configured_repositories(cfg);
  REQUIRE(repos.size() == 2);
  CHECK(repos[0] == Repository{"acme", "widgets", "main"});
  CHECK(repos[1] == Repository{"acme", "gadgets", "develop"});

  SessionState empty = merge_configured_repositories({}, repos);
  CHECK(empty.repositories == repos);

  SessionState stored;
  stored.repositories = {Repository{"octo", "cat", "main"},
                         Repository{"acme", "gadgets", "develop"}};
  stored.selected_tab = 1;
  SessionState merged = merge_configured_repositories(stored, repos);
  REQUIRE(merged.repositories.size() == 3);
  CHECK(merged.repositories[0].org == "octo");
  CHECK(merged.repositories[2] == Repository{"acme", "widgets", "main"});
  CHECK(merged.selected_tab == 1);
}

TEST_CASE("app exports history and exits") {
  const char *db = "prdeck_app_history.db";
  const char *csv = "prdeck_app_export.csv";
  std::remove(db);
  std::remove(csv);
  std::vector<std::string> args{"prdeck", "--history-db", db, "--export-csv",
                                csv};
  std::vector<char *> argv;
  for (auto &a : args) {
    argv.push_back(a.data());
  }
  App app;
  CHECK(app.run(static_cast<int>(argv.size()), argv.data()) == 0);
  CHECK(app.should_exit());
  CHECK_FALSE(app.interactive());
  std::ifstream f(csv);
  std::string header;
  std::getline(f, header);
  CHECK(header == "repo,number,title,merged,attempts,reason");
  f.close();
  std::remove(db);
  std::remove(csv);
}

TEST_CASE("app reports a missing config file") {
  std::vector<std::string> args{"prdeck", "--config", "does_not_exist.yaml"};
  std::vector<char *> argv;
  for (auto &a : args) {
    argv.push_back(a.data());
  }
  App app;
  CHECK(app.run(static_cast<int>(argv.size()), argv.data()) != 0);
  CHECK(app.should_exit());
}
