#include "cli.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdlib>
#include <string>
#include <vector>

namespace {

/// Owns mutable argv storage for parse_cli.
prdeck::CliOptions parse(std::vector<std::string> args) {
  args.insert(args.begin(), "prdeck");
  std::vector<char *> argv;
  for (auto &a : args) {
    argv.push_back(a.data());
  }
  return prdeck::parse_cli(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("test cli", "[cli]") {
  unsetenv("GITHUB_TOKEN");

  prdeck::CliOptions defaults = parse({});
  REQUIRE_FALSE(defaults.verbose);
  REQUIRE(defaults.log_level == "info");
  REQUIRE_FALSE(defaults.log_level_explicit);
  REQUIRE(defaults.http_retries == -1);
  REQUIRE(defaults.merge_bot_retry_budget == -1);
  REQUIRE(defaults.api_keys.empty());

  prdeck::CliOptions opts = parse({"--verbose", "--log-level", "debug",
                                   "--log-limit", "50", "--log-rotate", "0",
                                   "--log-compress", "--dry-run"});
  REQUIRE(opts.verbose);
  REQUIRE(opts.log_level == "debug");
  REQUIRE(opts.log_level_explicit);
  REQUIRE(opts.log_limit == 50);
  REQUIRE(opts.log_limit_explicit);
  REQUIRE(opts.log_rotate == 0);
  REQUIRE(opts.log_rotate_explicit);
  REQUIRE(opts.log_compress);
  REQUIRE(opts.dry_run);
}

TEST_CASE("cli collects repositories and tokens", "[cli]") {
  unsetenv("GITHUB_TOKEN");
  prdeck::CliOptions opts =
      parse({"-r", "acme/widgets", "--repo", "acme/gadgets@develop", "-k",
             "tok1", "--api-key", "tok2", "--api-base",
             "https://ghe.example.com/api/v3"});
  REQUIRE(opts.repositories ==
          std::vector<std::string>{"acme/widgets", "acme/gadgets@develop"});
  REQUIRE(opts.api_keys == std::vector<std::string>{"tok1", "tok2"});
  REQUIRE(opts.api_base == "https://ghe.example.com/api/v3");

  REQUIRE_THROWS_AS(parse({"--repo", "not-a-repo"}), prdeck::CliParseExit);
}

TEST_CASE("cli falls back to GITHUB_TOKEN", "[cli]") {
  setenv("GITHUB_TOKEN", "env-token", 1);
  prdeck::CliOptions env_opts = parse({});
  REQUIRE(env_opts.api_keys == std::vector<std::string>{"env-token"});

  prdeck::CliOptions explicit_opts = parse({"--api-key", "cli-token"});
  REQUIRE(explicit_opts.api_keys == std::vector<std::string>{"cli-token"});
  unsetenv("GITHUB_TOKEN");
}

TEST_CASE("cli merge bot and ui options", "[cli]") {
  prdeck::CliOptions opts =
      parse({"--merge-concurrency", "3", "--merge-retries", "0",
             "--ci-poll-interval", "1m30s", "--merge-method", "squash",
             "--theme", "light", "--ide-command", "code {repo}", "-w", "8",
             "--max-request-rate", "120", "--http-timeout", "10",
             "--http-retries", "0"});
  REQUIRE(opts.merge_bot_concurrency == 3);
  REQUIRE(opts.merge_bot_retry_budget == 0);
  REQUIRE(opts.ci_poll_interval == "1m30s");
  REQUIRE(opts.merge_method == "squash");
  REQUIRE(opts.theme == "light");
  REQUIRE(opts.ide_command == "code {repo}");
  REQUIRE(opts.workers == 8);
  REQUIRE(opts.max_request_rate == 120);
  REQUIRE(opts.http_timeout == 10);
  REQUIRE(opts.http_retries == 0);

  REQUIRE_THROWS_AS(parse({"--ci-poll-interval", "soon"}), prdeck::CliParseExit);
  REQUIRE_THROWS_AS(parse({"--merge-method", "octopus"}), prdeck::CliParseExit);
  REQUIRE_THROWS_AS(parse({"--theme", "blue"}), prdeck::CliParseExit);
  REQUIRE_THROWS_AS(parse({"--merge-concurrency", "0"}), prdeck::CliParseExit);
}

TEST_CASE("cli storage options", "[cli]") {
  prdeck::CliOptions opts =
      parse({"--session", "s.json", "--history-db", "h.db", "--export-csv",
             "out.csv", "--export-json", "out.json"});
  REQUIRE(opts.session_file == "s.json");
  REQUIRE_FALSE(opts.no_session);
  REQUIRE(opts.history_db == "h.db");
  REQUIRE(opts.export_csv == "out.csv");
  REQUIRE(opts.export_json == "out.json");

  REQUIRE(parse({"--no-session"}).no_session);
  REQUIRE_THROWS_AS(parse({"--no-session", "--session", "s.json"}),
                    prdeck::CliParseExit);
}

TEST_CASE("cli log categories", "[cli]") {
  prdeck::CliOptions opts = parse(
      {"--log-category", "merge_bot=trace", "--log-category", "github.client"});
  REQUIRE(opts.log_categories.size() == 2);
  REQUIRE(opts.log_categories.at("merge_bot") == "trace");
  REQUIRE(opts.log_categories.at("github.client") == "debug");

  REQUIRE_THROWS_AS(parse({"--log-category", "=info"}), prdeck::CliParseExit);
}

TEST_CASE("cli help and version exit cleanly", "[cli]") {
  try {
    parse({"--help"});
    FAIL("--help should exit");
  } catch (const prdeck::CliParseExit &e) {
    REQUIRE(e.exit_code() == 0);
  }
  try {
    parse({"--version"});
    FAIL("--version should exit");
  } catch (const prdeck::CliParseExit &e) {
    REQUIRE(e.exit_code() == 0);
  }
  try {
    parse({"--bogus"});
    FAIL("unknown option should exit");
  } catch (const prdeck::CliParseExit &e) {
    REQUIRE(e.exit_code() != 0);
  }
}
