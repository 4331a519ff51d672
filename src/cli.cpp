#include "cli.hpp"
#include "log.hpp"
#include "pull_request.hpp"
#include "util/duration.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string_view>

#include <spdlog/spdlog.h>

namespace prdeck {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 12> categories = {
      "app",       "cli",      "config",        "executor",
      "github.client", "history", "logging",    "log_panel",
      "merge_bot", "session",  "store",         "tui"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., "
         "merge_bot=debug).";
  oss << " Configuration files accept the same mapping under 'log_categories'.";
  return oss.str();
}

std::string get_env_var(const char *name) {
  const char *env = std::getenv(name);
  return env ? std::string(env) : std::string();
}
} // namespace

CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"prdeck terminal pull request dashboard"};
  app.footer(log_category_help_text());
  CliOptions options;

  app.add_flag("-v,--verbose", options.verbose, "Enable verbose output")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file")
      ->type_name("FILE")
      ->check(CLI::ExistingFile)
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::size_t) {
           std::cout << "prdeck " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  app.add_flag("-D,--dry-run", options.dry_run,
               "Log merge, rebase and approve calls without sending them")
      ->group("General");

  auto *log_level_opt =
      app.add_option(
             "-G,--log-level", options.log_level,
             "Set logging level (trace, debug, info, warn, error, critical, off)")
          ->type_name("LEVEL")
          ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error",
                                 "critical", "off"}))
          ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to rotating log file")
      ->type_name("FILE")
      ->group("Logging");
  auto *log_limit_opt =
      app.add_option("-L,--log-limit", options.log_limit,
                     "Lines kept for the debug console")
          ->type_name("N")
          ->check(CLI::Range(1, std::numeric_limits<int>::max()))
          ->group("Logging");
  auto *log_rotate_opt =
      app.add_option("--log-rotate", options.log_rotate,
                     "Number of rotated log files to retain (0 disables "
                     "rotation)")
          ->type_name("N")
          ->check(CLI::NonNegativeNumber)
          ->group("Logging");
  app.add_flag("--log-compress", options.log_compress,
               "Compress rotated log files")
      ->group("Logging");
  app.add_option_function<std::string>(
         "--log-category",
         [&options](const std::string &value) {
           auto pos = value.find('=');
           std::string name =
               pos == std::string::npos ? value : value.substr(0, pos);
           std::string level = pos == std::string::npos ? std::string{"debug"}
                                                        : value.substr(pos + 1);
           if (name.empty()) {
             throw CLI::ValidationError("--log-category",
                                        "category name must not be empty");
           }
           if (level.empty()) {
             level = "debug";
           }
           options.log_categories[name] = level;
         },
         "Enable a logging category (NAME or NAME=LEVEL). See help footer for "
         "available categories.")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");

  app.add_option("-r,--repo", options.repositories,
                 "Repository tab as OWNER/REPO or OWNER/REPO@BRANCH")
      ->type_name("OWNER/REPO[@BRANCH]")
      ->check(CLI::Validator(
          [](std::string &value) -> std::string {
            if (!parse_repository(value)) {
              return "invalid repository '" + value + "'";
            }
            return {};
          },
          "OWNER/REPO[@BRANCH]"))
      ->group("GitHub");
  app.add_option("-k,--api-key", options.api_keys,
                 "Personal access token (repeatable)")
      ->type_name("TOKEN")
      ->group("GitHub");
  app.add_option("--api-base", options.api_base, "Base URL for the GitHub API")
      ->type_name("URL")
      ->group("GitHub");
  app.add_option("--merge-method", options.merge_method,
                 "Merge method used when merging")
      ->check(CLI::IsMember({"merge", "squash", "rebase"}))
      ->group("GitHub");
  app.add_option("-w,--workers", options.workers,
                 "Worker threads running API requests")
      ->type_name("N")
      ->check(CLI::Range(1, 64))
      ->group("Network");
  app.add_option("--max-request-rate", options.max_request_rate,
                 "Maximum API requests per minute")
      ->type_name("N")
      ->check(CLI::NonNegativeNumber)
      ->group("Network");
  app.add_option("--http-timeout", options.http_timeout,
                 "HTTP timeout in seconds")
      ->type_name("SECONDS")
      ->check(CLI::Range(1, 3600))
      ->group("Network");
  app.add_option("--http-retries", options.http_retries,
                 "Retries of transient HTTP failures")
      ->type_name("N")
      ->check(CLI::NonNegativeNumber)
      ->group("Network");

  app.add_option("--merge-concurrency", options.merge_bot_concurrency,
                 "Merge bot operations in flight at once")
      ->type_name("N")
      ->check(CLI::Range(1, 16))
      ->group("Merge bot");
  app.add_option("--merge-retries", options.merge_bot_retry_budget,
                 "Retries per queued pull request before giving up")
      ->type_name("N")
      ->check(CLI::NonNegativeNumber)
      ->group("Merge bot");
  app.add_option("--ci-poll-interval", options.ci_poll_interval,
                 "Delay between CI checks of a waiting pull request")
      ->type_name("DURATION")
      ->check(CLI::Validator(
          [](std::string &value) -> std::string {
            try {
              parse_duration(value);
            } catch (const std::runtime_error &e) {
              return e.what();
            }
            return {};
          },
          "DURATION"))
      ->group("Merge bot");

  app.add_option("--theme", options.theme, "Color theme")
      ->check(CLI::IsMember({"dark", "light"}))
      ->group("UI");
  app.add_option("--ide-command", options.ide_command,
                 "Command run by open-in-IDE; {org}, {repo}, {branch} and "
                 "{number} are substituted")
      ->type_name("COMMAND")
      ->group("UI");
  auto *session_opt =
      app.add_option("--session", options.session_file, "Session file path")
          ->type_name("FILE")
          ->group("Storage");
  app.add_flag("--no-session", options.no_session,
               "Neither restore nor save the session")
      ->excludes(session_opt)
      ->group("Storage");
  app.add_option("--history-db", options.history_db,
                 "SQLite database recording merge bot outcomes")
      ->type_name("FILE")
      ->group("Storage");
  app.add_option("--export-csv", options.export_csv,
                 "Export merge history to CSV and exit")
      ->type_name("FILE")
      ->group("Storage");
  app.add_option("--export-json", options.export_json,
                 "Export merge history to JSON and exit")
      ->type_name("FILE")
      ->group("Storage");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }
  options.log_level_explicit = log_level_opt->count() > 0U;
  options.log_limit_explicit = log_limit_opt->count() > 0U;
  options.log_rotate_explicit = log_rotate_opt->count() > 0U;

  if (options.api_keys.empty()) {
    auto env = get_env_var("GITHUB_TOKEN");
    if (!env.empty()) {
      cli_log()->debug("Using token from GITHUB_TOKEN");
      options.api_keys.emplace_back(env);
    }
  }
  return options;
}

} // namespace prdeck
