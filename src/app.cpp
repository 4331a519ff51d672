#include "app.hpp"
#include "history.hpp"
#include "log.hpp"
#include "util/duration.hpp"
#include <algorithm>
#include <cstdio>
#include <exception>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unistd.h>
#include <unordered_map>

namespace prdeck {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}
} // namespace

void apply_cli_overrides(const CliOptions &options, Config &config) {
  if (options.verbose) {
    config.set_verbose(true);
  }
  if (options.log_level_explicit) {
    config.set_log_level(options.log_level);
  } else if (options.verbose && config.log_level() == "info") {
    config.set_log_level("debug");
  }
  if (!options.log_file.empty()) {
    config.set_log_file(options.log_file);
  }
  if (options.log_limit_explicit) {
    config.set_log_limit(options.log_limit);
  }
  if (options.log_rotate_explicit) {
    config.set_log_rotate(options.log_rotate);
  }
  if (options.log_compress) {
    config.set_log_compress(true);
  }
  if (!options.log_categories.empty()) {
    auto categories = config.log_categories();
    for (const auto &[name, level] : options.log_categories) {
      categories[name] = level;
    }
    config.set_log_categories(std::move(categories));
  }
  if (!options.repositories.empty()) {
    auto repos = config.repositories();
    for (const auto &repo : options.repositories) {
      if (std::find(repos.begin(), repos.end(), repo) == repos.end()) {
        repos.push_back(repo);
      }
    }
    config.set_repositories(repos);
  }
  if (!options.api_keys.empty()) {
    config.set_api_keys(options.api_keys);
  }
  if (!options.api_base.empty()) {
    config.set_api_base(options.api_base);
  }
  if (options.workers > 0) {
    config.set_workers(options.workers);
  }
  if (options.max_request_rate > 0) {
    config.set_max_request_rate(options.max_request_rate);
  }
  if (options.http_timeout > 0) {
    config.set_http_timeout(options.http_timeout);
  }
  if (options.http_retries >= 0) {
    config.set_http_retries(options.http_retries);
  }
  if (options.merge_bot_concurrency > 0) {
    config.set_merge_bot_concurrency(options.merge_bot_concurrency);
  }
  if (options.merge_bot_retry_budget >= 0) {
    config.set_merge_bot_retry_budget(options.merge_bot_retry_budget);
  }
  if (!options.ci_poll_interval.empty()) {
    config.set_ci_poll_interval(parse_duration(options.ci_poll_interval));
  }
  if (!options.merge_method.empty()) {
    config.set_merge_method(options.merge_method);
  }
  if (!options.theme.empty()) {
    config.set_theme(options.theme);
  }
  if (!options.ide_command.empty()) {
    config.set_ide_command(options.ide_command);
  }
  if (options.no_session) {
    config.set_session_file("");
  } else if (!options.session_file.empty()) {
    config.set_session_file(options.session_file);
  }
  if (!options.history_db.empty()) {
    config.set_history_db(options.history_db);
  }
  if (options.dry_run) {
    config.set_dry_run(true);
  }
}

AppSettings settings_from_config(const Config &config) {
  AppSettings settings;
  settings.merge_bot.concurrency =
      static_cast<std::size_t>(config.merge_bot_concurrency());
  settings.merge_bot.retry_budget = config.merge_bot_retry_budget();
  settings.merge_bot.backoff_base = config.merge_bot_backoff();
  settings.merge_bot.ci_poll_interval = config.ci_poll_interval();
  settings.approval_message = config.approval_message();
  settings.ide_command = config.ide_command();
  settings.web_base = config.web_base();
  settings.viewport_height = static_cast<std::size_t>(config.viewport_height());
  return settings;
}

std::vector<Repository> configured_repositories(const Config &config) {
  std::vector<Repository> out;
  for (const auto &identifier : config.repositories()) {
    auto repo = parse_repository(identifier);
    if (!repo) {
      app_log()->error("Invalid repository identifier '{}'", identifier);
      continue;
    }
    if (std::find(out.begin(), out.end(), *repo) == out.end()) {
      out.push_back(*repo);
    }
  }
  return out;
}

SessionState
merge_configured_repositories(SessionState session,
                              const std::vector<Repository> &configured) {
  for (const auto &repo : configured) {
    auto &repos = session.repositories;
    if (std::find(repos.begin(), repos.end(), repo) == repos.end()) {
      repos.push_back(repo);
    }
  }
  return session;
}

int App::export_history() {
  try {
    MergeHistory history(config_.history_db());
    if (!options_.export_csv.empty()) {
      history.export_csv(options_.export_csv);
      app_log()->info("Merge history exported to {}", options_.export_csv);
    }
    if (!options_.export_json.empty()) {
      history.export_json(options_.export_json);
      app_log()->info("Merge history exported to {}", options_.export_json);
    }
  } catch (const std::runtime_error &e) {
    app_log()->error("Export failed: {}", e.what());
    return 1;
  }
  return 0;
}

/**
 * Execute the start-up flow.
 *
 * Parses the command line, loads and overrides the configuration and
 * initializes logging. History exports run here and end the program.
 *
 * @param argc Argument count passed from @c main().
 * @param argv Argument vector passed from @c main().
 * @return Zero on success, non-zero if execution should terminate with an
 *         error code.
 */
int App::run(int argc, char **argv) {
  should_exit_ = false;
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    should_exit_ = true;
    return exit.exit_code();
  }
  try {
    if (!options_.config_file.empty()) {
      config_ = Config::from_file(options_.config_file);
    }
    apply_cli_overrides(options_, config_);
  } catch (const std::runtime_error &e) {
    app_log()->error("{}", e.what());
    should_exit_ = true;
    return 1;
  }

  const bool exporting =
      !options_.export_csv.empty() || !options_.export_json.empty();
  interactive_ = !exporting && isatty(fileno(stdout)) && isatty(fileno(stdin));

  spdlog::level::level_enum lvl = spdlog::level::from_str(config_.log_level());
  if (lvl == spdlog::level::off && config_.log_level() != "off") {
    app_log()->warn("Unknown log level '{}'; using info", config_.log_level());
    lvl = spdlog::level::info;
  }
  set_log_buffer_capacity(static_cast<std::size_t>(config_.log_limit()));
  init_logger(lvl, config_.log_pattern(), config_.log_file(),
              static_cast<std::size_t>(config_.log_rotate()),
              config_.log_compress(), !interactive_);
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, level_str] : config_.log_categories()) {
    auto level = spdlog::level::from_str(level_str);
    if (level == spdlog::level::off && level_str != "off") {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      level_str, category);
      continue;
    }
    category_levels[category] = level;
  }
  configure_log_categories(category_levels);
  if (config_.verbose()) {
    app_log()->debug("Verbose mode enabled");
  }
  if (config_.dry_run()) {
    app_log()->info("Dry run mode enabled");
  }

  if (exporting) {
    should_exit_ = true;
    return export_history();
  }
  app_log()->info("Running prdeck with {} configured repositories",
                  config_.repositories().size());
  return 0;
}

} // namespace prdeck
