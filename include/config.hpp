#ifndef PRDECK_CONFIG_HPP
#define PRDECK_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace prdeck {

/// Application configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /** Check whether verbose output is enabled. */
  bool verbose() const { return verbose_; }

  /// Set verbose output mode.
  void set_verbose(bool verbose) { verbose_ = verbose; }

  /// Get logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Get logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Path to rotating log file.
  const std::string &log_file() const { return log_file_; }

  /// Set path for rotating log file.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of lines kept for the debug console.
  int log_limit() const { return log_limit_; }

  /// Set number of lines kept for the debug console.
  void set_log_limit(int limit) { log_limit_ = limit < 1 ? 1 : limit; }

  /// Number of rotated log files to retain (0 disables rotation).
  int log_rotate() const { return log_rotate_; }

  /// Set number of rotated log files to retain.
  void set_log_rotate(int count) { log_rotate_ = count < 0 ? 0 : count; }

  /// Whether rotated log files are compressed.
  bool log_compress() const { return log_compress_; }

  /// Enable or disable compression of rotated log files.
  void set_log_compress(bool enable) { log_compress_ = enable; }

  /// Retrieve configured log category overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace configured log category overrides.
  void set_log_categories(std::unordered_map<std::string, std::string> values) {
    log_categories_ = std::move(values);
  }

  /// Set or update a single log category override.
  void set_log_category(const std::string &name, const std::string &level) {
    log_categories_[name] = level;
  }

  /// Base URL for the GitHub API.
  const std::string &api_base() const { return api_base_; }

  /// Set base URL for the GitHub API.
  void set_api_base(const std::string &base) { api_base_ = base; }

  /// Base URL of the GitHub web interface used for pull request links.
  const std::string &web_base() const { return web_base_; }

  /// Set base URL of the GitHub web interface.
  void set_web_base(const std::string &base) { web_base_ = base; }

  /// Tokens used to authenticate API requests.
  const std::vector<std::string> &api_keys() const { return api_keys_; }

  /// Set API tokens.
  void set_api_keys(const std::vector<std::string> &keys) { api_keys_ = keys; }

  /// HTTP request timeout in seconds.
  int http_timeout() const { return http_timeout_; }

  /// Set HTTP request timeout.
  void set_http_timeout(int t) { http_timeout_ = t; }

  /// Number of HTTP retry attempts.
  int http_retries() const { return http_retries_; }

  /// Set number of HTTP retry attempts.
  void set_http_retries(int r) { http_retries_ = r < 0 ? 0 : r; }

  /// Proxy URL for HTTP requests.
  const std::string &http_proxy() const { return http_proxy_; }

  /// Set proxy URL for HTTP requests.
  void set_http_proxy(const std::string &proxy) { http_proxy_ = proxy; }

  /// Proxy URL for HTTPS requests.
  const std::string &https_proxy() const { return https_proxy_; }

  /// Set proxy URL for HTTPS requests.
  void set_https_proxy(const std::string &proxy) { https_proxy_ = proxy; }

  /// Maximum requests per minute (0 = unlimited).
  int max_request_rate() const { return max_request_rate_; }

  /// Set maximum request rate.
  void set_max_request_rate(int rate) {
    max_request_rate_ = rate < 0 ? 0 : rate;
  }

  /// Number of worker threads running network effects.
  int workers() const { return workers_; }

  /// Set worker thread count (minimum 1).
  void set_workers(int w) { workers_ = w < 1 ? 1 : w; }

  /// Repositories shown as tabs, as `org/repo` or `org/repo@branch`.
  const std::vector<std::string> &repositories() const { return repositories_; }

  /// Set repositories.
  void set_repositories(const std::vector<std::string> &repos) {
    repositories_ = repos;
  }

  /// Maximum number of merge bot operations in flight.
  int merge_bot_concurrency() const { return merge_bot_concurrency_; }

  /// Set merge bot concurrency (minimum 1).
  void set_merge_bot_concurrency(int n) {
    merge_bot_concurrency_ = n < 1 ? 1 : n;
  }

  /// Retries allowed per queue entry before it fails permanently.
  int merge_bot_retry_budget() const { return merge_bot_retry_budget_; }

  /// Set merge bot retry budget.
  void set_merge_bot_retry_budget(int n) {
    merge_bot_retry_budget_ = n < 0 ? 0 : n;
  }

  /// Base delay of the merge bot exponential backoff.
  std::chrono::seconds merge_bot_backoff() const { return merge_bot_backoff_; }

  /// Set merge bot backoff base.
  void set_merge_bot_backoff(std::chrono::seconds s) { merge_bot_backoff_ = s; }

  /// Delay between CI status checks of a waiting queue entry.
  std::chrono::seconds ci_poll_interval() const { return ci_poll_interval_; }

  /// Set CI poll interval.
  void set_ci_poll_interval(std::chrono::seconds s) { ci_poll_interval_ = s; }

  /// Merge method passed to the merge endpoint (merge, squash or rebase).
  const std::string &merge_method() const { return merge_method_; }

  /// Set merge method.
  void set_merge_method(const std::string &method) { merge_method_ = method; }

  /// Whether write operations are only logged.
  bool dry_run() const { return dry_run_; }

  /// Enable or disable dry run mode.
  void set_dry_run(bool v) { dry_run_ = v; }

  /// Rows of the pull request table and log panel before the terminal size
  /// is known.
  int viewport_height() const { return viewport_height_; }

  /// Set initial viewport height (minimum 1).
  void set_viewport_height(int rows) {
    viewport_height_ = rows < 1 ? 1 : rows;
  }

  /// Theme used when no session is stored ("dark" or "light").
  const std::string &theme() const { return theme_; }

  /// Set default theme.
  void set_theme(const std::string &theme) { theme_ = theme; }

  /// Whether hotkeys other than navigation and quit are enabled.
  bool hotkeys_enabled() const { return hotkeys_enabled_; }

  /// Enable or disable hotkeys.
  void set_hotkeys_enabled(bool enabled) { hotkeys_enabled_ = enabled; }

  /// Hotkey overrides mapping action names to binding specifications.
  const std::unordered_map<std::string, std::string> &hotkey_bindings() const {
    return hotkey_bindings_;
  }

  /// Replace hotkey overrides.
  void set_hotkey_bindings(std::unordered_map<std::string, std::string> b) {
    hotkey_bindings_ = std::move(b);
  }

  /// Set the binding specification of one action.
  void set_hotkey_binding(const std::string &action, const std::string &spec) {
    hotkey_bindings_[action] = spec;
  }

  /// Session file path. Empty disables session persistence.
  const std::string &session_file() const { return session_file_; }

  /// Set session file path.
  void set_session_file(const std::string &path) { session_file_ = path; }

  /// Path to merge history database.
  const std::string &history_db() const { return history_db_; }

  /// Set path to merge history database.
  void set_history_db(const std::string &db) { history_db_ = db; }

  /// Command line run by the open-in-IDE operation. `{org}`, `{repo}`,
  /// `{branch}` and `{number}` are substituted.
  const std::string &ide_command() const { return ide_command_; }

  /// Set IDE command.
  void set_ide_command(const std::string &cmd) { ide_command_ = cmd; }

  /// Command used to open pull request URLs.
  const std::string &browser_command() const { return browser_command_; }

  /// Set browser command.
  void set_browser_command(const std::string &cmd) { browser_command_ = cmd; }

  /// Review body posted by the approve operation.
  const std::string &approval_message() const { return approval_message_; }

  /// Set approval message.
  void set_approval_message(const std::string &msg) { approval_message_ = msg; }

  /// Load configuration from the file at `path`.
  static Config from_file(const std::string &path);

  /// Build configuration from a JSON object.
  static Config from_json(const nlohmann::json &j);

  /// Populate this configuration from a JSON object.
  void load_json(const nlohmann::json &j);

private:
  bool verbose_ = false;
  std::string log_level_ = "info";
  std::string log_pattern_;
  std::string log_file_;
  int log_limit_ = 200;
  int log_rotate_ = 3;
  bool log_compress_ = false;
  std::unordered_map<std::string, std::string> log_categories_;
  std::string api_base_ = "https://api.github.com";
  std::string web_base_ = "https://github.com";
  std::vector<std::string> api_keys_;
  int http_timeout_ = 30;
  int http_retries_ = 3;
  std::string http_proxy_;
  std::string https_proxy_;
  int max_request_rate_ = 60;
  int workers_ = 4; ///< Default number of worker threads
  std::vector<std::string> repositories_;
  int merge_bot_concurrency_ = 2;
  int merge_bot_retry_budget_ = 3;
  std::chrono::seconds merge_bot_backoff_{30};
  std::chrono::seconds ci_poll_interval_{15};
  std::string merge_method_ = "merge";
  bool dry_run_ = false;
  int viewport_height_ = 20;
  std::string theme_ = "dark";
  bool hotkeys_enabled_ = true;
  std::unordered_map<std::string, std::string> hotkey_bindings_;
  std::string session_file_;
  std::string history_db_ = "prdeck_history.db";
  std::string ide_command_;
  std::string browser_command_ = "xdg-open";
  std::string approval_message_ = "Approved";
};

} // namespace prdeck

#endif // PRDECK_CONFIG_HPP
