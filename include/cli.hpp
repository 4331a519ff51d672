/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for prdeck.
 *
 * Declares CLI parsing helpers, option structures, and related exceptions for
 * the tool.
 */

#ifndef PRDECK_CLI_HPP
#define PRDECK_CLI_HPP

#include <exception>
#include <string>
#include <unordered_map>
#include <vector>

namespace prdeck {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Process exit code that should be returned to the caller.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/**
 * Parsed command line options.
 *
 * Values marked by an `_explicit` flag override the configuration file only
 * when that flag is set.
 */
struct CliOptions {
  bool verbose = false;           ///< Enables verbose output
  std::string config_file;        ///< Optional path to configuration file
  std::string log_level = "info"; ///< Logging verbosity level
  bool log_level_explicit{false};
  std::string log_file;           ///< Optional path to rotating log file
  int log_limit{200};             ///< Lines kept for the debug console
  bool log_limit_explicit{false};
  int log_rotate{3}; ///< Number of rotated log files to keep (0 disables)
  bool log_rotate_explicit{false};
  bool log_compress{false}; ///< Compress rotated log files
  std::unordered_map<std::string, std::string>
      log_categories; ///< Category -> level overrides
  std::vector<std::string> repositories; ///< `org/repo[@branch]` tabs
  std::vector<std::string> api_keys;     ///< Personal access tokens
  std::string api_base;                  ///< Base URL for GitHub API
  int workers{0};                        ///< Worker threads (0 = config)
  int max_request_rate{0};               ///< Requests per minute (0 = config)
  int http_timeout{0};                   ///< Seconds (0 = config)
  int http_retries{-1};                  ///< Retries (-1 = config)
  int merge_bot_concurrency{0};          ///< In-flight bot operations
  int merge_bot_retry_budget{-1};        ///< Retries per queue entry
  std::string ci_poll_interval;          ///< Duration string, empty = config
  std::string merge_method;              ///< merge, squash or rebase
  std::string theme;                     ///< dark or light
  std::string session_file;              ///< Session file path
  bool no_session{false};                ///< Disable session persistence
  std::string history_db;                ///< SQLite history database path
  std::string export_csv;                ///< Export merge history and exit
  std::string export_json;               ///< Export merge history and exit
  std::string ide_command;               ///< Open-in-IDE command template
  bool dry_run{false};                   ///< Log write operations only
};

/**
 * Parse command line arguments and return the normalized options structure.
 *
 * Falls back to the `GITHUB_TOKEN` environment variable when no token is
 * given.
 *
 * @throws CliParseExit When parsing finished early (`--help`, `--version` or
 *         a usage error already reported to the terminal).
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace prdeck

#endif // PRDECK_CLI_HPP
