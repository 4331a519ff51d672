/**
 * @file app.hpp
 * @brief Main application entry point and orchestrator for prdeck.
 *
 * Declares the App class, which parses the command line, loads the
 * configuration and sets up logging before the dashboard starts.
 */

#ifndef PRDECK_APP_HPP
#define PRDECK_APP_HPP

#include "cli.hpp"
#include "config.hpp"
#include "pull_request.hpp"
#include "session_store.hpp"
#include "state.hpp"
#include <vector>

namespace prdeck {

/**
 * Main application entry point responsible for orchestrating high level
 * application flow, configuration loading, and CLI parsing.
 */
class App {
public:
  /**
   * Run the application with the given command line arguments.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return Zero on success, non-zero when execution should terminate due to
   *         an error.
   */
  int run(int argc, char **argv);

  /// Parsed command line options.
  const CliOptions &options() const { return options_; }

  /// Configuration with command line overrides applied.
  const Config &config() const { return config_; }

  /**
   * Determine whether the application should exit immediately after
   * `run()` completes (help, version or history export).
   */
  bool should_exit() const { return should_exit_; }

  /// Whether the terminal UI owns stdout.
  bool interactive() const { return interactive_; }

private:
  int export_history();

  CliOptions options_;
  Config config_;
  bool should_exit_{false};
  bool interactive_{false};
};

/// Apply command line overrides to @p config.
void apply_cli_overrides(const CliOptions &options, Config &config);

/// Reducer settings derived from @p config.
AppSettings settings_from_config(const Config &config);

/// Repositories named by @p config; malformed entries are logged and skipped.
std::vector<Repository> configured_repositories(const Config &config);

/**
 * Append configured repositories the session does not know yet.
 *
 * When the session holds no repositories the result lists exactly
 * @p configured.
 */
SessionState merge_configured_repositories(SessionState session,
                                           const std::vector<Repository> &configured);

} // namespace prdeck

#endif // PRDECK_APP_HPP
