/**
 * @file session_store.hpp
 * @brief Persistence of the dashboard session (repositories and UI state).
 */

#ifndef PRDECK_SESSION_STORE_HPP
#define PRDECK_SESSION_STORE_HPP

#include "pull_request.hpp"
#include "theme.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace prdeck {

/// Snapshot of what is restored on the next start.
struct SessionState {
  std::vector<Repository> repositories;
  std::size_t selected_tab{0};
  PrFilter filter{PrFilter::None};
  /// Selected pull request numbers keyed by Repository::key().
  std::map<std::string, std::vector<int>> selected_prs;
  bool show_timestamps{false};
  ThemeKind theme{ThemeKind::Dark};
};

bool operator==(const SessionState &a, const SessionState &b);

/**
 * Read and write SessionState as a JSON document.
 */
class SessionStore {
public:
  /**
   * @param path Location of the session file. An empty path disables
   *        persistence.
   */
  explicit SessionStore(std::string path);

  /**
   * Load the session.
   *
   * A missing file yields an empty session. A malformed file is logged and
   * also yields an empty session.
   */
  SessionState load() const;

  /**
   * Write the session, creating parent directories as needed.
   *
   * @throws std::runtime_error When the file cannot be written.
   */
  void save(const SessionState &session) const;

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

/// Serialize a session to its JSON text form.
std::string session_to_json(const SessionState &session);

/**
 * Parse a session from JSON text.
 *
 * @throws std::runtime_error On malformed input.
 */
SessionState session_from_json(const std::string &text);

} // namespace prdeck

#endif // PRDECK_SESSION_STORE_HPP
