/**
 * @file pull_request.hpp
 * @brief Repository and pull request domain types.
 */

#ifndef PRDECK_PULL_REQUEST_HPP
#define PRDECK_PULL_REQUEST_HPP

#include <optional>
#include <string>

namespace prdeck {

/// Repository tracked by the dashboard, scoped to one base branch.
struct Repository {
  std::string org;             ///< Owner or organisation login
  std::string repo;            ///< Repository name
  std::string branch{"main"};  ///< Base branch the pull requests target

  /// Stable identifier in the form `org/repo@branch`.
  std::string key() const { return org + "/" + repo + "@" + branch; }

  /// Human readable `org/repo` label.
  std::string display_name() const { return org + "/" + repo; }
};

bool operator==(const Repository &a, const Repository &b);
bool operator!=(const Repository &a, const Repository &b);

/**
 * Parse `org/repo` or `org/repo@branch`.
 *
 * @return Parsed repository, or `std::nullopt` when the identifier is
 *         malformed.
 */
std::optional<Repository> parse_repository(const std::string &identifier);

/// Mergeability of a pull request as shown in the table.
enum class MergeableStatus {
  Unknown,
  BuildInProgress,
  Ready,
  NeedsRebase,
  BuildFailed,
  Conflicted,
  Blocked,
  Rebasing,
  Merging
};

/// Aggregated CI result for the head commit of a pull request.
enum class CiStatus { Unknown, Pending, Passed, Failed };

/// Short label used in tables and status lines.
const char *to_string(MergeableStatus status);

/// Short label for a CI status.
const char *to_string(CiStatus status);

/// Snapshot of a pull request as listed for a repository.
struct PullRequest {
  int number{0};
  std::string title;
  std::string body;
  std::string author;
  int comments{0};
  std::string head_sha;
  MergeableStatus mergeable{MergeableStatus::Unknown};
  CiStatus ci{CiStatus::Unknown};
  bool behind_base{false};
};

bool operator==(const PullRequest &a, const PullRequest &b);

/// Result of a status check for a single pull request.
struct PullRequestStatus {
  MergeableStatus mergeable{MergeableStatus::Unknown};
  CiStatus ci{CiStatus::Unknown};
  bool behind_base{false};
  bool merged{false};
};

/**
 * Derive the table status from GitHub's mergeable state and the CI result.
 *
 * @param mergeable_state GitHub `mergeable_state` string (clean, behind,
 *        dirty, blocked, unstable, ...).
 * @param ci Aggregated CI status.
 */
MergeableStatus derive_mergeable_status(const std::string &mergeable_state,
                                        CiStatus ci);

/// Title filter cycling through conventional-commit prefixes.
enum class PrFilter { None, Feat, Fix, Chore };

/// Next filter in the None -> Feat -> Fix -> Chore cycle.
PrFilter next_filter(PrFilter filter);

/// Display label for a filter ("all", "feat", ...).
const char *to_string(PrFilter filter);

/// Parse a filter label; unknown labels map to PrFilter::None.
PrFilter parse_filter(const std::string &label);

/// Whether the pull request title passes the filter.
bool matches_filter(const PullRequest &pr, PrFilter filter);

} // namespace prdeck

#endif // PRDECK_PULL_REQUEST_HPP
