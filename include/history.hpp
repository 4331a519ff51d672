/**
 * @file history.hpp
 * @brief Persistent record of merge bot outcomes.
 *
 * Each entry stores which pull request the merge bot finished with, whether
 * it was merged, how many attempts it took and the failure reason. The log
 * can be exported to CSV or JSON.
 */
#ifndef PRDECK_HISTORY_HPP
#define PRDECK_HISTORY_HPP

#include "effect.hpp"

#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace prdeck {

/**
 * SQLite-backed merge outcome log.
 *
 * Safe to use from several threads.
 */
class MergeHistory {
public:
  /**
   * Open or create the database at @p db_path.
   *
   * @throws std::runtime_error When the database cannot be opened or the
   *         schema cannot be created.
   */
  explicit MergeHistory(const std::string &db_path);

  /// Close the database connection.
  ~MergeHistory();

  MergeHistory(const MergeHistory &) = delete;
  MergeHistory &operator=(const MergeHistory &) = delete;

  /**
   * Append an outcome.
   *
   * @throws std::runtime_error When the insert fails.
   */
  void record(const MergeOutcome &outcome);

  /// All outcomes in insertion order.
  std::vector<MergeOutcome> entries();

  /**
   * Export the log to a CSV file with a header row.
   *
   * @throws std::runtime_error On I/O or query failures.
   */
  void export_csv(const std::string &path);

  /**
   * Export the log to a JSON array.
   *
   * @throws std::runtime_error On I/O or query failures.
   */
  void export_json(const std::string &path);

private:
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

} // namespace prdeck

#endif // PRDECK_HISTORY_HPP
