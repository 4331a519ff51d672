/**
 * @file log_parser.hpp
 * @brief Parsing of GitHub Actions job logs into the log tree.
 */

#ifndef PRDECK_LOG_PARSER_HPP
#define PRDECK_LOG_PARSER_HPP

#include "log_tree.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace prdeck {

/**
 * Split a leading `YYYY-MM-DDTHH:MM:SS[.fffffff]Z` timestamp off a log line.
 *
 * @param line Raw log line.
 * @return Pair of the timestamp (if any) and the remaining content.
 */
std::pair<std::optional<std::string>, std::string>
extract_timestamp(const std::string &line);

/// Remove ANSI escape sequences (CSI and OSC) from @p text.
std::string strip_ansi(const std::string &text);

/**
 * Parse one raw log line.
 *
 * Recognises `##[cmd]message`, `::cmd params::message` and the
 * `[command]` marker. The display text has ANSI sequences and command
 * syntax removed.
 */
LogLine parse_log_line(const std::string &raw_line);

/// Whether the line only carries grouping metadata and is hidden.
bool is_metadata_line(const LogLine &line);

/**
 * Parse the plain text log of a single job.
 *
 * Steps are split at group markers; lines before the first group belong to
 * a `Set up job` step. Steps are sorted by name.
 *
 * @param job_name Display name of the job.
 * @param content Full log text.
 */
JobNode parse_job_log(const std::string &job_name, const std::string &content);

/**
 * Assemble a workflow from parsed jobs.
 *
 * Jobs named like `.../system` that carry no log lines are dropped and the
 * remaining jobs are sorted by name.
 */
WorkflowNode build_workflow(const std::string &name, std::vector<JobNode> jobs);

/// Build a tree with failing workflows first, then by name.
LogTree build_log_tree(std::vector<WorkflowNode> workflows);

/// Strip the `.txt` suffix and numeric `N_` prefix of archived job logs.
std::string clean_job_name(const std::string &file_name);

} // namespace prdeck

#endif // PRDECK_LOG_PARSER_HPP
