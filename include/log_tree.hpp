/**
 * @file log_tree.hpp
 * @brief Hierarchical build log model (workflow, job, step, line).
 *
 * Nodes are immutable once constructed. Error aggregates are computed
 * bottom-up by the constructors, so a node's counts always equal the sum of
 * its children's.
 */

#ifndef PRDECK_LOG_TREE_HPP
#define PRDECK_LOG_TREE_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace prdeck {

/// GitHub Actions workflow command recognised on a log line.
enum class LogCommand { None, Group, EndGroup, Error, Warning, Notice, Debug };

/// Single parsed log line.
struct LogLine {
  std::string raw;                      ///< Text after the timestamp
  std::string display;                  ///< Cleaned text shown to the user
  std::optional<std::string> timestamp; ///< ISO-8601 timestamp when present
  LogCommand command{LogCommand::None};
  bool is_command{false}; ///< Line carried a `[command]` marker
  bool is_error{false};
};

/// A step of a job, delimited by `##[group]` markers.
class StepNode {
public:
  StepNode(std::string name, std::vector<LogLine> lines);

  const std::string &name() const { return name_; }
  const std::vector<LogLine> &lines() const { return lines_; }
  std::size_t error_count() const { return error_count_; }
  bool has_failures() const { return error_count_ > 0; }

private:
  std::string name_;
  std::vector<LogLine> lines_;
  std::size_t error_count_{0};
};

/// A job made of steps.
class JobNode {
public:
  JobNode(std::string name, std::vector<StepNode> steps);

  const std::string &name() const { return name_; }
  const std::vector<StepNode> &steps() const { return steps_; }
  std::size_t error_count() const { return error_count_; }
  bool has_failures() const { return has_failures_; }

private:
  std::string name_;
  std::vector<StepNode> steps_;
  std::size_t error_count_{0};
  bool has_failures_{false};
};

/// A workflow run made of jobs.
class WorkflowNode {
public:
  WorkflowNode(std::string name, std::vector<JobNode> jobs);

  const std::string &name() const { return name_; }
  const std::vector<JobNode> &jobs() const { return jobs_; }
  std::size_t error_count() const { return error_count_; }
  bool has_failures() const { return has_failures_; }

private:
  std::string name_;
  std::vector<JobNode> jobs_;
  std::size_t error_count_{0};
  bool has_failures_{false};
};

/// Address of a node: child indices from the root. The empty path is the
/// root itself, length 1 a workflow, 2 a job, 3 a step and 4 a log line.
using LogPath = std::vector<std::size_t>;

/// Kind of node addressed by a path.
enum class LogNodeKind { Root, Workflow, Job, Step, Line };

/// Ordered forest of workflows.
class LogTree {
public:
  LogTree() = default;
  explicit LogTree(std::vector<WorkflowNode> workflows);

  const std::vector<WorkflowNode> &workflows() const { return workflows_; }
  std::size_t error_count() const { return error_count_; }
  bool has_failures() const { return has_failures_; }
  bool empty() const { return workflows_.empty(); }

  /// Whether every index of @p path is in range.
  bool contains(const LogPath &path) const;

  /// Number of children of the node at @p path (0 for lines and invalid
  /// paths).
  std::size_t child_count(const LogPath &path) const;

  /**
   * Whether the node at @p path counts as failing.
   *
   * Lines are failing when flagged as errors; other nodes when their
   * aggregate reports failures. Invalid paths are never failing.
   */
  bool is_failing(const LogPath &path) const;

  /// Aggregate error count at @p path (1 or 0 for lines).
  std::size_t error_count_at(const LogPath &path) const;

  const WorkflowNode *workflow_at(const LogPath &path) const;
  const JobNode *job_at(const LogPath &path) const;
  const StepNode *step_at(const LogPath &path) const;
  const LogLine *line_at(const LogPath &path) const;

  static LogNodeKind kind_of(const LogPath &path);

private:
  std::vector<WorkflowNode> workflows_;
  std::size_t error_count_{0};
  bool has_failures_{false};
};

/// Conclusion of a CI job as reported by the API.
enum class JobStatus { Success, Failure, Cancelled, Skipped, InProgress, Unknown };

/// Map a GitHub job `status`/`conclusion` pair to a JobStatus.
JobStatus parse_job_status(const std::string &status,
                           const std::string &conclusion);

/// Per-job information not contained in the log text.
struct JobMetadata {
  std::string workflow;
  std::string name;
  JobStatus status{JobStatus::Unknown};
  std::optional<std::chrono::seconds> duration;
  std::string html_url;
};

/// Key used to look up job metadata: `"{workflow}:{job}"`.
std::string job_metadata_key(const std::string &workflow,
                             const std::string &job);

/// Build logs fetched for one pull request.
struct BuildLogs {
  LogTree tree;
  std::unordered_map<std::string, JobMetadata> metadata;
};

} // namespace prdeck

#endif // PRDECK_LOG_TREE_HPP
