#include "log_tree.hpp"

#include <utility>

namespace prdeck {

StepNode::StepNode(std::string name, std::vector<LogLine> lines)
    : name_(std::move(name)), lines_(std::move(lines)) {
  for (const auto &line : lines_) {
    if (line.is_error) {
      ++error_count_;
    }
  }
}

JobNode::JobNode(std::string name, std::vector<StepNode> steps)
    : name_(std::move(name)), steps_(std::move(steps)) {
  for (const auto &step : steps_) {
    error_count_ += step.error_count();
    has_failures_ = has_failures_ || step.has_failures();
  }
}

WorkflowNode::WorkflowNode(std::string name, std::vector<JobNode> jobs)
    : name_(std::move(name)), jobs_(std::move(jobs)) {
  for (const auto &job : jobs_) {
    error_count_ += job.error_count();
    has_failures_ = has_failures_ || job.has_failures();
  }
}

LogTree::LogTree(std::vector<WorkflowNode> workflows)
    : workflows_(std::move(workflows)) {
  for (const auto &wf : workflows_) {
    error_count_ += wf.error_count();
    has_failures_ = has_failures_ || wf.has_failures();
  }
}

LogNodeKind LogTree::kind_of(const LogPath &path) {
  switch (path.size()) {
  case 0:
    return LogNodeKind::Root;
  case 1:
    return LogNodeKind::Workflow;
  case 2:
    return LogNodeKind::Job;
  case 3:
    return LogNodeKind::Step;
  default:
    return LogNodeKind::Line;
  }
}

const WorkflowNode *LogTree::workflow_at(const LogPath &path) const {
  if (path.empty() || path[0] >= workflows_.size()) {
    return nullptr;
  }
  return &workflows_[path[0]];
}

const JobNode *LogTree::job_at(const LogPath &path) const {
  const WorkflowNode *wf = workflow_at(path);
  if (!wf || path.size() < 2 || path[1] >= wf->jobs().size()) {
    return nullptr;
  }
  return &wf->jobs()[path[1]];
}

const StepNode *LogTree::step_at(const LogPath &path) const {
  const JobNode *job = job_at(path);
  if (!job || path.size() < 3 || path[2] >= job->steps().size()) {
    return nullptr;
  }
  return &job->steps()[path[2]];
}

const LogLine *LogTree::line_at(const LogPath &path) const {
  const StepNode *step = step_at(path);
  if (!step || path.size() < 4 || path[3] >= step->lines().size()) {
    return nullptr;
  }
  return &step->lines()[path[3]];
}

bool LogTree::contains(const LogPath &path) const {
  switch (path.size()) {
  case 0:
    return true;
  case 1:
    return workflow_at(path) != nullptr;
  case 2:
    return job_at(path) != nullptr;
  case 3:
    return step_at(path) != nullptr;
  case 4:
    return line_at(path) != nullptr;
  default:
    return false;
  }
}

std::size_t LogTree::child_count(const LogPath &path) const {
  switch (path.size()) {
  case 0:
    return workflows_.size();
  case 1: {
    const auto *wf = workflow_at(path);
    return wf ? wf->jobs().size() : 0;
  }
  case 2: {
    const auto *job = job_at(path);
    return job ? job->steps().size() : 0;
  }
  case 3: {
    const auto *step = step_at(path);
    return step ? step->lines().size() : 0;
  }
  default:
    return 0;
  }
}

std::size_t LogTree::error_count_at(const LogPath &path) const {
  switch (path.size()) {
  case 0:
    return error_count_;
  case 1: {
    const auto *wf = workflow_at(path);
    return wf ? wf->error_count() : 0;
  }
  case 2: {
    const auto *job = job_at(path);
    return job ? job->error_count() : 0;
  }
  case 3: {
    const auto *step = step_at(path);
    return step ? step->error_count() : 0;
  }
  case 4: {
    const auto *line = line_at(path);
    return line && line->is_error ? 1 : 0;
  }
  default:
    return 0;
  }
}

bool LogTree::is_failing(const LogPath &path) const {
  switch (path.size()) {
  case 0:
    return has_failures_;
  case 1: {
    const auto *wf = workflow_at(path);
    return wf && wf->has_failures();
  }
  case 2: {
    const auto *job = job_at(path);
    return job && job->has_failures();
  }
  case 3: {
    const auto *step = step_at(path);
    return step && step->has_failures();
  }
  case 4: {
    const auto *line = line_at(path);
    return line && line->is_error;
  }
  default:
    return false;
  }
}

JobStatus parse_job_status(const std::string &status,
                           const std::string &conclusion) {
  if (status == "queued" || status == "in_progress" || status == "waiting" ||
      status == "pending" || status == "requested") {
    return JobStatus::InProgress;
  }
  if (conclusion == "success") {
    return JobStatus::Success;
  }
  if (conclusion == "failure" || conclusion == "timed_out" ||
      conclusion == "startup_failure") {
    return JobStatus::Failure;
  }
  if (conclusion == "cancelled") {
    return JobStatus::Cancelled;
  }
  if (conclusion == "skipped" || conclusion == "neutral") {
    return JobStatus::Skipped;
  }
  return JobStatus::Unknown;
}

std::string job_metadata_key(const std::string &workflow,
                             const std::string &job) {
  return workflow + ":" + job;
}

} // namespace prdeck
