#include "pull_request.hpp"

#include <algorithm>
#include <cctype>

namespace prdeck {

namespace {

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

/// True when the lowered title starts with `prefix` followed by ':', '(' or '!'.
bool has_commit_prefix(const std::string &title, const std::string &prefix) {
  std::string lower = to_lower_copy(title);
  if (lower.rfind(prefix, 0) != 0 || lower.size() == prefix.size()) {
    return false;
  }
  char next = lower[prefix.size()];
  return next == ':' || next == '(' || next == '!';
}

} // namespace

bool operator==(const Repository &a, const Repository &b) {
  return a.org == b.org && a.repo == b.repo && a.branch == b.branch;
}

bool operator!=(const Repository &a, const Repository &b) { return !(a == b); }

std::optional<Repository> parse_repository(const std::string &identifier) {
  auto slash = identifier.find('/');
  if (slash == std::string::npos || slash == 0) {
    return std::nullopt;
  }
  Repository repo;
  repo.org = identifier.substr(0, slash);
  std::string rest = identifier.substr(slash + 1);
  auto at = rest.find('@');
  if (at != std::string::npos) {
    repo.branch = rest.substr(at + 1);
    rest = rest.substr(0, at);
    if (repo.branch.empty()) {
      return std::nullopt;
    }
  }
  if (rest.empty() || rest.find('/') != std::string::npos) {
    return std::nullopt;
  }
  repo.repo = rest;
  return repo;
}

const char *to_string(MergeableStatus status) {
  switch (status) {
  case MergeableStatus::Unknown:
    return "unknown";
  case MergeableStatus::BuildInProgress:
    return "building";
  case MergeableStatus::Ready:
    return "ready";
  case MergeableStatus::NeedsRebase:
    return "needs rebase";
  case MergeableStatus::BuildFailed:
    return "build failed";
  case MergeableStatus::Conflicted:
    return "conflicted";
  case MergeableStatus::Blocked:
    return "blocked";
  case MergeableStatus::Rebasing:
    return "rebasing";
  case MergeableStatus::Merging:
    return "merging";
  }
  return "unknown";
}

const char *to_string(CiStatus status) {
  switch (status) {
  case CiStatus::Unknown:
    return "unknown";
  case CiStatus::Pending:
    return "pending";
  case CiStatus::Passed:
    return "passed";
  case CiStatus::Failed:
    return "failed";
  }
  return "unknown";
}

bool operator==(const PullRequest &a, const PullRequest &b) {
  return a.number == b.number && a.title == b.title && a.body == b.body &&
         a.author == b.author && a.comments == b.comments &&
         a.head_sha == b.head_sha && a.mergeable == b.mergeable &&
         a.ci == b.ci && a.behind_base == b.behind_base;
}

MergeableStatus derive_mergeable_status(const std::string &mergeable_state,
                                        CiStatus ci) {
  const std::string state = to_lower_copy(mergeable_state);
  if (state == "dirty") {
    return MergeableStatus::Conflicted;
  }
  if (ci == CiStatus::Failed) {
    return MergeableStatus::BuildFailed;
  }
  if (state == "behind") {
    return MergeableStatus::NeedsRebase;
  }
  if (ci == CiStatus::Pending) {
    return MergeableStatus::BuildInProgress;
  }
  if (state == "blocked") {
    return MergeableStatus::Blocked;
  }
  if (state == "clean" || state == "has_hooks" ||
      (state == "unstable" && ci == CiStatus::Passed)) {
    return MergeableStatus::Ready;
  }
  return MergeableStatus::Unknown;
}

PrFilter next_filter(PrFilter filter) {
  switch (filter) {
  case PrFilter::None:
    return PrFilter::Feat;
  case PrFilter::Feat:
    return PrFilter::Fix;
  case PrFilter::Fix:
    return PrFilter::Chore;
  case PrFilter::Chore:
    return PrFilter::None;
  }
  return PrFilter::None;
}

const char *to_string(PrFilter filter) {
  switch (filter) {
  case PrFilter::None:
    return "all";
  case PrFilter::Feat:
    return "feat";
  case PrFilter::Fix:
    return "fix";
  case PrFilter::Chore:
    return "chore";
  }
  return "all";
}

PrFilter parse_filter(const std::string &label) {
  const std::string lower = to_lower_copy(label);
  if (lower == "feat") {
    return PrFilter::Feat;
  }
  if (lower == "fix") {
    return PrFilter::Fix;
  }
  if (lower == "chore") {
    return PrFilter::Chore;
  }
  return PrFilter::None;
}

bool matches_filter(const PullRequest &pr, PrFilter filter) {
  switch (filter) {
  case PrFilter::None:
    return true;
  case PrFilter::Feat:
    return has_commit_prefix(pr.title, "feat");
  case PrFilter::Fix:
    return has_commit_prefix(pr.title, "fix");
  case PrFilter::Chore:
    return has_commit_prefix(pr.title, "chore");
  }
  return true;
}

} // namespace prdeck
