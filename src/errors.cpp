#include "errors.hpp"

namespace prdeck {

const char *to_string(FailureKind kind) {
  switch (kind) {
  case FailureKind::NotFound:
    return "not found";
  case FailureKind::RateLimited:
    return "rate limited";
  case FailureKind::AuthFailed:
    return "authentication failed";
  case FailureKind::Conflict:
    return "conflict";
  case FailureKind::Network:
    return "network error";
  case FailureKind::Other:
    return "error";
  }
  return "error";
}

bool is_transient(FailureKind kind) {
  return kind == FailureKind::Network || kind == FailureKind::RateLimited;
}

bool operator==(const GitHubFailure &a, const GitHubFailure &b) {
  return a.kind == b.kind && a.message == b.message;
}

FailureKind classify_http_status(int status, bool rate_limit_exhausted) {
  switch (status) {
  case 401:
    return FailureKind::AuthFailed;
  case 403:
    return rate_limit_exhausted ? FailureKind::RateLimited
                                : FailureKind::AuthFailed;
  case 404:
    return FailureKind::NotFound;
  case 429:
    return FailureKind::RateLimited;
  case 405:
  case 409:
  case 422:
    return FailureKind::Conflict;
  default:
    break;
  }
  if (status >= 500 && status < 600) {
    return FailureKind::Network;
  }
  return FailureKind::Other;
}

GitHubFailure failure_from_exception(const std::exception &e) {
  if (auto gh = dynamic_cast<const GitHubError *>(&e)) {
    return {gh->kind(), gh->what()};
  }
  if (auto http = dynamic_cast<const HttpStatusError *>(&e)) {
    return {classify_http_status(http->status), http->what()};
  }
  if (dynamic_cast<const TransientNetworkError *>(&e)) {
    return {FailureKind::Network, e.what()};
  }
  return {FailureKind::Other, e.what()};
}

} // namespace prdeck
