/**
 * @file errors.hpp
 * @brief Exception types raised by the HTTP and GitHub layers and their
 *        conversion into failure values carried by actions.
 */

#ifndef PRDECK_ERRORS_HPP
#define PRDECK_ERRORS_HPP

#include <exception>
#include <stdexcept>
#include <string>

namespace prdeck {

/// Network failure that may succeed when retried (DNS, timeouts, resets).
class TransientNetworkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Non-success HTTP status returned by the server.
class HttpStatusError : public std::runtime_error {
public:
  HttpStatusError(int status_code, const std::string &message)
      : std::runtime_error(message), status(status_code) {}

  int status; ///< HTTP status code
};

/// Classification of a failed GitHub operation.
enum class FailureKind { NotFound, RateLimited, AuthFailed, Conflict, Network, Other };

/// Short label such as "not found" or "rate limited".
const char *to_string(FailureKind kind);

/// Whether a failure of this kind may succeed on a later attempt.
bool is_transient(FailureKind kind);

/// Typed error raised by GitHubClient.
class GitHubError : public std::runtime_error {
public:
  GitHubError(FailureKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  FailureKind kind() const { return kind_; }

private:
  FailureKind kind_;
};

/// Failure value carried by actions; never thrown.
struct GitHubFailure {
  FailureKind kind{FailureKind::Other};
  std::string message;
};

bool operator==(const GitHubFailure &a, const GitHubFailure &b);

/**
 * Map an HTTP status code to a failure kind.
 *
 * @param status HTTP status code.
 * @param rate_limit_exhausted Whether `x-ratelimit-remaining` reported zero.
 */
FailureKind classify_http_status(int status, bool rate_limit_exhausted = false);

/**
 * Convert a caught exception into a failure value.
 *
 * GitHubError keeps its kind, HttpStatusError is classified by status,
 * TransientNetworkError maps to Network and anything else to Other.
 */
GitHubFailure failure_from_exception(const std::exception &e);

} // namespace prdeck

#endif // PRDECK_ERRORS_HPP
