#ifndef PRDECK_GITHUB_CLIENT_HPP
#define PRDECK_GITHUB_CLIENT_HPP

#include "log_tree.hpp"
#include "pull_request.hpp"

#include <atomic>
#include <chrono>
#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace prdeck {

/**
 * Simple HTTP response container capturing body, headers, and status code.
 */
struct HttpResponse {
  std::string body;                 ///< Response body
  std::vector<std::string> headers; ///< Response headers
  long status_code = 0;             ///< HTTP status code
};

/** Interface for performing HTTP requests. */
class HttpClient {
public:
  virtual ~HttpClient() = default;
  /**
   * Perform a HTTP GET request.
   *
   * @param url Absolute request URL.
   * @param headers Additional request headers expressed as `Header: value`
   *        strings.
   * @return Response body content as a UTF-8 string.
   * @throws TransientNetworkError On transport failures.
   * @throws HttpStatusError On non-success HTTP status codes.
   */
  virtual std::string get(const std::string &url,
                          const std::vector<std::string> &headers) = 0;

  /**
   * Perform a HTTP GET request returning both body and response headers.
   *
   * Rate limit responses (403 and 429) are returned instead of thrown so the
   * caller can inspect the rate limit headers.
   */
  virtual HttpResponse
  get_with_headers(const std::string &url,
                   const std::vector<std::string> &headers) {
    return {get(url, headers), {}, 200};
  }

  /// Perform a HTTP PUT request with a JSON payload.
  virtual std::string put(const std::string &url, const std::string &data,
                          const std::vector<std::string> &headers) = 0;

  /// Perform a HTTP POST request with a JSON payload.
  virtual std::string post(const std::string &url, const std::string &data,
                           const std::vector<std::string> &headers) = 0;
};

/**
 * RAII wrapper for a CURL easy handle ensuring global CURL initialization.
 */
class CurlHandle {
public:
  CurlHandle();
  ~CurlHandle();
  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;
  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

/**
 * CURL-based HTTP client implementation.
 *
 * Each request uses its own easy handle, so one instance may be shared by
 * the worker threads.
 */
class CurlHttpClient : public HttpClient {
public:
  /**
   * @param timeout_ms Request timeout in milliseconds.
   * @param http_proxy Proxy URL for HTTP requests.
   * @param https_proxy Proxy URL for HTTPS requests.
   */
  explicit CurlHttpClient(long timeout_ms = 30000, std::string http_proxy = {},
                          std::string https_proxy = {});

  std::string get(const std::string &url,
                  const std::vector<std::string> &headers) override;
  HttpResponse
  get_with_headers(const std::string &url,
                   const std::vector<std::string> &headers) override;
  std::string put(const std::string &url, const std::string &data,
                  const std::vector<std::string> &headers) override;
  std::string post(const std::string &url, const std::string &data,
                   const std::vector<std::string> &headers) override;

  /// Total bytes downloaded so far.
  curl_off_t total_downloaded() const { return total_downloaded_; }

  const std::string &http_proxy() const { return http_proxy_; }
  const std::string &https_proxy() const { return https_proxy_; }

private:
  HttpResponse perform(const char *verb, const std::string &url,
                       const std::string *data,
                       const std::vector<std::string> &headers);
  void apply_proxy(CURL *curl, const std::string &url) const;

  long timeout_ms_;
  std::string http_proxy_;
  std::string https_proxy_;
  std::atomic<curl_off_t> total_downloaded_{0};
};

/**
 * Operations the dashboard performs against GitHub.
 *
 * Implementations throw GitHubError, HttpStatusError or
 * TransientNetworkError; callers convert them with failure_from_exception().
 */
class GitHubApi {
public:
  virtual ~GitHubApi() = default;

  /// Open pull requests targeting the repository's branch.
  virtual std::vector<PullRequest> list_pull_requests(const Repository &repo) = 0;

  /// Mergeability and CI state of one pull request.
  virtual PullRequestStatus pull_request_status(const Repository &repo,
                                                int number) = 0;

  virtual void merge(const Repository &repo, int number) = 0;

  /// Bring the head branch up to date with its base.
  virtual void rebase(const Repository &repo, int number) = 0;

  /**
   * Rerun the failed jobs of every failed workflow run on the head commit.
   *
   * @throws GitHubError With FailureKind::NotFound when nothing failed.
   */
  virtual void rerun_failed_jobs(const Repository &repo, int number) = 0;

  virtual void approve(const Repository &repo, int number,
                       const std::string &message) = 0;

  /// Download and parse the job logs of the latest run of each workflow.
  virtual BuildLogs fetch_build_logs(const Repository &repo,
                                     const PullRequest &pr) = 0;
};

/**
 * GitHub REST API client.
 */
class GitHubClient : public GitHubApi {
public:
  /**
   * Construct a GitHub API client.
   *
   * @param tokens Personal access tokens. The client rotates to the next
   *        token when one hits its rate limit.
   * @param http HTTP implementation. A CURL client is used when null.
   * @param api_base Base URL of the REST API.
   * @param max_retries Retries for transient network and 5xx failures.
   * @param delay_ms Minimum delay between two requests.
   * @param merge_method Merge method passed to the merge endpoint.
   * @param dry_run Log mutating requests instead of sending them.
   */
  GitHubClient(std::vector<std::string> tokens,
               std::unique_ptr<HttpClient> http = nullptr,
               std::string api_base = "https://api.github.com",
               int max_retries = 3, int delay_ms = 0,
               std::string merge_method = "merge", bool dry_run = false,
               int retry_backoff_ms = 100);

  std::vector<PullRequest> list_pull_requests(const Repository &repo) override;
  PullRequestStatus pull_request_status(const Repository &repo,
                                        int number) override;
  void merge(const Repository &repo, int number) override;
  void rebase(const Repository &repo, int number) override;
  void rerun_failed_jobs(const Repository &repo, int number) override;
  void approve(const Repository &repo, int number,
               const std::string &message) override;
  BuildLogs fetch_build_logs(const Repository &repo,
                             const PullRequest &pr) override;

  /// Update the minimum delay enforced between HTTP requests.
  void set_delay_ms(int delay_ms);

private:
  std::vector<std::string> request_headers();
  std::string repo_url(const Repository &repo) const;
  HttpResponse get_checked(const std::string &url);
  nlohmann::json get_json(const std::string &url);
  std::vector<nlohmann::json> get_paginated(const std::string &url,
                                            const char *array_key);
  nlohmann::json pull_request_detail(const Repository &repo, int number);
  CiStatus ci_status(const Repository &repo, const std::string &sha);
  std::string head_sha(const Repository &repo, int number,
                       const std::string &known);
  void enforce_delay();

  std::vector<std::string> tokens_;
  std::unique_ptr<HttpClient> http_;
  std::string api_base_;
  std::string merge_method_;
  bool dry_run_;
  std::size_t token_index_{0};
  int delay_ms_;
  std::chrono::steady_clock::time_point last_request_{};
  std::mutex rate_state_mutex_;
};

/// Extract the `rel="next"` URL from response headers, empty when absent.
std::string next_page_url(const std::vector<std::string> &headers);

/// Parse an ISO-8601 UTC timestamp such as `2024-05-01T10:00:00Z`.
std::optional<std::chrono::system_clock::time_point>
parse_iso8601(const std::string &text);

} // namespace prdeck

#endif // PRDECK_GITHUB_CLIENT_HPP
