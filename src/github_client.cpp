/**
 * @file github_client.cpp
 * @brief Implementation of the GitHub API client and HTTP utilities.
 *
 * Contains the CURL-based HTTP transport, the retrying wrapper used by the
 * client, and the REST calls behind every dashboard and merge bot operation.
 */

#include "github_client.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "log_parser.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <map>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace prdeck {

namespace {

std::shared_ptr<spdlog::logger> github_client_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("github.client");
  }();
  return logger;
}

std::string to_lower_copy(const std::string &value) {
  std::string out = value;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

/**
 * Value of a response header, matched case-insensitively.
 */
std::optional<std::string> header_value(const std::vector<std::string> &headers,
                                        const std::string &name) {
  const std::string prefix = to_lower_copy(name) + ":";
  for (const auto &h : headers) {
    if (to_lower_copy(h.substr(0, prefix.size())) == prefix) {
      std::string value = h.substr(prefix.size());
      auto first = value.find_first_not_of(" \t");
      return first == std::string::npos ? std::string() : value.substr(first);
    }
  }
  return std::nullopt;
}

/**
 * Create a human readable error message for a CURL request.
 */
std::string format_curl_error(const char *verb, const std::string &url,
                              CURLcode code, const char *errbuf) {
  std::ostringstream oss;
  oss << "curl " << verb;
  if (!url.empty()) {
    oss << ' ' << url;
  }
  oss << " failed: " << curl_easy_strerror(code);
  if (errbuf != nullptr && errbuf[0] != '\0') {
    oss << " - " << errbuf;
  }
  return oss.str();
}

/**
 * libcurl write callback capturing response bodies into a string.
 */
size_t write_callback(void *contents, size_t size, size_t nmemb, void *userp) {
  size_t total = size * nmemb;
  std::string *s = static_cast<std::string *>(userp);
  s->append(static_cast<char *>(contents), total);
  return total;
}

/**
 * libcurl header callback collecting response headers.
 */
size_t header_callback(char *buffer, size_t size, size_t nitems,
                       void *userdata) {
  size_t total = size * nitems;
  std::string line(buffer, total);
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
    line.pop_back();
  auto *hdrs = static_cast<std::vector<std::string> *>(userdata);
  // A redirect starts a new header block.
  if (line.rfind("HTTP/", 0) == 0) {
    hdrs->clear();
  }
  hdrs->push_back(line);
  return total;
}

/**
 * RAII wrapper managing a CURL linked list of headers.
 */
struct CurlSlist {
  curl_slist *list{nullptr};
  CurlSlist() = default;
  ~CurlSlist() { curl_slist_free_all(list); }
  void append(const std::string &s) {
    list = curl_slist_append(list, s.c_str());
  }
  curl_slist *get() const { return list; }
  CurlSlist(const CurlSlist &) = delete;
  CurlSlist &operator=(const CurlSlist &) = delete;
};

/**
 * HTTP client wrapper that retries requests with exponential backoff.
 */
class RetryHttpClient : public HttpClient {
public:
  /**
   * @param inner Underlying client performing real requests.
   * @param max_retries Maximum retries for transient failures.
   * @param backoff_ms Base delay in milliseconds for exponential backoff.
   */
  RetryHttpClient(std::unique_ptr<HttpClient> inner, int max_retries,
                  int backoff_ms)
      : inner_(std::move(inner)), max_retries_(max_retries),
        backoff_ms_(backoff_ms) {}

  std::string get(const std::string &url,
                  const std::vector<std::string> &headers) override {
    return request([&] { return inner_->get(url, headers); });
  }

  HttpResponse
  get_with_headers(const std::string &url,
                   const std::vector<std::string> &headers) override {
    return request([&] { return inner_->get_with_headers(url, headers); });
  }

  std::string put(const std::string &url, const std::string &data,
                  const std::vector<std::string> &headers) override {
    return request([&] { return inner_->put(url, data, headers); });
  }

  std::string post(const std::string &url, const std::string &data,
                   const std::vector<std::string> &headers) override {
    return request([&] { return inner_->post(url, data, headers); });
  }

private:
  template <typename F> auto request(F f) -> decltype(f()) {
    int attempt = 0;
    while (true) {
      try {
        return f();
      } catch (const std::exception &e) {
        if (attempt >= max_retries_ || !is_transient(e))
          throw;
        github_client_log()->warn("Retrying request after error: {}",
                                  e.what());
        // Exponential backoff: 2^attempt * backoff_ms between retries.
        std::this_thread::sleep_for(
            std::chrono::milliseconds(backoff_ms_ * (1 << attempt)));
        ++attempt;
      }
    }
  }

  static bool is_transient(const std::exception &e) {
    if (dynamic_cast<const TransientNetworkError *>(&e)) {
      return true;
    }
    if (auto http_err = dynamic_cast<const HttpStatusError *>(&e)) {
      return http_err->status >= 500 && http_err->status < 600;
    }
    return false;
  }

  std::unique_ptr<HttpClient> inner_;
  int max_retries_;
  int backoff_ms_;
};

CiStatus aggregate_check_runs(const nlohmann::json &runs) {
  if (!runs.is_array() || runs.empty()) {
    return CiStatus::Unknown;
  }
  bool pending = false;
  for (const auto &run : runs) {
    const std::string status = run.value("status", std::string());
    std::string conclusion;
    if (run.contains("conclusion") && run["conclusion"].is_string()) {
      conclusion = run["conclusion"].get<std::string>();
    }
    if (conclusion == "failure" || conclusion == "timed_out" ||
        conclusion == "cancelled" || conclusion == "action_required") {
      return CiStatus::Failed;
    }
    if (status != "completed") {
      pending = true;
    }
  }
  return pending ? CiStatus::Pending : CiStatus::Passed;
}

std::string string_or_empty(const nlohmann::json &obj, const char *key) {
  if (obj.contains(key) && obj[key].is_string()) {
    return obj[key].get<std::string>();
  }
  return {};
}

} // namespace

/**
 * Initialize the CURL handle, ensuring global setup occurs once.
 */
CurlHandle::CurlHandle() {
  static std::once_flag flag;
  std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  handle_ = curl_easy_init();
  if (!handle_) {
    throw TransientNetworkError("Failed to init curl");
  }
}

CurlHandle::~CurlHandle() { curl_easy_cleanup(handle_); }

CurlHttpClient::CurlHttpClient(long timeout_ms, std::string http_proxy,
                               std::string https_proxy)
    : timeout_ms_(timeout_ms), http_proxy_(std::move(http_proxy)),
      https_proxy_(std::move(https_proxy)) {}

/**
 * Configure proxy settings on the CURL handle based on the request URL.
 */
void CurlHttpClient::apply_proxy(CURL *curl, const std::string &url) const {
  const std::string *proxy = nullptr;
  if (url.rfind("https://", 0) == 0) {
    if (!https_proxy_.empty()) {
      proxy = &https_proxy_;
    } else if (!http_proxy_.empty()) {
      proxy = &http_proxy_;
    }
    if (proxy) {
      curl_easy_setopt(curl, CURLOPT_HTTPPROXYTUNNEL, 1L);
    }
  } else if (url.rfind("http://", 0) == 0) {
    if (!http_proxy_.empty()) {
      proxy = &http_proxy_;
    }
  }
  if (proxy) {
    curl_easy_setopt(curl, CURLOPT_PROXY, proxy->c_str());
  }
}

HttpResponse CurlHttpClient::perform(const char *verb, const std::string &url,
                                     const std::string *data,
                                     const std::vector<std::string> &headers) {
  CurlHandle handle;
  CURL *curl = handle.get();
  std::string response;
  std::vector<std::string> resp_headers;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  apply_proxy(curl, url);
  if (data != nullptr) {
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, verb);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, data->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(data->size()));
  }
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &resp_headers);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  // Job logs redirect to blob storage.
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  CurlSlist header_list;
  for (const auto &h : headers) {
    header_list.append(h);
  }
  header_list.append("User-Agent: prdeck");
  if (data != nullptr) {
    header_list.append("Content-Type: application/json");
  }
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
  CURLcode res = curl_easy_perform(curl);
  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  curl_off_t dl = 0;
  curl_easy_getinfo(curl, CURLINFO_SIZE_DOWNLOAD_T, &dl);
  total_downloaded_ += dl;
  if (res != CURLE_OK) {
    std::string msg = format_curl_error(verb, url, res, errbuf);
    github_client_log()->error(msg);
    throw TransientNetworkError(msg);
  }
  return {response, resp_headers, http_code};
}

/**
 * Perform a GET request capturing both body and headers.
 */
HttpResponse
CurlHttpClient::get_with_headers(const std::string &url,
                                 const std::vector<std::string> &headers) {
  HttpResponse res = perform("GET", url, nullptr, headers);
  if (res.status_code < 200 || res.status_code >= 300) {
    if (res.status_code == 403 || res.status_code == 429) {
      // Let caller handle rate limiting
      return res;
    }
    github_client_log()->error("curl GET {} failed with HTTP code {}", url,
                               res.status_code);
    throw HttpStatusError(static_cast<int>(res.status_code),
                          "GET failed with HTTP code " +
                              std::to_string(res.status_code));
  }
  return res;
}

std::string CurlHttpClient::get(const std::string &url,
                                const std::vector<std::string> &headers) {
  HttpResponse res = get_with_headers(url, headers);
  if (res.status_code < 200 || res.status_code >= 300) {
    throw HttpStatusError(static_cast<int>(res.status_code),
                          "GET failed with HTTP code " +
                              std::to_string(res.status_code));
  }
  return res.body;
}

std::string CurlHttpClient::put(const std::string &url, const std::string &data,
                                const std::vector<std::string> &headers) {
  HttpResponse res = perform("PUT", url, &data, headers);
  if (res.status_code < 200 || res.status_code >= 300) {
    github_client_log()->error("curl PUT {} failed with HTTP code {}", url,
                               res.status_code);
    throw HttpStatusError(static_cast<int>(res.status_code),
                          "PUT failed with HTTP code " +
                              std::to_string(res.status_code));
  }
  return res.body;
}

std::string CurlHttpClient::post(const std::string &url, const std::string &data,
                                 const std::vector<std::string> &headers) {
  HttpResponse res = perform("POST", url, &data, headers);
  if (res.status_code < 200 || res.status_code >= 300) {
    github_client_log()->error("curl POST {} failed with HTTP code {}", url,
                               res.status_code);
    throw HttpStatusError(static_cast<int>(res.status_code),
                          "POST failed with HTTP code " +
                              std::to_string(res.status_code));
  }
  return res.body;
}

std::string next_page_url(const std::vector<std::string> &headers) {
  auto link = header_value(headers, "Link");
  if (!link) {
    return {};
  }
  std::stringstream ss(*link);
  std::string part;
  while (std::getline(ss, part, ',')) {
    if (part.find("rel=\"next\"") != std::string::npos) {
      auto start = part.find('<');
      auto end = part.find('>', start);
      if (start != std::string::npos && end != std::string::npos) {
        return part.substr(start + 1, end - start - 1);
      }
    }
  }
  return {};
}

std::optional<std::chrono::system_clock::time_point>
parse_iso8601(const std::string &text) {
  std::tm tm{};
  std::istringstream in(text);
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    return std::nullopt;
  }
  std::time_t t = timegm(&tm);
  if (t == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return std::chrono::system_clock::from_time_t(t);
}

GitHubClient::GitHubClient(std::vector<std::string> tokens,
                           std::unique_ptr<HttpClient> http,
                           std::string api_base, int max_retries, int delay_ms,
                           std::string merge_method, bool dry_run,
                           int retry_backoff_ms)
    : tokens_(std::move(tokens)),
      http_(std::make_unique<RetryHttpClient>(
          http ? std::move(http) : std::make_unique<CurlHttpClient>(),
          max_retries, retry_backoff_ms)),
      api_base_(std::move(api_base)), merge_method_(std::move(merge_method)),
      dry_run_(dry_run), delay_ms_(delay_ms) {
  while (!api_base_.empty() && api_base_.back() == '/') {
    api_base_.pop_back();
  }
}

void GitHubClient::set_delay_ms(int delay_ms) {
  std::scoped_lock lock(rate_state_mutex_);
  delay_ms_ = delay_ms;
}

std::vector<std::string> GitHubClient::request_headers() {
  std::vector<std::string> headers;
  {
    std::scoped_lock lock(rate_state_mutex_);
    if (!tokens_.empty()) {
      headers.push_back("Authorization: Bearer " + tokens_[token_index_]);
    }
  }
  headers.push_back("Accept: application/vnd.github+json");
  headers.push_back("X-GitHub-Api-Version: 2022-11-28");
  return headers;
}

std::string GitHubClient::repo_url(const Repository &repo) const {
  return api_base_ + "/repos/" + repo.org + "/" + repo.repo;
}

/**
 * Ensure the minimum delay between successive HTTP requests is respected.
 */
void GitHubClient::enforce_delay() {
  std::chrono::steady_clock::time_point wait_until;
  {
    std::scoped_lock lock(rate_state_mutex_);
    if (delay_ms_ <= 0)
      return;
    auto now = std::chrono::steady_clock::now();
    wait_until =
        std::max(now, last_request_ + std::chrono::milliseconds(delay_ms_));
    last_request_ = wait_until;
  }
  std::this_thread::sleep_until(wait_until);
}

/**
 * GET a URL, turning rate limit responses into typed errors.
 *
 * When several tokens are configured a rate-limited request is retried once
 * per remaining token.
 */
HttpResponse GitHubClient::get_checked(const std::string &url) {
  std::size_t rotations = 0;
  while (true) {
    enforce_delay();
    HttpResponse res = http_->get_with_headers(url, request_headers());
    if (res.status_code != 403 && res.status_code != 429) {
      return res;
    }
    auto remaining = header_value(res.headers, "X-RateLimit-Remaining");
    const bool exhausted = res.status_code == 429 ||
                           (remaining && *remaining == "0") ||
                           header_value(res.headers, "Retry-After").has_value();
    if (exhausted && rotations + 1 < tokens_.size()) {
      {
        std::scoped_lock lock(rate_state_mutex_);
        token_index_ = (token_index_ + 1) % tokens_.size();
      }
      ++rotations;
      github_client_log()->warn("Rate limit hit, switching to next token");
      continue;
    }
    std::string message = exhausted ? "API rate limit exceeded"
                                    : "Access forbidden for " + url;
    if (exhausted) {
      if (auto reset = header_value(res.headers, "X-RateLimit-Reset")) {
        message += " (resets at " + *reset + ")";
      }
    }
    github_client_log()->warn(message);
    throw GitHubError(classify_http_status(static_cast<int>(res.status_code),
                                           exhausted),
                      message);
  }
}

nlohmann::json GitHubClient::get_json(const std::string &url) {
  HttpResponse res = get_checked(url);
  try {
    return nlohmann::json::parse(res.body);
  } catch (const nlohmann::json::exception &e) {
    throw GitHubError(FailureKind::Other,
                      "Malformed response from " + url + ": " + e.what());
  }
}

std::vector<nlohmann::json>
GitHubClient::get_paginated(const std::string &url, const char *array_key) {
  std::vector<nlohmann::json> items;
  std::string next = url;
  while (!next.empty()) {
    HttpResponse res = get_checked(next);
    nlohmann::json page;
    try {
      page = nlohmann::json::parse(res.body);
    } catch (const nlohmann::json::exception &e) {
      throw GitHubError(FailureKind::Other,
                        "Malformed response from " + next + ": " + e.what());
    }
    const nlohmann::json *array = &page;
    if (array_key != nullptr) {
      if (!page.contains(array_key)) {
        break;
      }
      array = &page[array_key];
    }
    for (const auto &item : *array) {
      items.push_back(item);
    }
    next = next_page_url(res.headers);
  }
  return items;
}

std::vector<PullRequest> GitHubClient::list_pull_requests(const Repository &repo) {
  github_client_log()->info("Listing pull requests for {}", repo.key());
  const std::string url = repo_url(repo) + "/pulls?state=open&base=" +
                          repo.branch + "&per_page=100";
  std::vector<PullRequest> prs;
  for (const auto &item : get_paginated(url, nullptr)) {
    PullRequest pr;
    pr.number = item.value("number", 0);
    pr.title = string_or_empty(item, "title");
    pr.body = string_or_empty(item, "body");
    if (item.contains("user") && item["user"].is_object()) {
      pr.author = string_or_empty(item["user"], "login");
    }
    if (item.contains("head") && item["head"].is_object()) {
      pr.head_sha = string_or_empty(item["head"], "sha");
    }
    prs.push_back(std::move(pr));
  }
  // The list endpoint carries neither mergeability nor comment counts.
  for (auto &pr : prs) {
    try {
      auto detail = pull_request_detail(repo, pr.number);
      pr.comments = detail.value("comments", 0) + detail.value("review_comments", 0);
      const std::string state = string_or_empty(detail, "mergeable_state");
      pr.ci = ci_status(repo, pr.head_sha);
      pr.behind_base = state == "behind";
      pr.mergeable = derive_mergeable_status(state, pr.ci);
    } catch (const GitHubError &e) {
      if (e.kind() == FailureKind::RateLimited ||
          e.kind() == FailureKind::AuthFailed) {
        throw;
      }
      github_client_log()->warn("Status of {}#{} unavailable: {}", repo.key(),
                                pr.number, e.what());
    } catch (const HttpStatusError &e) {
      github_client_log()->warn("Status of {}#{} unavailable: {}", repo.key(),
                                pr.number, e.what());
    }
  }
  github_client_log()->info("Found {} pull requests in {}", prs.size(),
                            repo.key());
  return prs;
}

nlohmann::json GitHubClient::pull_request_detail(const Repository &repo,
                                                 int number) {
  return get_json(repo_url(repo) + "/pulls/" + std::to_string(number));
}

CiStatus GitHubClient::ci_status(const Repository &repo, const std::string &sha) {
  if (sha.empty()) {
    return CiStatus::Unknown;
  }
  auto runs = get_paginated(repo_url(repo) + "/commits/" + sha +
                                "/check-runs?per_page=100",
                            "check_runs");
  return aggregate_check_runs(nlohmann::json(runs));
}

std::string GitHubClient::head_sha(const Repository &repo, int number,
                                   const std::string &known) {
  if (!known.empty()) {
    return known;
  }
  auto detail = pull_request_detail(repo, number);
  if (detail.contains("head") && detail["head"].is_object()) {
    return string_or_empty(detail["head"], "sha");
  }
  return {};
}

PullRequestStatus GitHubClient::pull_request_status(const Repository &repo,
                                                    int number) {
  auto detail = pull_request_detail(repo, number);
  PullRequestStatus status;
  status.merged = detail.value("merged", false);
  if (status.merged) {
    return status;
  }
  const std::string state = string_or_empty(detail, "mergeable_state");
  std::string sha;
  if (detail.contains("head") && detail["head"].is_object()) {
    sha = string_or_empty(detail["head"], "sha");
  }
  status.ci = ci_status(repo, sha);
  status.behind_base = state == "behind";
  status.mergeable = derive_mergeable_status(state, status.ci);
  github_client_log()->debug("{}#{} mergeable_state={} ci={}", repo.key(),
                             number, state, to_string(status.ci));
  return status;
}

void GitHubClient::merge(const Repository &repo, int number) {
  const std::string url =
      repo_url(repo) + "/pulls/" + std::to_string(number) + "/merge";
  if (dry_run_) {
    github_client_log()->info("Dry run: would merge {}#{}", repo.key(), number);
    return;
  }
  nlohmann::json body{{"merge_method", merge_method_}};
  enforce_delay();
  std::string res = http_->put(url, body.dump(), request_headers());
  try {
    auto j = nlohmann::json::parse(res);
    if (j.contains("merged") && !j["merged"].get<bool>()) {
      throw GitHubError(FailureKind::Conflict,
                        j.value("message", std::string("Merge rejected")));
    }
  } catch (const nlohmann::json::exception &e) {
    github_client_log()->debug("Unparsed merge response: {}", e.what());
  }
  github_client_log()->info("Merged {}#{}", repo.key(), number);
}

void GitHubClient::rebase(const Repository &repo, int number) {
  const std::string url =
      repo_url(repo) + "/pulls/" + std::to_string(number) + "/update-branch";
  if (dry_run_) {
    github_client_log()->info("Dry run: would update {}#{}", repo.key(),
                              number);
    return;
  }
  enforce_delay();
  http_->put(url, "{}", request_headers());
  github_client_log()->info("Updated branch of {}#{}", repo.key(), number);
}

void GitHubClient::rerun_failed_jobs(const Repository &repo, int number) {
  const std::string sha = head_sha(repo, number, {});
  auto runs = get_paginated(repo_url(repo) + "/actions/runs?head_sha=" + sha +
                                "&per_page=100",
                            "workflow_runs");
  int rerun = 0;
  for (const auto &run : runs) {
    if (string_or_empty(run, "conclusion") != "failure") {
      continue;
    }
    const std::string id = std::to_string(run.value("id", 0LL));
    if (dry_run_) {
      github_client_log()->info("Dry run: would rerun run {} of {}#{}", id,
                                repo.key(), number);
    } else {
      enforce_delay();
      http_->post(repo_url(repo) + "/actions/runs/" + id + "/rerun-failed-jobs",
                  "{}", request_headers());
    }
    ++rerun;
  }
  if (rerun == 0) {
    throw GitHubError(FailureKind::NotFound, "No failed jobs found to rerun");
  }
  github_client_log()->info("Requested rerun of {} runs for {}#{}", rerun,
                            repo.key(), number);
}

void GitHubClient::approve(const Repository &repo, int number,
                           const std::string &message) {
  const std::string url =
      repo_url(repo) + "/pulls/" + std::to_string(number) + "/reviews";
  if (dry_run_) {
    github_client_log()->info("Dry run: would approve {}#{}", repo.key(),
                              number);
    return;
  }
  nlohmann::json body{{"event", "APPROVE"}, {"body", message}};
  enforce_delay();
  http_->post(url, body.dump(), request_headers());
  github_client_log()->info("Approved {}#{}", repo.key(), number);
}

BuildLogs GitHubClient::fetch_build_logs(const Repository &repo,
                                         const PullRequest &pr) {
  const std::string sha = head_sha(repo, pr.number, pr.head_sha);
  auto runs = get_paginated(repo_url(repo) + "/actions/runs?head_sha=" + sha +
                                "&per_page=100",
                            "workflow_runs");
  BuildLogs logs;
  std::map<std::string, std::vector<JobNode>> by_workflow;
  for (const auto &run : runs) {
    const std::string workflow = string_or_empty(run, "name");
    // Runs are listed newest first; keep only the latest run per workflow.
    if (by_workflow.count(workflow)) {
      continue;
    }
    auto &jobs = by_workflow[workflow];
    const std::string run_id = std::to_string(run.value("id", 0LL));
    for (const auto &job : get_paginated(repo_url(repo) + "/actions/runs/" +
                                             run_id + "/jobs?per_page=100",
                                         "jobs")) {
      const std::string name = string_or_empty(job, "name");
      const std::string job_id = std::to_string(job.value("id", 0LL));
      JobMetadata meta;
      meta.workflow = workflow;
      meta.name = name;
      meta.status = parse_job_status(string_or_empty(job, "status"),
                                     string_or_empty(job, "conclusion"));
      meta.html_url = string_or_empty(job, "html_url");
      auto started = parse_iso8601(string_or_empty(job, "started_at"));
      auto completed = parse_iso8601(string_or_empty(job, "completed_at"));
      if (started && completed && *completed >= *started) {
        meta.duration =
            std::chrono::duration_cast<std::chrono::seconds>(*completed - *started);
      }
      logs.metadata[job_metadata_key(workflow, name)] = meta;

      std::string text;
      try {
        enforce_delay();
        text = http_->get(repo_url(repo) + "/actions/jobs/" + job_id + "/logs",
                          request_headers());
      } catch (const HttpStatusError &e) {
        // Expired or not yet available.
        github_client_log()->warn("Logs of job {} unavailable: {}", name,
                                  e.what());
        continue;
      }
      jobs.push_back(parse_job_log(name, text));
    }
  }
  std::vector<WorkflowNode> workflows;
  for (auto &kv : by_workflow) {
    if (!kv.second.empty()) {
      workflows.push_back(build_workflow(kv.first, std::move(kv.second)));
    }
  }
  logs.tree = build_log_tree(std::move(workflows));
  github_client_log()->info("Loaded logs for {}#{}: {} workflows, {} errors",
                            repo.key(), pr.number, logs.tree.workflows().size(),
                            logs.tree.error_count());
  return logs;
}

} // namespace prdeck
