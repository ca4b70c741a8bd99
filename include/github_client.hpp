#ifndef STUD_GITHUB_CLIENT_HPP
#define STUD_GITHUB_CLIENT_HPP

#include "pull_request_provider.hpp"
#include <chrono>
#include <curl/curl.h>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace stud {

/**
 * Simple HTTP response container capturing body, headers, and status code.
 */
struct HttpResponse {
  std::string body;                 ///< Response body
  std::vector<std::string> headers; ///< Response headers
  long status_code = 0;             ///< HTTP status code
};

/// Transport level failure that is worth retrying (timeouts, resets).
class TransientNetworkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Non-success HTTP status reported by the transport.
class HttpStatusError : public std::runtime_error {
public:
  HttpStatusError(int status_code, const std::string &message)
      : std::runtime_error(message), status(status_code) {}

  int status; ///< HTTP status code
};

/**
 * Raised when the forge answers with an error or an unusable body.
 */
class ApiError : public std::runtime_error {
public:
  ApiError(const std::string &message, std::string technical_details,
           std::optional<long> status_code = std::nullopt)
      : std::runtime_error(message),
        technical_details_(std::move(technical_details)),
        status_code_(status_code) {}

  /// Request line and response excerpt.
  const std::string &technical_details() const noexcept {
    return technical_details_;
  }

  /// HTTP status when one was received.
  std::optional<long> status_code() const noexcept { return status_code_; }

private:
  std::string technical_details_;
  std::optional<long> status_code_;
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
   * @throws std::runtime_error On transport or protocol failures.
   */
  virtual std::string get(const std::string &url,
                          const std::vector<std::string> &headers) = 0;

  /**
   * Perform a HTTP GET request returning both body and response headers.
   *
   * @param url Absolute request URL.
   * @param headers Additional request headers expressed as `Header: value`
   *        strings.
   * @return Aggregated response body, headers, and HTTP status code.
   * @throws std::runtime_error On transport or protocol failures.
   */
  virtual HttpResponse
  get_with_headers(const std::string &url,
                   const std::vector<std::string> &headers) {
    return {get(url, headers), {}, 200};
  }
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
  /// Borrowed pointer to the CURL easy handle managed by the wrapper.
  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

/**
 * CURL-based HTTP client implementation.
 *
 * @note This class is not thread-safe; use one instance per thread.
 */
class CurlHttpClient : public HttpClient {
public:
  /**
   * @param timeout_ms Request timeout in milliseconds.
   * @param https_proxy Optional proxy URL for HTTPS requests.
   */
  explicit CurlHttpClient(long timeout_ms = 30000,
                          std::string https_proxy = {});

  /// @copydoc HttpClient::get()
  std::string get(const std::string &url,
                  const std::vector<std::string> &headers) override;

  /// @copydoc HttpClient::get_with_headers()
  HttpResponse
  get_with_headers(const std::string &url,
                   const std::vector<std::string> &headers) override;

  /// Request timeout in milliseconds.
  long timeout_ms() const { return timeout_ms_; }

private:
  CurlHandle curl_;
  long timeout_ms_;
  std::string https_proxy_;
};

/**
 * Wrap an HTTP client so that transient failures are retried with
 * exponential backoff.
 *
 * @param inner Client performing the actual requests.
 * @param max_retries Retries after the first attempt.
 * @param backoff_ms Base delay; attempt `n` waits `backoff_ms * 2^n`.
 */
std::unique_ptr<HttpClient> make_retrying_client(
    std::unique_ptr<HttpClient> inner, int max_retries, int backoff_ms = 100);

/**
 * GitHub REST API client answering pull request queries for one repository.
 */
class GitHubClient : public PullRequestProvider {
public:
  /**
   * @param token Personal access token; empty sends anonymous requests.
   * @param owner Repository owner.
   * @param repo Repository name.
   * @param http Optional HTTP client. A CURL-backed client is constructed when
   *        `nullptr` is supplied. Either way requests are retried.
   * @param timeout_ms Timeout for the internally created HTTP client.
   * @param max_retries Number of retry attempts for transient failures.
   * @param api_base Base URL for the GitHub API endpoints.
   */
  GitHubClient(std::string token, std::string owner, std::string repo,
               std::unique_ptr<HttpClient> http = nullptr,
               int timeout_ms = 30000, int max_retries = 3,
               std::string api_base = "https://api.github.com");

  /**
   * List every pull request in @p state, following pagination.
   *
   * `All` is fetched as the open list followed by the closed list.
   */
  std::vector<PullRequestRecord>
  list_all_pull_requests(PullRequestState state) override;

  /**
   * Find the pull request whose head is `owner:branch`.
   *
   * With `All`, open pull requests are searched first and closed ones only
   * when no open one exists. Fork pull requests are ignored.
   */
  std::optional<PullRequestRecord>
  find_pull_request_by_branch(const std::string &branch,
                              PullRequestState state) override;

  /// Maximum time spent waiting for a rate limit reset before giving up.
  void set_max_rate_limit_wait(std::chrono::seconds wait) {
    max_rate_limit_wait_ = wait;
  }

  const std::string &owner() const { return owner_; }
  const std::string &repo() const { return repo_; }

private:
  std::vector<std::string> request_headers() const;
  HttpResponse fetch(const std::string &url);
  nlohmann::json fetch_json(const std::string &url);
  std::vector<PullRequestRecord> list_by_state(const std::string &state);
  std::optional<PullRequestRecord>
  find_by_state(const std::string &branch, const std::string &state);
  std::optional<std::chrono::seconds>
  rate_limit_wait(const HttpResponse &resp) const;
  std::string repo_url() const;

  std::string token_;
  std::string owner_;
  std::string repo_;
  std::unique_ptr<HttpClient> http_;
  std::string api_base_;
  std::chrono::seconds max_rate_limit_wait_{60};
};

/**
 * Extract the `rel="next"` target from response headers.
 *
 * @param headers Raw response header lines.
 * @return Next page URL or an empty string.
 */
std::string next_page_url(const std::vector<std::string> &headers);

} // namespace stud

#endif // STUD_GITHUB_CLIENT_HPP
