#include "github_client.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace stud {

namespace {

constexpr int kMaxBackoffShift = 16;

std::shared_ptr<spdlog::logger> github_client_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("github.client");
  }();
  return logger;
}

std::string format_curl_error(const std::string &method, const std::string &url,
                              CURLcode code, const char *errbuf) {
  std::string msg = "curl " + method + " " + url + " failed: ";
  if (errbuf != nullptr && errbuf[0] != '\0') {
    msg += errbuf;
  } else {
    msg += curl_easy_strerror(code);
  }
  return msg;
}

std::string encode_query_value(const std::string &value) {
  if (value.empty()) {
    return value;
  }
  static CurlHandle curl;
  char *escaped = curl_easy_escape(curl.get(), value.c_str(),
                                   static_cast<int>(value.size()));
  if (escaped == nullptr) {
    github_client_log()->warn(
        "Failed to percent-encode query value {}; using raw value", value);
    return value;
  }
  std::string encoded(escaped);
  curl_free(escaped);
  return encoded;
}

/// Case-insensitive lookup of a response header value.
std::optional<std::string> header_value(const std::vector<std::string> &headers,
                                        const std::string &name) {
  for (const auto &h : headers) {
    if (h.size() <= name.size() || h[name.size()] != ':')
      continue;
    bool match = std::equal(name.begin(), name.end(), h.begin(),
                            [](unsigned char a, unsigned char b) {
                              return std::tolower(a) == std::tolower(b);
                            });
    if (!match)
      continue;
    std::string value = h.substr(name.size() + 1);
    auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos)
      return std::string{};
    auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
  }
  return std::nullopt;
}

std::optional<long> header_number(const std::vector<std::string> &headers,
                                  const std::string &name) {
  auto value = header_value(headers, name);
  if (!value || value->empty())
    return std::nullopt;
  try {
    return std::stol(*value);
  } catch (const std::exception &e) {
    github_client_log()->debug("Ignoring malformed {} header '{}': {}", name,
                               *value, e.what());
    return std::nullopt;
  }
}

std::string body_excerpt(const std::string &body) {
  constexpr std::size_t kMax = 200;
  if (body.size() <= kMax)
    return body;
  return body.substr(0, kMax) + "...";
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

size_t write_callback(void *contents, size_t size, size_t nmemb, void *userp) {
  size_t total = size * nmemb;
  std::string *s = static_cast<std::string *>(userp);
  s->append(static_cast<char *>(contents), total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems,
                       void *userdata) {
  size_t total = size * nitems;
  std::string line(buffer, total);
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
    line.pop_back();
  auto *hdrs = static_cast<std::vector<std::string> *>(userdata);
  hdrs->push_back(line);
  return total;
}

/**
 * HTTP client wrapper that retries requests with exponential backoff.
 */
class RetryHttpClient : public HttpClient {
public:
  RetryHttpClient(std::unique_ptr<HttpClient> inner, int max_retries,
                  int backoff_ms)
      : inner_(std::move(inner)), max_retries_(std::max(0, max_retries)),
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

private:
  template <typename F> auto request(F f) -> decltype(f()) {
    int attempt = 0;
    while (true) {
      try {
        return f();
      } catch (const TransientNetworkError &e) {
        if (attempt >= max_retries_)
          throw;
        github_client_log()->debug("Retrying after network error: {}",
                                   e.what());
      } catch (const HttpStatusError &e) {
        if (attempt >= max_retries_ || e.status < 500 || e.status >= 600)
          throw;
        github_client_log()->debug("Retrying after HTTP {}", e.status);
      }
      // Exponential backoff: 2^attempt * backoff_ms between retries, with the
      // exponent capped at kMaxBackoffShift.
      std::this_thread::sleep_for(std::chrono::milliseconds(
          static_cast<long long>(backoff_ms_)
          << std::min(attempt, kMaxBackoffShift)));
      ++attempt;
    }
  }

  std::unique_ptr<HttpClient> inner_;
  int max_retries_;
  int backoff_ms_;
};

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

CurlHttpClient::CurlHttpClient(long timeout_ms, std::string https_proxy)
    : timeout_ms_(timeout_ms), https_proxy_(std::move(https_proxy)) {}

HttpResponse
CurlHttpClient::get_with_headers(const std::string &url,
                                 const std::vector<std::string> &headers) {
  CURL *curl = curl_.get();
  curl_easy_reset(curl);
  std::string response;
  std::vector<std::string> resp_headers;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  if (!https_proxy_.empty() && url.rfind("https://", 0) == 0) {
    curl_easy_setopt(curl, CURLOPT_HTTPPROXYTUNNEL, 1L);
    curl_easy_setopt(curl, CURLOPT_PROXY, https_proxy_.c_str());
  }
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &resp_headers);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  CurlSlist header_list;
  for (const auto &h : headers) {
    header_list.append(h);
  }
  header_list.append("User-Agent: stud");
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
  CURLcode res = curl_easy_perform(curl);
  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  if (res != CURLE_OK) {
    std::string msg = format_curl_error("GET", url, res, errbuf);
    github_client_log()->debug(msg);
    throw TransientNetworkError(msg);
  }
  if (http_code < 200 || http_code >= 300) {
    if (http_code == 403 || http_code == 429) {
      // Let caller handle rate limiting
      return {response, resp_headers, http_code};
    }
    github_client_log()->debug("curl GET {} failed with HTTP code {}", url,
                               http_code);
    throw HttpStatusError(static_cast<int>(http_code),
                          "curl GET failed with HTTP code " +
                              std::to_string(http_code));
  }
  return {response, resp_headers, http_code};
}

std::string CurlHttpClient::get(const std::string &url,
                                const std::vector<std::string> &headers) {
  return get_with_headers(url, headers).body;
}

std::unique_ptr<HttpClient> make_retrying_client(
    std::unique_ptr<HttpClient> inner, int max_retries, int backoff_ms) {
  return std::make_unique<RetryHttpClient>(std::move(inner), max_retries,
                                           backoff_ms);
}

std::string next_page_url(const std::vector<std::string> &headers) {
  auto links = header_value(headers, "Link");
  if (!links)
    return {};
  std::stringstream ss(*links);
  std::string part;
  while (std::getline(ss, part, ',')) {
    if (part.find("rel=\"next\"") == std::string::npos)
      continue;
    auto start = part.find('<');
    auto end = part.find('>', start);
    if (start != std::string::npos && end != std::string::npos) {
      return part.substr(start + 1, end - start - 1);
    }
  }
  return {};
}

GitHubClient::GitHubClient(std::string token, std::string owner,
                           std::string repo, std::unique_ptr<HttpClient> http,
                           int timeout_ms, int max_retries,
                           std::string api_base)
    : token_(std::move(token)), owner_(std::move(owner)),
      repo_(std::move(repo)),
      http_(make_retrying_client(
          http ? std::move(http)
               : std::make_unique<CurlHttpClient>(timeout_ms),
          max_retries)),
      api_base_(std::move(api_base)) {
  while (!api_base_.empty() && api_base_.back() == '/')
    api_base_.pop_back();
  github_client_log()->debug("GitHub client for {}/{} at {}", owner_, repo_,
                             api_base_);
}

std::string GitHubClient::repo_url() const {
  return api_base_ + "/repos/" + owner_ + "/" + repo_;
}

std::vector<std::string> GitHubClient::request_headers() const {
  std::vector<std::string> headers = {"Accept: application/vnd.github+json",
                                      "X-GitHub-Api-Version: 2022-11-28"};
  if (!token_.empty()) {
    headers.push_back("Authorization: token " + token_);
  }
  return headers;
}

/**
 * Work out how long to wait before retrying a rate limited response.
 *
 * @return Delay to wait, or `std::nullopt` when the response is not a rate
 *         limit answer.
 */
std::optional<std::chrono::seconds>
GitHubClient::rate_limit_wait(const HttpResponse &resp) const {
  if (resp.status_code != 403 && resp.status_code != 429)
    return std::nullopt;
  auto retry_after = header_number(resp.headers, "Retry-After");
  if (retry_after) {
    return std::chrono::seconds(std::max(0L, *retry_after));
  }
  auto remaining = header_number(resp.headers, "X-RateLimit-Remaining");
  if (!remaining || *remaining != 0)
    return std::nullopt;
  auto reset = header_number(resp.headers, "X-RateLimit-Reset");
  if (!reset)
    return std::chrono::seconds(0);
  auto reset_time =
      std::chrono::system_clock::time_point(std::chrono::seconds(*reset));
  auto now = std::chrono::system_clock::now();
  if (reset_time <= now)
    return std::chrono::seconds(0);
  return std::chrono::duration_cast<std::chrono::seconds>(reset_time - now) +
         std::chrono::seconds(1);
}

HttpResponse GitHubClient::fetch(const std::string &url) {
  const auto headers = request_headers();
  bool waited = false;
  while (true) {
    HttpResponse res;
    try {
      res = http_->get_with_headers(url, headers);
    } catch (const HttpStatusError &e) {
      throw ApiError("GitHub request failed with HTTP " +
                         std::to_string(e.status) + ".",
                     "GET " + url + ": " + e.what(), e.status);
    } catch (const TransientNetworkError &e) {
      throw ApiError("Could not reach GitHub.", "GET " + url + ": " + e.what());
    }
    auto wait = rate_limit_wait(res);
    if (wait) {
      if (waited || *wait > max_rate_limit_wait_) {
        github_client_log()->warn("GitHub rate limit exceeded for {}", url);
        throw ApiError("GitHub rate limit exceeded.",
                       "GET " + url + ": HTTP " +
                           std::to_string(res.status_code) + " " +
                           body_excerpt(res.body),
                       res.status_code);
      }
      github_client_log()->warn("Rate limited by GitHub, waiting {}s",
                                wait->count());
      std::this_thread::sleep_for(*wait);
      waited = true;
      continue;
    }
    if (res.status_code < 200 || res.status_code >= 300) {
      throw ApiError("GitHub request failed with HTTP " +
                         std::to_string(res.status_code) + ".",
                     "GET " + url + ": " + body_excerpt(res.body),
                     res.status_code);
    }
    return res;
  }
}

nlohmann::json GitHubClient::fetch_json(const std::string &url) {
  HttpResponse res = fetch(url);
  nlohmann::json j = nlohmann::json::parse(res.body, nullptr, false);
  if (j.is_discarded() || !j.is_array()) {
    throw ApiError("Unexpected response from GitHub.",
                   "GET " + url + ": " + body_excerpt(res.body),
                   res.status_code);
  }
  return j;
}

std::vector<PullRequestRecord>
GitHubClient::list_by_state(const std::string &state) {
  std::vector<PullRequestRecord> prs;
  std::string url = repo_url() + "/pulls?state=" + state + "&per_page=100&page=1";
  int pages = 0;
  while (!url.empty()) {
    HttpResponse res = fetch(url);
    nlohmann::json j = nlohmann::json::parse(res.body, nullptr, false);
    if (j.is_discarded() || !j.is_array()) {
      throw ApiError("Unexpected response from GitHub.",
                     "GET " + url + ": " + body_excerpt(res.body),
                     res.status_code);
    }
    for (const auto &item : j) {
      prs.push_back(pull_request_from_json(item));
    }
    ++pages;
    std::string next = next_page_url(res.headers);
    if (next == url)
      break;
    url = next;
  }
  github_client_log()->debug("Fetched {} {} pull request(s) in {} page(s)",
                             prs.size(), state, pages);
  return prs;
}

std::vector<PullRequestRecord>
GitHubClient::list_all_pull_requests(PullRequestState state) {
  if (state != PullRequestState::All) {
    return list_by_state(to_string(state));
  }
  // Open last so that it wins over a closed PR for a reused branch name.
  auto prs = list_by_state("closed");
  auto open = list_by_state("open");
  prs.insert(prs.end(), open.begin(), open.end());
  return prs;
}

std::optional<PullRequestRecord>
GitHubClient::find_by_state(const std::string &branch,
                            const std::string &state) {
  std::string url = repo_url() + "/pulls?head=" +
                    encode_query_value(owner_ + ":" + branch) +
                    "&state=" + state + "&per_page=100";
  nlohmann::json j = fetch_json(url);
  for (const auto &item : j) {
    PullRequestRecord pr = pull_request_from_json(item);
    if (pr.same_repository()) {
      return pr;
    }
  }
  return std::nullopt;
}

std::optional<PullRequestRecord>
GitHubClient::find_pull_request_by_branch(const std::string &branch,
                                          PullRequestState state) {
  if (state != PullRequestState::All) {
    return find_by_state(branch, to_string(state));
  }
  auto open = find_by_state(branch, "open");
  if (open) {
    return open;
  }
  return find_by_state(branch, "closed");
}

} // namespace stud
