/**
 * @file http_client.cpp
 * @brief libcurl transport, optional SigV4 signing and retry wrapper.
 */

#include "http_client.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string_view>
#include <spdlog/spdlog.h>
#include <thread>

namespace omb {

namespace {

std::shared_ptr<spdlog::logger> http_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("http");
  }();
  return logger;
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

/// Drop query strings so that signed URLs and tokens never reach the logs.
std::string loggable_url(const std::string &url) {
  auto q = url.find('?');
  return q == std::string::npos ? url : url.substr(0, q);
}

std::string status_message(const char *verb, long code,
                           const std::string &body) {
  std::string msg =
      std::string("curl ") + verb + " failed with HTTP code " +
      std::to_string(code);
  if (!body.empty()) {
    msg += ": " + body.substr(0, 256);
  }
  return msg;
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

struct FileCloser {
  void operator()(std::FILE *f) const {
    if (f != nullptr)
      std::fclose(f);
  }
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
  if (!line.empty())
    hdrs->push_back(line);
  return total;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

} // namespace

std::optional<std::string> find_header(const std::vector<std::string> &headers,
                                       const std::string &name) {
  std::string wanted = to_lower_copy(name);
  for (const auto &h : headers) {
    auto colon = h.find(':');
    if (colon == std::string::npos)
      continue;
    if (to_lower_copy(h.substr(0, colon)) != wanted)
      continue;
    std::string value = h.substr(colon + 1);
    auto first = value.find_first_not_of(" \t");
    auto last = value.find_last_not_of(" \t");
    if (first == std::string::npos)
      return std::string{};
    return value.substr(first, last - first + 1);
  }
  return std::nullopt;
}

HttpResponse HttpClient::put_file(const std::string &url,
                                  const std::filesystem::path &file,
                                  const std::vector<std::string> &headers) {
  std::ifstream in(file, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open " + file.string());
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return put(url, ss.str(), headers);
}

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

CurlHttpClient::CurlHttpClient(long timeout_ms,
                               std::optional<AwsSigningConfig> signing,
                               std::string user_agent)
    : timeout_ms_(timeout_ms), signing_(std::move(signing)),
      user_agent_(std::move(user_agent)) {}

/**
 * Reset the handle and apply options shared by every verb.
 */
void CurlHttpClient::prepare(CURL *curl, const std::string &url,
                             char *errbuf) {
  curl_easy_reset(curl);
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
  if (signing_) {
    std::string provider =
        "aws:amz:" + signing_->region + ":" + signing_->service;
    std::string userpwd =
        signing_->access_key_id + ":" + signing_->secret_access_key;
    curl_easy_setopt(curl, CURLOPT_AWS_SIGV4, provider.c_str());
    curl_easy_setopt(curl, CURLOPT_USERPWD, userpwd.c_str());
  }
}

void CurlHttpClient::account(CURL *curl) {
  curl_off_t dl = 0;
  curl_off_t ul = 0;
  curl_easy_getinfo(curl, CURLINFO_SIZE_DOWNLOAD_T, &dl);
  curl_easy_getinfo(curl, CURLINFO_SIZE_UPLOAD_T, &ul);
  total_downloaded_ += dl;
  total_uploaded_ += ul;
}

/**
 * Attach request headers and response sinks, run the transfer and collect
 * the status. Transport failures raise TransientNetworkError; HTTP status
 * handling is left to the caller.
 */
HttpResponse CurlHttpClient::execute(CURL *curl, const char *verb,
                                     const std::string &url,
                                     const std::vector<std::string> &headers,
                                     const char *errbuf) {
  HttpResponse out;
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &out.headers);
  CurlSlist request_headers;
  for (const auto &h : headers) {
    request_headers.append(h);
  }
  if (signing_ && !signing_->session_token.empty()) {
    request_headers.append("x-amz-security-token: " + signing_->session_token);
  }
  if (std::string_view(verb) == "PUT" || std::string_view(verb) == "POST") {
    // Large bodies must not wait for a 100-continue round trip.
    request_headers.append("Expect:");
  }
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, request_headers.get());
  CURLcode res = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status_code);
  account(curl);
  if (res != CURLE_OK) {
    std::string msg = format_curl_error(verb, loggable_url(url), res, errbuf);
    http_log()->error(msg);
    throw TransientNetworkError(msg);
  }
  return out;
}

HttpResponse
CurlHttpClient::get_with_headers(const std::string &url,
                                 const std::vector<std::string> &headers) {
  CURL *curl = curl_.get();
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  prepare(curl, url, errbuf);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  HttpResponse res = execute(curl, "GET", url, headers, errbuf);
  if (res.status_code == 403 || res.status_code == 429) {
    // Rate limits are handled by the caller.
    return res;
  }
  if (res.status_code < 200 || res.status_code >= 300) {
    http_log()->error("GET {} returned HTTP {}", loggable_url(url),
                      res.status_code);
    throw HttpStatusError(static_cast<int>(res.status_code),
                          status_message("GET", res.status_code, res.body));
  }
  return res;
}

std::string CurlHttpClient::get(const std::string &url,
                                const std::vector<std::string> &headers) {
  HttpResponse res = get_with_headers(url, headers);
  if (res.status_code < 200 || res.status_code >= 300) {
    throw HttpStatusError(static_cast<int>(res.status_code),
                          status_message("GET", res.status_code, res.body));
  }
  return res.body;
}

HttpResponse CurlHttpClient::put(const std::string &url,
                                 const std::string &data,
                                 const std::vector<std::string> &headers) {
  CURL *curl = curl_.get();
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  prepare(curl, url, errbuf);
  curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, data.data());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                   static_cast<curl_off_t>(data.size()));
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  HttpResponse res = execute(curl, "PUT", url, headers, errbuf);
  if (res.status_code < 200 || res.status_code >= 300) {
    http_log()->error("PUT {} returned HTTP {}", loggable_url(url),
                      res.status_code);
    throw HttpStatusError(static_cast<int>(res.status_code),
                          status_message("PUT", res.status_code, res.body));
  }
  return res;
}

/**
 * Stream @p file as the request body. No overall timeout is applied so that
 * large archives are bounded by the connect timeout only.
 */
HttpResponse CurlHttpClient::put_file(const std::string &url,
                                      const std::filesystem::path &file,
                                      const std::vector<std::string> &headers) {
  std::error_code ec;
  auto size = std::filesystem::file_size(file, ec);
  if (ec) {
    throw std::runtime_error("Failed to stat " + file.string() + ": " +
                             ec.message());
  }
  std::unique_ptr<std::FILE, FileCloser> fp(std::fopen(file.c_str(), "rb"));
  if (!fp) {
    throw std::runtime_error("Failed to open " + file.string());
  }
  CURL *curl = curl_.get();
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  prepare(curl, url, errbuf);
  curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
  curl_easy_setopt(curl, CURLOPT_READDATA, fp.get());
  curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                   static_cast<curl_off_t>(size));
  HttpResponse res = execute(curl, "PUT", url, headers, errbuf);
  if (res.status_code < 200 || res.status_code >= 300) {
    http_log()->error("PUT {} returned HTTP {}", loggable_url(url),
                      res.status_code);
    throw HttpStatusError(static_cast<int>(res.status_code),
                          status_message("PUT", res.status_code, res.body));
  }
  http_log()->debug("Uploaded {} bytes to {}", size, loggable_url(url));
  return res;
}

HttpResponse CurlHttpClient::head(const std::string &url,
                                  const std::vector<std::string> &headers) {
  CURL *curl = curl_.get();
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  prepare(curl, url, errbuf);
  curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  HttpResponse res = execute(curl, "HEAD", url, headers, errbuf);
  if (res.status_code >= 500) {
    http_log()->error("HEAD {} returned HTTP {}", loggable_url(url),
                      res.status_code);
    throw HttpStatusError(static_cast<int>(res.status_code),
                          status_message("HEAD", res.status_code, {}));
  }
  return res;
}

HttpResponse CurlHttpClient::post(const std::string &url,
                                  const std::string &data,
                                  const std::vector<std::string> &headers) {
  CURL *curl = curl_.get();
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  prepare(curl, url, errbuf);
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, data.data());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                   static_cast<curl_off_t>(data.size()));
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  HttpResponse res = execute(curl, "POST", url, headers, errbuf);
  if (res.status_code < 200 || res.status_code >= 300) {
    http_log()->error("POST {} returned HTTP {}", loggable_url(url),
                      res.status_code);
    throw HttpStatusError(static_cast<int>(res.status_code),
                          status_message("POST", res.status_code, res.body));
  }
  return res;
}

HttpResponse CurlHttpClient::del(const std::string &url,
                                 const std::vector<std::string> &headers) {
  CURL *curl = curl_.get();
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  prepare(curl, url, errbuf);
  curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  HttpResponse res = execute(curl, "DELETE", url, headers, errbuf);
  if (res.status_code < 200 || res.status_code >= 300) {
    http_log()->error("DELETE {} returned HTTP {}", loggable_url(url),
                      res.status_code);
    throw HttpStatusError(static_cast<int>(res.status_code),
                          status_message("DELETE", res.status_code, res.body));
  }
  return res;
}

namespace {
/**
 * HTTP client wrapper that retries requests with exponential backoff.
 */
class RetryHttpClient : public HttpClient {
public:
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

  HttpResponse put(const std::string &url, const std::string &data,
                   const std::vector<std::string> &headers) override {
    return request([&] { return inner_->put(url, data, headers); });
  }

  HttpResponse put_file(const std::string &url,
                        const std::filesystem::path &file,
                        const std::vector<std::string> &headers) override {
    return request([&] { return inner_->put_file(url, file, headers); });
  }

  HttpResponse head(const std::string &url,
                    const std::vector<std::string> &headers) override {
    return request([&] { return inner_->head(url, headers); });
  }

  HttpResponse post(const std::string &url, const std::string &data,
                    const std::vector<std::string> &headers) override {
    return request([&] { return inner_->post(url, data, headers); });
  }

  HttpResponse del(const std::string &url,
                   const std::vector<std::string> &headers) override {
    return request([&] { return inner_->del(url, headers); });
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
        http_log()->warn("Transient HTTP failure (attempt {}/{}): {}",
                         attempt + 1, max_retries_, e.what());
        // Exponential backoff: 2^attempt * backoff_ms between retries.
        std::this_thread::sleep_for(
            std::chrono::milliseconds(backoff_ms_ * (1 << attempt)));
        ++attempt;
      }
    }
  }

  bool is_transient(const std::exception &e) const {
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
} // namespace

std::unique_ptr<HttpClient> make_retrying_client(std::unique_ptr<HttpClient> inner,
                                                 int max_retries,
                                                 int backoff_ms) {
  return std::make_unique<RetryHttpClient>(std::move(inner), max_retries,
                                           backoff_ms);
}

} // namespace omb
