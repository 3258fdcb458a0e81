#ifndef ORGMIRRORBACKUP_HTTP_CLIENT_HPP
#define ORGMIRRORBACKUP_HTTP_CLIENT_HPP

#include <curl/curl.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace omb {

/**
 * Simple HTTP response container capturing body, headers, and status code.
 */
struct HttpResponse {
  std::string body;                 ///< Response body
  std::vector<std::string> headers; ///< Response headers
  long status_code = 0;             ///< HTTP status code
};

/**
 * Look up a response header by case-insensitive name.
 *
 * @return Trimmed header value or std::nullopt when absent.
 */
std::optional<std::string> find_header(const std::vector<std::string> &headers,
                                       const std::string &name);

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
   * Rate limit responses (403 and 429) are returned to the caller instead of
   * raising so that token rotation can be attempted.
   */
  virtual HttpResponse
  get_with_headers(const std::string &url,
                   const std::vector<std::string> &headers) {
    return {get(url, headers), {}, 200};
  }

  /**
   * Perform a HTTP PUT request with an in-memory body.
   *
   * @return Response body and headers.
   */
  virtual HttpResponse put(const std::string &url, const std::string &data,
                           const std::vector<std::string> &headers) = 0;

  /**
   * Perform a HTTP PUT request streaming the body from @p file.
   *
   * The base implementation reads the file into memory and delegates to
   * put().
   */
  virtual HttpResponse put_file(const std::string &url,
                                const std::filesystem::path &file,
                                const std::vector<std::string> &headers);

  /**
   * Perform a HTTP HEAD request.
   *
   * Client errors (4xx) are returned so that callers can treat 404 as
   * "absent"; server errors raise HttpStatusError.
   */
  virtual HttpResponse head(const std::string &url,
                            const std::vector<std::string> &headers) = 0;

  /**
   * Perform a HTTP POST request.
   *
   * The base implementation throws to signal unsupported transports.
   *
   * @throws HttpStatusError On non-success HTTP status codes.
   */
  virtual HttpResponse post(const std::string &url, const std::string &data,
                            const std::vector<std::string> &headers) {
    (void)url;
    (void)data;
    (void)headers;
    throw std::runtime_error("POST not implemented");
  }

  /**
   * Perform a HTTP DELETE request.
   *
   * The base implementation throws to signal unsupported transports.
   */
  virtual HttpResponse del(const std::string &url,
                           const std::vector<std::string> &headers) {
    (void)url;
    (void)headers;
    throw std::runtime_error("DELETE not implemented");
  }
};

/** Credentials and scope for AWS Signature Version 4 request signing. */
struct AwsSigningConfig {
  std::string access_key_id;
  std::string secret_access_key;
  std::string session_token; ///< Optional STS session token
  std::string region;
  std::string service{"s3"};
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
 * When a signing configuration is supplied every request is signed with
 * libcurl's built-in AWS SigV4 support.
 *
 * @note This class is not thread-safe; use one instance per thread or provide
 *       external synchronization.
 */
class CurlHttpClient : public HttpClient {
public:
  /**
   * Construct a CURL based HTTP client.
   *
   * @param timeout_ms Request timeout in milliseconds. Uploads use it as the
   *        connect timeout only.
   * @param signing Optional AWS SigV4 signing parameters.
   * @param user_agent Value of the `User-Agent` header.
   */
  explicit CurlHttpClient(long timeout_ms = 30000,
                          std::optional<AwsSigningConfig> signing = std::nullopt,
                          std::string user_agent = "orgmirrorbackup");

  std::string get(const std::string &url,
                  const std::vector<std::string> &headers) override;

  HttpResponse
  get_with_headers(const std::string &url,
                   const std::vector<std::string> &headers) override;

  HttpResponse put(const std::string &url, const std::string &data,
                   const std::vector<std::string> &headers) override;

  HttpResponse put_file(const std::string &url,
                        const std::filesystem::path &file,
                        const std::vector<std::string> &headers) override;

  HttpResponse head(const std::string &url,
                    const std::vector<std::string> &headers) override;

  HttpResponse post(const std::string &url, const std::string &data,
                    const std::vector<std::string> &headers) override;

  HttpResponse del(const std::string &url,
                   const std::vector<std::string> &headers) override;

  /// Total bytes downloaded so far.
  curl_off_t total_downloaded() const { return total_downloaded_; }

  /// Total bytes uploaded so far.
  curl_off_t total_uploaded() const { return total_uploaded_; }

  /// Whether requests are AWS SigV4 signed.
  bool signs_requests() const { return signing_.has_value(); }

private:
  void prepare(CURL *curl, const std::string &url, char *errbuf);
  void account(CURL *curl);
  HttpResponse execute(CURL *curl, const char *verb, const std::string &url,
                       const std::vector<std::string> &headers,
                       const char *errbuf);
  CurlHandle curl_;
  long timeout_ms_;
  std::optional<AwsSigningConfig> signing_;
  std::string user_agent_;
  curl_off_t total_downloaded_{0};
  curl_off_t total_uploaded_{0};
};

/**
 * Wrap @p inner so that transient failures (transport errors and HTTP 5xx)
 * are retried with exponential backoff of `backoff_ms * 2^attempt`.
 */
std::unique_ptr<HttpClient> make_retrying_client(std::unique_ptr<HttpClient> inner,
                                                 int max_retries,
                                                 int backoff_ms = 100);

} // namespace omb

#endif // ORGMIRRORBACKUP_HTTP_CLIENT_HPP
