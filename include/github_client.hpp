#ifndef ORGMIRRORBACKUP_GITHUB_CLIENT_HPP
#define ORGMIRRORBACKUP_GITHUB_CLIENT_HPP

#include "http_client.hpp"
#include "models.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace omb {

/**
 * Read-only view of the source-control host used by the backup cycle.
 *
 * Implementations exhaust pagination and raise HostingError on
 * authentication, network or rate limit failures.
 */
class HostingGateway {
public:
  virtual ~HostingGateway() = default;

  /// Every repository of @p organization, archived ones included.
  virtual std::vector<RepositoryDescriptor>
  list_repositories(const std::string &organization) = 0;

  /// All issues (open and closed) of @p full_name, pull requests excluded.
  virtual std::vector<IssueSummary>
  list_issues(const std::string &full_name) = 0;

  /// The comment thread of issue @p number in @p full_name.
  virtual std::vector<IssueComment> list_comments(const std::string &full_name,
                                                  int number) = 0;
};

/// Decode one entry of `/orgs/{org}/repos`.
RepositoryDescriptor parse_repository(const nlohmann::json &item);

/// Decode one entry of `/repos/{full}/issues`.
IssueSummary parse_issue(const nlohmann::json &item);

/// Decode one entry of `/repos/{full}/issues/{n}/comments`.
IssueComment parse_comment(const nlohmann::json &item);

/**
 * Extract the `rel="next"` target from the `Link` response header.
 *
 * @return Next page URL, empty when on the last page.
 */
std::string next_page_url(const std::vector<std::string> &headers);

/**
 * GitHub REST API implementation of HostingGateway.
 *
 * Requests are authenticated with the configured tokens. When a token hits
 * its rate limit (HTTP 403 or 429) the client rotates to the next token and
 * retries; once every token has been tried a HostingError is raised.
 */
class GitHubClient : public HostingGateway {
public:
  /**
   * Construct a GitHub API client.
   *
   * @param tokens Personal access tokens used for authenticated requests.
   * @param http Optional HTTP client implementation. A default CURL-backed
   *        implementation is constructed when `nullptr` is supplied.
   * @param timeout_ms HTTP request timeout in milliseconds for internally
   *        created HTTP clients.
   * @param max_retries Number of retry attempts for transient failures.
   * @param api_base Base URL for the GitHub API endpoints.
   * @param delay_ms Minimum delay between requests in milliseconds.
   */
  explicit GitHubClient(std::vector<std::string> tokens,
                        std::unique_ptr<HttpClient> http = nullptr,
                        int timeout_ms = 30000, int max_retries = 3,
                        std::string api_base = "https://api.github.com",
                        int delay_ms = 0);

  std::vector<RepositoryDescriptor>
  list_repositories(const std::string &organization) override;

  std::vector<IssueSummary> list_issues(const std::string &full_name) override;

  std::vector<IssueComment> list_comments(const std::string &full_name,
                                          int number) override;

  /// Base URL requests are issued against.
  const std::string &api_base() const { return api_base_; }

private:
  std::mutex mutex_;
  std::vector<std::string> tokens_;
  size_t token_index_{0};
  std::unique_ptr<HttpClient> http_;
  std::string api_base_;
  int delay_ms_;
  std::chrono::steady_clock::time_point last_request_{};

  std::vector<nlohmann::json> get_paginated(std::string url,
                                            const std::string &what);
  std::vector<std::string> request_headers();
  bool rotate_token(const HttpResponse &resp, size_t &rotations);
  void enforce_delay();
};

} // namespace omb

#endif // ORGMIRRORBACKUP_GITHUB_CLIENT_HPP
