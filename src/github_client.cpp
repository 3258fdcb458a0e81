/**
 * @file github_client.cpp
 * @brief GitHub REST implementation of the hosting gateway.
 */

#include "github_client.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <sstream>
#include <spdlog/spdlog.h>
#include <thread>

namespace omb {

namespace {

std::shared_ptr<spdlog::logger> github_client_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("github.client");
  }();
  return logger;
}

std::optional<std::string> optional_string(const nlohmann::json &item,
                                           const char *key) {
  auto it = item.find(key);
  if (it == item.end() || !it->is_string())
    return std::nullopt;
  return it->get<std::string>();
}

/// `login` of a nested user object such as `user` or `closed_by`.
std::optional<std::string> login_of(const nlohmann::json &item,
                                    const char *key) {
  auto it = item.find(key);
  if (it == item.end() || !it->is_object())
    return std::nullopt;
  return optional_string(*it, "login");
}

} // namespace

RepositoryDescriptor parse_repository(const nlohmann::json &item) {
  RepositoryDescriptor repo;
  repo.name = item.at("name").get<std::string>();
  repo.full_name = item.value("full_name", repo.name);
  repo.archived = item.value("archived", false);
  repo.default_branch = optional_string(item, "default_branch").value_or("");
  repo.clone_url = optional_string(item, "clone_url").value_or("");
  repo.is_private = item.value("private", false);
  return repo;
}

IssueSummary parse_issue(const nlohmann::json &item) {
  IssueSummary issue;
  issue.number = item.at("number").get<int>();
  issue.title = optional_string(item, "title").value_or("");
  issue.url = optional_string(item, "html_url").value_or("");
  issue.state = optional_string(item, "state").value_or("open");
  issue.author = login_of(item, "user");
  issue.created_at = optional_string(item, "created_at");
  issue.updated_at = optional_string(item, "updated_at");
  issue.closed_at = optional_string(item, "closed_at");
  issue.closed_by = login_of(item, "closed_by");
  if (auto it = item.find("labels"); it != item.end() && it->is_array()) {
    for (const auto &label : *it) {
      if (label.is_string()) {
        issue.labels.push_back(label.get<std::string>());
      } else if (auto name = optional_string(label, "name")) {
        issue.labels.push_back(*name);
      }
    }
  }
  if (auto it = item.find("milestone"); it != item.end() && it->is_object()) {
    issue.milestone = optional_string(*it, "title");
  }
  if (auto it = item.find("assignees"); it != item.end() && it->is_array()) {
    for (const auto &assignee : *it) {
      if (auto login = optional_string(assignee, "login")) {
        issue.assignees.push_back(*login);
      }
    }
  }
  issue.body = optional_string(item, "body").value_or("");
  return issue;
}

IssueComment parse_comment(const nlohmann::json &item) {
  IssueComment comment;
  comment.id = item.value("id", static_cast<std::int64_t>(0));
  comment.author = login_of(item, "user");
  comment.body = optional_string(item, "body").value_or("");
  comment.created_at = optional_string(item, "created_at");
  return comment;
}

std::string next_page_url(const std::vector<std::string> &headers) {
  std::string next_url;
  for (const auto &h : headers) {
    if (h.size() < 5)
      continue;
    std::string name = h.substr(0, 5);
    if (name != "Link:" && name != "link:")
      continue;
    std::stringstream ss(h.substr(5));
    std::string part;
    while (std::getline(ss, part, ',')) {
      if (part.find("rel=\"next\"") != std::string::npos) {
        auto start = part.find('<');
        auto end = part.find('>', start);
        if (start != std::string::npos && end != std::string::npos) {
          next_url = part.substr(start + 1, end - start - 1);
        }
      }
    }
  }
  return next_url;
}

GitHubClient::GitHubClient(std::vector<std::string> tokens,
                           std::unique_ptr<HttpClient> http, int timeout_ms,
                           int max_retries, std::string api_base, int delay_ms)
    : tokens_(std::move(tokens)),
      http_(make_retrying_client(
          http ? std::move(http) : std::make_unique<CurlHttpClient>(timeout_ms),
          max_retries, 100)),
      api_base_(std::move(api_base)), delay_ms_(delay_ms) {
  ensure_default_logger();
  while (!api_base_.empty() && api_base_.back() == '/') {
    api_base_.pop_back();
  }
}

std::vector<std::string> GitHubClient::request_headers() {
  std::vector<std::string> headers;
  std::scoped_lock lock(mutex_);
  if (!tokens_.empty()) {
    headers.push_back("Authorization: token " + tokens_[token_index_]);
  }
  headers.push_back("Accept: application/vnd.github+json");
  return headers;
}

/**
 * Rotate to the next token after a rate limit response.
 *
 * @return True when the request should be retried with another token.
 */
bool GitHubClient::rotate_token(const HttpResponse &resp, size_t &rotations) {
  if (resp.status_code != 403 && resp.status_code != 429)
    return false;
  std::scoped_lock lock(mutex_);
  if (tokens_.size() <= 1 || rotations + 1 >= tokens_.size()) {
    return false;
  }
  token_index_ = (token_index_ + 1) % tokens_.size();
  ++rotations;
  github_client_log()->warn(
      "Rate limit hit, switching to next token (index {})", token_index_);
  return true;
}

/**
 * Ensure the minimum delay between successive HTTP requests is respected.
 */
void GitHubClient::enforce_delay() {
  if (delay_ms_ <= 0)
    return;
  std::chrono::steady_clock::time_point last;
  {
    std::scoped_lock lock(mutex_);
    last = last_request_;
  }
  auto now = std::chrono::steady_clock::now();
  auto elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(now - last)
          .count();
  if (elapsed < delay_ms_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_ - elapsed));
  }
  std::scoped_lock lock(mutex_);
  last_request_ = std::chrono::steady_clock::now();
}

/**
 * Follow `Link` pagination from @p url and collect every array element.
 *
 * @throws HostingError On transport, HTTP or decoding failures.
 */
std::vector<nlohmann::json>
GitHubClient::get_paginated(std::string url, const std::string &what) {
  std::vector<nlohmann::json> items;
  size_t rotations = 0;
  while (!url.empty()) {
    enforce_delay();
    HttpResponse res;
    try {
      res = http_->get_with_headers(url, request_headers());
    } catch (const HttpStatusError &e) {
      github_client_log()->error("Listing {} failed: {}", what, e.what());
      throw HostingError("Failed to list " + what + ": " + e.what(), e.status);
    } catch (const std::exception &e) {
      github_client_log()->error("Listing {} failed: {}", what, e.what());
      throw HostingError("Failed to list " + what + ": " + e.what());
    }
    if (rotate_token(res, rotations))
      continue;
    if (res.status_code < 200 || res.status_code >= 300) {
      github_client_log()->error("HTTP GET {} failed with HTTP code {}", url,
                                 res.status_code);
      std::string reason = res.status_code == 403 || res.status_code == 429
                               ? "rate limit exceeded or access denied"
                               : "HTTP " + std::to_string(res.status_code);
      throw HostingError("Failed to list " + what + ": " + reason,
                         static_cast<int>(res.status_code));
    }
    nlohmann::json page;
    try {
      page = nlohmann::json::parse(res.body);
    } catch (const std::exception &e) {
      throw HostingError("Failed to parse " + what + ": " + e.what());
    }
    if (!page.is_array()) {
      throw HostingError("Unexpected response while listing " + what);
    }
    for (auto &item : page) {
      items.push_back(std::move(item));
    }
    url = next_page_url(res.headers);
  }
  return items;
}

std::vector<RepositoryDescriptor>
GitHubClient::list_repositories(const std::string &organization) {
  github_client_log()->info("Listing repositories of {}", organization);
  auto items = get_paginated(api_base_ + "/orgs/" + organization +
                                 "/repos?type=all&per_page=100",
                             "repositories of " + organization);
  std::vector<RepositoryDescriptor> repos;
  repos.reserve(items.size());
  for (const auto &item : items) {
    if (!item.contains("name"))
      continue;
    try {
      repos.push_back(parse_repository(item));
    } catch (const nlohmann::json::exception &e) {
      throw HostingError("Malformed repository entry: " +
                         std::string(e.what()));
    }
    github_client_log()->debug("Found repo {}", repos.back().full_name);
  }
  github_client_log()->info("Found {} repositories", repos.size());
  return repos;
}

std::vector<IssueSummary>
GitHubClient::list_issues(const std::string &full_name) {
  auto items = get_paginated(api_base_ + "/repos/" + full_name +
                                 "/issues?state=all&per_page=100",
                             "issues of " + full_name);
  std::vector<IssueSummary> issues;
  for (const auto &item : items) {
    // The issues endpoint also returns pull requests.
    if (item.contains("pull_request"))
      continue;
    try {
      issues.push_back(parse_issue(item));
    } catch (const nlohmann::json::exception &e) {
      throw HostingError("Malformed issue entry in " + full_name + ": " +
                         e.what());
    }
  }
  github_client_log()->debug("Fetched {} issues for {}", issues.size(),
                             full_name);
  return issues;
}

std::vector<IssueComment>
GitHubClient::list_comments(const std::string &full_name, int number) {
  auto items = get_paginated(api_base_ + "/repos/" + full_name + "/issues/" +
                                 std::to_string(number) +
                                 "/comments?per_page=100",
                             "comments of " + full_name + "#" +
                                 std::to_string(number));
  std::vector<IssueComment> comments;
  comments.reserve(items.size());
  for (const auto &item : items) {
    comments.push_back(parse_comment(item));
  }
  return comments;
}

} // namespace omb
