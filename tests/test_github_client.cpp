#include "errors.hpp"
#include "fakes.hpp"
#include "github_client.hpp"
#include <algorithm>
#include <chrono>
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

using namespace omb;
using omb::test::ScriptedHttpClient;

namespace {

bool has_header(const std::vector<std::string> &headers,
                const std::string &header) {
  return std::find(headers.begin(), headers.end(), header) != headers.end();
}

/// Fails every request with the configured exception.
class ThrowingHttpClient : public HttpClient {
public:
  int calls{0};
  int status{0}; ///< 0 raises TransientNetworkError

  std::string get(const std::string &url,
                  const std::vector<std::string> &headers) override {
    return get_with_headers(url, headers).body;
  }
  HttpResponse get_with_headers(const std::string &url,
                                const std::vector<std::string> &) override {
    ++calls;
    if (status == 0) {
      throw TransientNetworkError("connection reset: " + url);
    }
    throw HttpStatusError(status, "HTTP error " + std::to_string(status));
  }
  HttpResponse put(const std::string &, const std::string &,
                   const std::vector<std::string> &) override {
    throw std::logic_error("unused");
  }
  HttpResponse head(const std::string &,
                    const std::vector<std::string> &) override {
    throw std::logic_error("unused");
  }
};

} // namespace

TEST_CASE("github client lists organization repositories across pages") {
  auto http = std::make_unique<ScriptedHttpClient>();
  auto *raw = http.get();
  raw->get_responses = {
      {R"([{"name":"lecture-python","full_name":"QuantEcon/lecture-python",
            "archived":false,"default_branch":"main","private":false,
            "clone_url":"https://github.com/QuantEcon/lecture-python.git"}])",
       {"Link: <https://api.example.com/orgs/QuantEcon/repos?page=2>; "
        "rel=\"next\", <https://api.example.com/orgs/QuantEcon/repos?page=2>; "
        "rel=\"last\""},
       200},
      {R"([{"name":"old","full_name":"QuantEcon/old","archived":true,
            "private":true,"clone_url":"https://github.com/QuantEcon/old.git"}])",
       {},
       200}};
  GitHubClient client({"tok"}, std::move(http), 1000, 0,
                      "https://api.example.com/");

  auto repos = client.list_repositories("QuantEcon");
  REQUIRE(repos.size() == 2);
  REQUIRE(repos[0].name == "lecture-python");
  REQUIRE(repos[0].default_branch == "main");
  REQUIRE_FALSE(repos[0].archived);
  REQUIRE(repos[1].archived);
  REQUIRE(repos[1].is_private);
  REQUIRE(repos[1].default_branch.empty());

  REQUIRE(raw->requests.size() == 2);
  REQUIRE(raw->requests[0].url ==
          "https://api.example.com/orgs/QuantEcon/repos?type=all&per_page=100");
  REQUIRE(raw->requests[1].url ==
          "https://api.example.com/orgs/QuantEcon/repos?page=2");
  REQUIRE(has_header(raw->requests[0].headers, "Authorization: token tok"));
  REQUIRE(has_header(raw->requests[0].headers,
                     "Accept: application/vnd.github+json"));
}

TEST_CASE("github client skips pull requests when listing issues") {
  auto http = std::make_unique<ScriptedHttpClient>();
  auto *raw = http.get();
  raw->get_responses = {
      {R"([
        {"number":1,"title":"Bug","html_url":"https://github.com/o/r/issues/1",
         "state":"open","user":{"login":"alice"},"labels":[{"name":"bug"}],
         "assignees":[{"login":"bob"}],"milestone":{"title":"v1"},
         "body":null,"created_at":"2025-01-01T00:00:00Z"},
        {"number":2,"title":"PR","state":"open","pull_request":{"url":"x"}},
        {"number":3,"title":"Done","state":"closed","closed_by":{"login":"carol"},
         "closed_at":"2025-02-01T00:00:00Z","labels":[]}
      ])",
       {},
       200}};
  GitHubClient client({"tok"}, std::move(http), 1000, 0);

  auto issues = client.list_issues("o/r");
  REQUIRE(issues.size() == 2);
  REQUIRE(issues[0].number == 1);
  REQUIRE(issues[0].author == std::optional<std::string>("alice"));
  REQUIRE(issues[0].labels == std::vector<std::string>{"bug"});
  REQUIRE(issues[0].assignees == std::vector<std::string>{"bob"});
  REQUIRE(issues[0].milestone == std::optional<std::string>("v1"));
  REQUIRE(issues[0].body.empty());
  REQUIRE(issues[1].state == "closed");
  REQUIRE(issues[1].closed_by == std::optional<std::string>("carol"));
  REQUIRE_FALSE(issues[1].milestone.has_value());
  REQUIRE(raw->requests[0].url ==
          "https://api.github.com/repos/o/r/issues?state=all&per_page=100");
}

TEST_CASE("github client lists issue comments") {
  auto http = std::make_unique<ScriptedHttpClient>();
  auto *raw = http.get();
  raw->get_responses = {
      {R"([{"id":10,"user":{"login":"dave"},"body":"hi",
            "created_at":"2025-03-01T00:00:00Z"},
           {"id":11,"user":null,"body":null}])",
       {},
       200}};
  GitHubClient client({"tok"}, std::move(http), 1000, 0);
  auto comments = client.list_comments("o/r", 7);
  REQUIRE(comments.size() == 2);
  REQUIRE(comments[0].id == 10);
  REQUIRE(comments[0].author == std::optional<std::string>("dave"));
  REQUIRE_FALSE(comments[1].author.has_value());
  REQUIRE(comments[1].body.empty());
  REQUIRE(raw->requests[0].url ==
          "https://api.github.com/repos/o/r/issues/7/comments?per_page=100");
}

TEST_CASE("github client rotates tokens on rate limits") {
  auto http = std::make_unique<ScriptedHttpClient>();
  auto *raw = http.get();
  raw->get_responses = {{"{\"message\":\"rate limit\"}", {}, 403},
                        {"[]", {}, 200}};
  GitHubClient client({"first", "second"}, std::move(http), 1000, 0);
  REQUIRE(client.list_repositories("QuantEcon").empty());
  REQUIRE(raw->requests.size() == 2);
  REQUIRE(has_header(raw->requests[0].headers, "Authorization: token first"));
  REQUIRE(has_header(raw->requests[1].headers, "Authorization: token second"));
}

TEST_CASE("github client raises once every token is rate limited") {
  auto http = std::make_unique<ScriptedHttpClient>();
  auto *raw = http.get();
  raw->get_responses = {{"", {}, 429}, {"", {}, 429}, {"", {}, 429}};
  GitHubClient client({"first", "second"}, std::move(http), 1000, 0);
  try {
    client.list_issues("o/r");
    FAIL("expected HostingError");
  } catch (const HostingError &e) {
    REQUIRE(e.status() == 429);
    REQUIRE(std::string(e.what()).find("rate limit") != std::string::npos);
  }
  REQUIRE(raw->requests.size() == 2);
}

TEST_CASE("github client wraps transport and decoding failures") {
  auto failing = std::make_unique<ThrowingHttpClient>();
  auto *raw = failing.get();
  GitHubClient client({"tok"}, std::move(failing), 1000, 2);
  REQUIRE_THROWS_AS(client.list_repositories("QuantEcon"), HostingError);
  REQUIRE(raw->calls == 3);

  auto unauthorized = std::make_unique<ThrowingHttpClient>();
  unauthorized->status = 401;
  auto *raw_unauthorized = unauthorized.get();
  GitHubClient client2({"tok"}, std::move(unauthorized), 1000, 2);
  REQUIRE_THROWS_AS(client2.list_repositories("QuantEcon"), HostingError);
  REQUIRE(raw_unauthorized->calls == 1);

  auto garbage = std::make_unique<ScriptedHttpClient>();
  garbage->get_responses = {{"not json", {}, 200}};
  GitHubClient client3({"tok"}, std::move(garbage), 1000, 0);
  REQUIRE_THROWS_AS(client3.list_repositories("QuantEcon"), HostingError);
}

TEST_CASE("next_page_url reads the link header") {
  REQUIRE(next_page_url({"link: <https://x/y?page=3>; rel=\"next\""}) ==
          "https://x/y?page=3");
  REQUIRE(next_page_url({"Link: <https://x/y?page=1>; rel=\"prev\""}).empty());
  REQUIRE(next_page_url({}).empty());
}

TEST_CASE("parse_repository tolerates missing optional fields") {
  auto repo = parse_repository(nlohmann::json{{"name", "solo"}});
  REQUIRE(repo.full_name == "solo");
  REQUIRE_FALSE(repo.archived);
  REQUIRE(repo.clone_url.empty());
}

TEST_CASE("github client spaces out successive requests") {
  auto http = std::make_unique<ScriptedHttpClient>();
  http->get_responses = {
      {"[]", {"Link: <https://api.github.com/next>; rel=\"next\""}, 200},
      {"[]", {}, 200}};
  GitHubClient client({"tok"}, std::move(http), 1000, 0,
                      "https://api.github.com", 50);
  auto start = std::chrono::steady_clock::now();
  client.list_repositories("QuantEcon");
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::steady_clock::now() - start)
                     .count();
  REQUIRE(elapsed >= 50);
}
