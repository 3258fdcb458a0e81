#include "archive_producer.hpp"
#include "errors.hpp"
#include "fakes.hpp"
#include "process.hpp"
#include "work_dir.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <memory>

using namespace omb;
using namespace omb::test;

TEST_CASE("git mirror archiver clones then packages") {
  auto runner = std::make_shared<FakeProcessRunner>();
  GitMirrorArchiver archiver("s3cr3t", runner);
  ScopedWorkDir dir;

  auto artifact = archiver.produce(make_repo("demo"), dir.path());
  REQUIRE(artifact.path == dir.path() / "demo.tar.gz");
  REQUIRE(artifact.size_bytes == 7);
  REQUIRE(artifact.default_branch == "main");

  REQUIRE(runner->commands.size() == 2);
  const auto &clone = runner->commands[0];
  REQUIRE(clone == std::vector<std::string>{
                       "git", "clone", "--mirror",
                       "https://github.com/QuantEcon/demo.git",
                       (dir.path() / "demo").string()});
  REQUIRE(runner->commands[1] ==
          std::vector<std::string>{"tar", "-czf",
                                   (dir.path() / "demo.tar.gz").string(), "-C",
                                   dir.path().string(), "demo"});
}

TEST_CASE("git mirror archiver passes the token as a git config header") {
  auto runner = std::make_shared<FakeProcessRunner>();
  GitMirrorArchiver archiver("s3cr3t", runner);
  ScopedWorkDir dir;
  archiver.produce(make_repo("demo"), dir.path());

  for (const auto &command : runner->commands) {
    for (const auto &arg : command) {
      REQUIRE(arg.find("s3cr3t") == std::string::npos);
      REQUIRE(arg.find("x-access-token") == std::string::npos);
    }
  }
  // base64("x-access-token:s3cr3t")
  REQUIRE(runner->environments[0] ==
          std::vector<std::string>{
              "GIT_TERMINAL_PROMPT=0", "GIT_CONFIG_COUNT=1",
              "GIT_CONFIG_KEY_0=http.extraHeader",
              "GIT_CONFIG_VALUE_0=Authorization: Basic "
              "eC1hY2Nlc3MtdG9rZW46czNjcjN0"});
  REQUIRE(runner->environments[1].empty());

  auto anonymous = std::make_shared<FakeProcessRunner>();
  GitMirrorArchiver no_token("", anonymous);
  no_token.produce(make_repo("demo"), dir.path());
  REQUIRE(anonymous->environments[0] ==
          std::vector<std::string>{"GIT_TERMINAL_PROMPT=0"});
}

TEST_CASE("git mirror archiver keeps tokens out of errors") {
  auto runner = std::make_shared<FakeProcessRunner>();
  runner->results["git"] = {
      128, "fatal: token s3cr3t rejected; header Basic "
           "eC1hY2Nlc3MtdG9rZW46czNjcjN0 sent"};
  GitMirrorArchiver archiver("s3cr3t", runner);
  ScopedWorkDir dir;
  try {
    archiver.produce(make_repo("private-repo"), dir.path());
    FAIL("expected ArchiveError");
  } catch (const ArchiveError &e) {
    std::string msg = e.what();
    REQUIRE(msg.find("s3cr3t") == std::string::npos);
    REQUIRE(msg.find("eC1hY2Nlc3MtdG9rZW46czNjcjN0") == std::string::npos);
    REQUIRE(msg.find("token *** rejected; header Basic *** sent") !=
            std::string::npos);
    REQUIRE(msg.find("QuantEcon/private-repo") != std::string::npos);
  }
  REQUIRE(runner->commands.size() == 1);
}

TEST_CASE("git mirror archiver reports packaging failures") {
  auto runner = std::make_shared<FakeProcessRunner>();
  runner->results["tar"] = {2, "tar: disk full"};
  GitMirrorArchiver archiver("", runner);
  ScopedWorkDir dir;
  REQUIRE_THROWS_AS(archiver.produce(make_repo("demo"), dir.path()),
                    ArchiveError);
  REQUIRE(runner->commands[0][3] == "https://github.com/QuantEcon/demo.git");

  auto silent = std::make_shared<FakeProcessRunner>();
  silent->create_outputs = false;
  GitMirrorArchiver no_output("", silent);
  REQUIRE_THROWS_AS(no_output.produce(make_repo("demo"), dir.path()),
                    ArchiveError);

  RepositoryDescriptor no_url = make_repo("demo");
  no_url.clone_url.clear();
  REQUIRE_THROWS_AS(no_output.produce(no_url, dir.path()), ArchiveError);
}

TEST_CASE("spawn process runner captures exit status and stderr") {
  SpawnProcessRunner runner;
  auto ok = runner.run({"sh", "-c", "exit 0"});
  REQUIRE(ok.exit_code == 0);

  auto failed = runner.run({"sh", "-c", "echo broken >&2; exit 3"});
  REQUIRE(failed.exit_code == 3);
  REQUIRE(failed.error_output.find("broken") != std::string::npos);

  auto env = runner.run({"sh", "-c", "test \"$OMB_MARKER\" = yes"},
                        {"OMB_MARKER=yes"});
  REQUIRE(env.exit_code == 0);

  auto replaced = runner.run({"sh", "-c", "test \"$HOME\" = /nowhere"},
                             {"HOME=/nowhere"});
  REQUIRE(replaced.exit_code == 0);

  REQUIRE_THROWS_AS(runner.run({}), std::invalid_argument);
}

TEST_CASE("scoped work dir removes its contents") {
  std::filesystem::path kept;
  {
    ScopedWorkDir dir({}, "demo/repo");
    kept = dir.path();
    REQUIRE(std::filesystem::is_directory(kept));
    REQUIRE(kept.filename().string().rfind("demo_repo-", 0) == 0);
    std::filesystem::create_directories(kept / "nested" / "deeper");
    std::ofstream(kept / "nested" / "file.txt") << "data";
  }
  REQUIRE_FALSE(std::filesystem::exists(kept));

  ScopedWorkDir a;
  ScopedWorkDir b;
  REQUIRE(a.path() != b.path());
}
