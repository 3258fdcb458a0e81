#include "app.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

using namespace omb;

namespace {

BackupRecord record(const std::string &name, BackupStatus status) {
  BackupRecord r;
  r.repository = "QuantEcon/" + name;
  r.name = name;
  r.backup_date = {2025, 12, 2};
  r.storage_key = "backups/" + name + "/" + name + "-20251202.tar.gz";
  r.status = status;
  return r;
}

int run_app(std::vector<std::string> args) {
  std::vector<char *> argv;
  static char prog[] = "orgmirrorbackup";
  argv.push_back(prog);
  for (auto &a : args)
    argv.push_back(a.data());
  App app;
  return app.run(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("cycle summary lists failures") {
  CycleResult cycle;
  cycle.organization = "QuantEcon";
  cycle.records.push_back(record("ok", BackupStatus::Success));
  auto broken = record("broken", BackupStatus::Failed);
  broken.error = ErrorKind::ArchiveError;
  broken.error_message = "git clone --mirror failed";
  cycle.records.push_back(broken);
  auto skipped = record("same-day", BackupStatus::Skipped);
  skipped.skip_reason = SkipReason::AlreadyExists;
  cycle.records.push_back(skipped);
  auto issues = record("issues", BackupStatus::Success);
  issues.issues.status = IssueExportStatus::Failed;
  issues.issues.error = ErrorKind::HostingError;
  issues.issues.error_message = "rate limit exceeded";
  cycle.records.push_back(issues);

  auto lines = summarize_cycle(cycle);
  REQUIRE(lines[0] == std::string(60, '='));
  REQUIRE(lines[1] == "Backup Results:");
  REQUIRE(lines[2] == "Total repositories: 4");
  REQUIRE(lines[3] == "Successful: 2");
  REQUIRE(lines[4] == "Failed: 1");
  REQUIRE(lines[5] == "Skipped: 1");
  REQUIRE(lines[6] == "Issue exports failed: 1");
  REQUIRE(lines[7] == std::string(60, '='));
  REQUIRE(lines[8] == "Failed repositories:");
  REQUIRE(lines[9] ==
          "  - [archive_error] QuantEcon/broken: git clone --mirror failed");
  REQUIRE(lines[10] ==
          "  - [hosting_error] QuantEcon/issues (issues): rate limit exceeded");
  REQUIRE(lines.size() == 11);
}

TEST_CASE("dry run summary lists pending repositories") {
  CycleResult cycle;
  cycle.dry_run = true;
  auto pending = record("demo", BackupStatus::Skipped);
  pending.skip_reason = SkipReason::DryRun;
  cycle.records.push_back(pending);
  auto exists = record("old", BackupStatus::Skipped);
  exists.skip_reason = SkipReason::AlreadyExists;
  cycle.records.push_back(exists);

  auto lines = summarize_cycle(cycle);
  REQUIRE(lines[1] == "DRY RUN Results:");
  REQUIRE(lines[2] == "Total repositories matched: 2");
  REQUIRE(lines[3] == "Would backup: 1");
  REQUIRE(lines[4] == "Already exist (would skip): 1");
  REQUIRE(lines[6] == "Repositories that would be backed up:");
  REQUIRE(lines[7] ==
          "  - QuantEcon/demo -> backups/demo/demo-20251202.tar.gz");
}

TEST_CASE("app exit codes") {
  unsetenv("GITHUB_TOKEN");
  REQUIRE(run_app({"--version"}) == 0);
  REQUIRE(run_app({"--task", "nonsense"}) != 0);
  REQUIRE(run_app({"--config", "omb_missing_config.yml"}) == 1);

  {
    std::ofstream f("omb_app_disabled.yml");
    f << "backup:\n  enabled: false\n  organization: QuantEcon\n";
  }
  REQUIRE(run_app({"-C", "omb_app_disabled.yml"}) == 1);
  REQUIRE(run_app({"-C", "omb_app_disabled.yml", "-k", "tok"}) == 0);
  std::remove("omb_app_disabled.yml");

  {
    std::ofstream f("omb_app_invalid.yml");
    f << "backup:\n  enabled: true\n  organization: QuantEcon\n";
  }
  REQUIRE(run_app({"-C", "omb_app_invalid.yml", "-k", "tok"}) == 1);
  REQUIRE(run_app({"-C", "omb_app_invalid.yml", "-k", "tok", "-t",
                   "report"}) == 1);
  std::remove("omb_app_invalid.yml");
}
