#include "config.hpp"
#include "errors.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace omb;

TEST_CASE("config defaults") {
  Config cfg;
  REQUIRE_FALSE(cfg.backup_enabled());
  REQUIRE_FALSE(cfg.backup_issues());
  REQUIRE_FALSE(cfg.exclude_archived());
  REQUIRE(cfg.s3_region() == "us-east-1");
  REQUIRE(cfg.s3_prefix() == "backups/");
  REQUIRE(cfg.api_base() == "https://api.github.com");
  REQUIRE(cfg.http_timeout() == 30);
  REQUIRE(cfg.http_retries() == 3);
  REQUIRE(cfg.log_level() == "info");
  REQUIRE(cfg.history_db().empty());
}

TEST_CASE("config loads yaml") {
  {
    std::ofstream f("omb_cfg.yaml");
    f << "backup:\n";
    f << "  enabled: true\n";
    f << "  organization: QuantEcon\n";
    f << "  patterns:\n";
    f << "    - \"lecture-.*\"\n";
    f << "    - \".*\\\\.notes\"\n";
    f << "  repositories:\n";
    f << "    - QuantEcon.py\n";
    f << "  exclude_archived: true\n";
    f << "  exclude_patterns:\n";
    f << "    - \".*-wasm\"\n";
    f << "  exclude_repositories:\n";
    f << "    - lecture-old\n";
    f << "  backup_metadata:\n";
    f << "    issues: true\n";
    f << "  s3:\n";
    f << "    bucket: qe-backups\n";
    f << "    region: ap-southeast-2\n";
    f << "    prefix: github/\n";
    f << "logging:\n";
    f << "  log_level: debug\n";
    f << "  log_rotate: 7\n";
    f << "  log_categories:\n";
    f << "    s3: trace\n";
    f << "http:\n";
    f << "  http_timeout: 60\n";
    f << "  http_retries: 5\n";
    f << "history:\n";
    f << "  history_db: catalog.db\n";
  }
  Config cfg = Config::from_file("omb_cfg.yaml");
  REQUIRE(cfg.backup_enabled());
  REQUIRE(cfg.organization() == "QuantEcon");
  REQUIRE(cfg.patterns() ==
          std::vector<std::string>{"lecture-.*", ".*\\.notes"});
  REQUIRE(cfg.repositories() == std::vector<std::string>{"QuantEcon.py"});
  REQUIRE(cfg.exclude_archived());
  REQUIRE(cfg.exclude_patterns() == std::vector<std::string>{".*-wasm"});
  REQUIRE(cfg.exclude_repositories() ==
          std::vector<std::string>{"lecture-old"});
  REQUIRE(cfg.backup_issues());
  REQUIRE(cfg.s3_bucket() == "qe-backups");
  REQUIRE(cfg.s3_region() == "ap-southeast-2");
  REQUIRE(cfg.s3_prefix() == "github/");
  REQUIRE(cfg.s3_endpoint().empty());
  REQUIRE(cfg.log_level() == "debug");
  REQUIRE(cfg.log_rotate() == 7);
  REQUIRE(cfg.log_categories().at("s3") == "trace");
  REQUIRE(cfg.http_timeout() == 60);
  REQUIRE(cfg.http_retries() == 5);
  REQUIRE(cfg.history_db() == "catalog.db");
  REQUIRE_NOTHROW(cfg.validate());

  auto location = cfg.s3_location();
  REQUIRE(location.bucket == "qe-backups");
  REQUIRE(location.region == "ap-southeast-2");
  std::remove("omb_cfg.yaml");
}

TEST_CASE("config loads json and toml") {
  {
    std::ofstream f("omb_cfg.json");
    f << R"({"backup":{"organization":"QuantEcon","s3":{"bucket":"b",
            "endpoint":"http://localhost:9000"}},"log_level":"warn",
            "work_dir":"/tmp/omb"})";
  }
  Config json_cfg = Config::from_file("omb_cfg.json");
  REQUIRE(json_cfg.organization() == "QuantEcon");
  REQUIRE(json_cfg.s3_endpoint() == "http://localhost:9000");
  REQUIRE(json_cfg.log_level() == "warn");
  REQUIRE(json_cfg.work_dir() == "/tmp/omb");
  std::remove("omb_cfg.json");

  {
    std::ofstream f("omb_cfg.toml");
    f << "[backup]\n";
    f << "enabled = true\n";
    f << "organization = \"QuantEcon\"\n";
    f << "patterns = [\"^lecture\"]\n";
    f << "[backup.s3]\n";
    f << "bucket = \"b\"\n";
    f << "[logging]\n";
    f << "log_compress = true\n";
  }
  Config toml_cfg = Config::from_file("omb_cfg.toml");
  REQUIRE(toml_cfg.backup_enabled());
  REQUIRE(toml_cfg.patterns() == std::vector<std::string>{"^lecture"});
  REQUIRE(toml_cfg.s3_bucket() == "b");
  REQUIRE(toml_cfg.log_compress());
  std::remove("omb_cfg.toml");
}

TEST_CASE("config treats null lists as empty") {
  {
    std::ofstream f("omb_null.yml");
    f << "backup:\n";
    f << "  organization: QuantEcon\n";
    f << "  patterns:\n";
    f << "  exclude_repositories: ~\n";
    f << "  repositories: single\n";
  }
  Config cfg = Config::from_file("omb_null.yml");
  REQUIRE(cfg.patterns().empty());
  REQUIRE(cfg.exclude_repositories().empty());
  REQUIRE(cfg.repositories() == std::vector<std::string>{"single"});
  std::remove("omb_null.yml");
}

TEST_CASE("config rejects malformed values") {
  nlohmann::json bad_list = {{"backup", {{"patterns", {{"a", 1}}}}}};
  REQUIRE_THROWS_AS(Config::from_json(bad_list), ConfigurationError);
  nlohmann::json bad_item = {{"backup", {{"repositories", {"demo", true}}}}};
  REQUIRE_THROWS_AS(Config::from_json(bad_item), ConfigurationError);

  nlohmann::json bad_type = {{"backup", {{"enabled", "maybe"}}}};
  REQUIRE_THROWS_AS(Config::from_json(bad_type), ConfigurationError);

  REQUIRE_THROWS_AS(Config::from_file("config.ini"), ConfigurationError);
  REQUIRE_THROWS_AS(Config::from_file("no_extension"), ConfigurationError);
  REQUIRE_THROWS_AS(Config::from_file("does_not_exist.yml"),
                    ConfigurationError);
  REQUIRE_THROWS_AS(Config::from_file("does_not_exist.json"),
                    ConfigurationError);
}

TEST_CASE("config validation") {
  Config cfg;
  REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);
  cfg.set_s3_bucket("bucket");
  REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);
  cfg.set_organization("QuantEcon");
  REQUIRE_NOTHROW(cfg.validate());

  cfg.set_http_timeout(0);
  REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);
  cfg.set_http_timeout(10);
  cfg.set_http_retries(-1);
  REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);
  cfg.set_http_retries(0);

  cfg.set_patterns({"lecture-("});
  REQUIRE_THROWS_AS(cfg.validate(), ConfigurationError);
  cfg.set_patterns({"lecture-.*"});
  cfg.set_exclude_repositories({"lecture-old"});
  RepositoryMatcher matcher(cfg.to_rule_set());
  REQUIRE(matcher.is_included("lecture-python"));
  REQUIRE(matcher.is_excluded("lecture-old"));
  REQUIRE_FALSE(matcher.is_included("QuantEcon.py"));
}

TEST_CASE("config keeps numeric repository names") {
  {
    std::ofstream f("omb_numeric.yml");
    f << "backup:\n";
    f << "  repositories: [2048, 007, \"0042\", lecture-python]\n";
    f << "  exclude_repositories: 1984\n";
    f << "  patterns:\n";
    f << "    - 3.14\n";
  }
  try {
    Config::from_file("omb_numeric.yml");
    FAIL("expected ConfigurationError");
  } catch (const ConfigurationError &e) {
    std::string msg = e.what();
    REQUIRE(msg.find("'patterns'") != std::string::npos);
    REQUIRE(msg.find("quote") != std::string::npos);
  }
  {
    std::ofstream f("omb_numeric.yml");
    f << "backup:\n";
    f << "  repositories: [2048, 007, \"0042\", lecture-python]\n";
    f << "  exclude_repositories: 1984\n";
    f << "  s3:\n";
    f << "    bucket: qe-backups\n";
  }
  Config cfg = Config::from_file("omb_numeric.yml");
  REQUIRE(cfg.repositories() ==
          std::vector<std::string>{"2048", "007", "0042", "lecture-python"});
  REQUIRE(cfg.exclude_repositories() == std::vector<std::string>{"1984"});
  std::remove("omb_numeric.yml");
}
