#ifndef ORGMIRRORBACKUP_CONFIG_HPP
#define ORGMIRRORBACKUP_CONFIG_HPP

#include "repo_matcher.hpp"
#include "s3_object_store.hpp"

#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace omb {

/// Application configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /// Whether the backup task is enabled at all.
  bool backup_enabled() const { return backup_enabled_; }
  void set_backup_enabled(bool v) { backup_enabled_ = v; }

  /// Organization whose repositories are backed up.
  const std::string &organization() const { return organization_; }
  void set_organization(const std::string &org) { organization_ = org; }

  /// Regular expressions selecting repositories by name.
  const std::vector<std::string> &patterns() const { return patterns_; }
  void set_patterns(const std::vector<std::string> &p) { patterns_ = p; }

  /// Exact repository names to include.
  const std::vector<std::string> &repositories() const {
    return repositories_;
  }
  void set_repositories(const std::vector<std::string> &r) {
    repositories_ = r;
  }

  /// Skip archived repositories.
  bool exclude_archived() const { return exclude_archived_; }
  void set_exclude_archived(bool v) { exclude_archived_ = v; }

  /// Regular expressions removing repositories by name.
  const std::vector<std::string> &exclude_patterns() const {
    return exclude_patterns_;
  }
  void set_exclude_patterns(const std::vector<std::string> &p) {
    exclude_patterns_ = p;
  }

  /// Exact repository names to exclude.
  const std::vector<std::string> &exclude_repositories() const {
    return exclude_repositories_;
  }
  void set_exclude_repositories(const std::vector<std::string> &r) {
    exclude_repositories_ = r;
  }

  /// Export issue metadata alongside archives.
  bool backup_issues() const { return backup_issues_; }
  void set_backup_issues(bool v) { backup_issues_ = v; }

  /// S3 bucket receiving backups.
  const std::string &s3_bucket() const { return s3_bucket_; }
  void set_s3_bucket(const std::string &b) { s3_bucket_ = b; }

  /// AWS region of the bucket.
  const std::string &s3_region() const { return s3_region_; }
  void set_s3_region(const std::string &r) { s3_region_ = r; }

  /// Key prefix for every stored object.
  const std::string &s3_prefix() const { return s3_prefix_; }
  void set_s3_prefix(const std::string &p) { s3_prefix_ = p; }

  /// Optional S3-compatible endpoint override.
  const std::string &s3_endpoint() const { return s3_endpoint_; }
  void set_s3_endpoint(const std::string &e) { s3_endpoint_ = e; }

  /// Logging verbosity level.
  const std::string &log_level() const { return log_level_; }
  void set_log_level(const std::string &lvl) { log_level_ = lvl; }

  /// Log message pattern.
  const std::string &log_pattern() const { return log_pattern_; }
  void set_log_pattern(const std::string &p) { log_pattern_ = p; }

  /// Path to rotating log file.
  const std::string &log_file() const { return log_file_; }
  void set_log_file(const std::string &f) { log_file_ = f; }

  /// Number of rotated log files to keep (0 disables rotation).
  int log_rotate() const { return log_rotate_; }
  void set_log_rotate(int n) { log_rotate_ = n < 0 ? 0 : n; }

  /// Compress rotated log files.
  bool log_compress() const { return log_compress_; }
  void set_log_compress(bool v) { log_compress_ = v; }

  /// Per-category log level overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }
  void set_log_categories(
      const std::unordered_map<std::string, std::string> &categories) {
    log_categories_ = categories;
  }

  /// Base URL for the GitHub API.
  const std::string &api_base() const { return api_base_; }
  void set_api_base(const std::string &base) { api_base_ = base; }

  /// HTTP request timeout in seconds.
  int http_timeout() const { return http_timeout_; }
  void set_http_timeout(int t) { http_timeout_ = t; }

  /// Number of HTTP retry attempts.
  int http_retries() const { return http_retries_; }
  void set_http_retries(int r) { http_retries_ = r; }

  /// Parent directory of per-repository work areas.
  const std::string &work_dir() const { return work_dir_; }
  void set_work_dir(const std::string &d) { work_dir_ = d; }

  /// SQLite history catalog; disabled when empty.
  const std::string &history_db() const { return history_db_; }
  void set_history_db(const std::string &p) { history_db_ = p; }

  /**
   * Check the configuration for the `backup` and `report` tasks.
   *
   * @throws ConfigurationError When the bucket or organization is missing,
   *         a pattern does not compile, or a numeric setting is out of range.
   */
  void validate() const;

  /**
   * Compile the selection rules.
   *
   * @throws ConfigurationError When a pattern does not compile.
   */
  MatchRuleSet to_rule_set() const;

  /// Storage target described by the `s3` section.
  S3Location s3_location() const;

  /// Load configuration from the file at `path`.
  static Config from_file(const std::string &path);

  /// Build configuration from a JSON object.
  static Config from_json(const nlohmann::json &j);

  /// Populate this configuration from a JSON object.
  void load_json(const nlohmann::json &j);

private:
  bool backup_enabled_ = false;
  std::string organization_;
  std::vector<std::string> patterns_;
  std::vector<std::string> repositories_;
  bool exclude_archived_ = false;
  std::vector<std::string> exclude_patterns_;
  std::vector<std::string> exclude_repositories_;
  bool backup_issues_ = false;
  std::string s3_bucket_;
  std::string s3_region_ = "us-east-1";
  std::string s3_prefix_ = "backups/";
  std::string s3_endpoint_;
  std::string log_level_ = "info";
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_ = 3;
  bool log_compress_ = false;
  std::unordered_map<std::string, std::string> log_categories_;
  std::string api_base_ = "https://api.github.com";
  int http_timeout_ = 30;
  int http_retries_ = 3;
  std::string work_dir_;
  std::string history_db_;
};

} // namespace omb

#endif // ORGMIRRORBACKUP_CONFIG_HPP
