#include "app.hpp"
#include "archive_producer.hpp"
#include "backup_orchestrator.hpp"
#include "errors.hpp"
#include "github_client.hpp"
#include "history.hpp"
#include "http_client.hpp"
#include "log.hpp"
#include "report_builder.hpp"
#include "s3_object_store.hpp"
#include "storage_gateway.hpp"
#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace omb {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

std::string get_env_var(const char *name) {
  const char *env = std::getenv(name);
  return env ? std::string(env) : std::string();
}

const std::string kRule(60, '=');
} // namespace

std::vector<std::string> summarize_cycle(const CycleResult &cycle) {
  std::vector<std::string> lines;
  lines.push_back(kRule);
  if (cycle.dry_run) {
    auto pending = cycle.would_backup();
    lines.push_back("DRY RUN Results:");
    lines.push_back("Total repositories matched: " +
                    std::to_string(cycle.total()));
    lines.push_back("Would backup: " + std::to_string(pending.size()));
    lines.push_back("Already exist (would skip): " +
                    std::to_string(cycle.skipped() - pending.size()));
    lines.push_back(kRule);
    if (!pending.empty()) {
      lines.push_back("Repositories that would be backed up:");
      for (const BackupRecord *record : pending) {
        lines.push_back("  - " + record->repository + " -> " +
                        record->storage_key);
      }
    }
    return lines;
  }
  lines.push_back("Backup Results:");
  lines.push_back("Total repositories: " + std::to_string(cycle.total()));
  lines.push_back("Successful: " + std::to_string(cycle.successful()));
  lines.push_back("Failed: " + std::to_string(cycle.failed()));
  lines.push_back("Skipped: " + std::to_string(cycle.skipped()));
  if (std::size_t issues_failed = cycle.issue_export_failures()) {
    lines.push_back("Issue exports failed: " + std::to_string(issues_failed));
  }
  lines.push_back(kRule);
  if (cycle.has_failures()) {
    lines.push_back("Failed repositories:");
    for (const auto &record : cycle.records) {
      if (record.status == BackupStatus::Failed && record.error) {
        lines.push_back("  - [" + to_string(*record.error) + "] " +
                        record.repository + ": " + record.error_message);
      }
      if (record.issues.status == IssueExportStatus::Failed &&
          record.issues.error) {
        lines.push_back("  - [" + to_string(*record.issues.error) + "] " +
                        record.repository + " (issues): " +
                        record.issues.error_message);
      }
    }
  }
  return lines;
}

void App::apply_overrides() {
  if (!options_.organization.empty()) {
    config_.set_organization(options_.organization);
  }
  if (!options_.log_file.empty()) {
    config_.set_log_file(options_.log_file);
  }
  if (options_.log_rotate_explicit) {
    config_.set_log_rotate(options_.log_rotate);
  }
  if (options_.log_compress) {
    config_.set_log_compress(true);
  }
  if (!options_.log_categories.empty()) {
    auto categories = config_.log_categories();
    for (const auto &[name, level] : options_.log_categories) {
      categories[name] = level;
    }
    config_.set_log_categories(categories);
  }
  if (!options_.history_db.empty()) {
    config_.set_history_db(options_.history_db);
  }
}

void App::setup_logging() {
  // --log-level wins, then --verbose, then the configured level.
  std::string level_str = config_.log_level();
  if (options_.verbose) {
    level_str = "debug";
  }
  if (!options_.log_level.empty()) {
    level_str = options_.log_level;
  }
  spdlog::level::level_enum lvl =
      parse_log_level(level_str, spdlog::level::info);
  init_logger(lvl, config_.log_pattern(), config_.log_file(),
              static_cast<std::size_t>(config_.log_rotate()),
              config_.log_compress());
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, level] : config_.log_categories()) {
    category_levels[category] = parse_log_level(level, lvl);
  }
  configure_log_categories(category_levels);
  if (options_.verbose) {
    app_log()->debug("Verbose mode enabled");
  }
}

std::shared_ptr<StorageGateway> App::make_storage() const {
  std::optional<AwsSigningConfig> signing;
  std::string access_key = get_env_var("AWS_ACCESS_KEY_ID");
  std::string secret_key = get_env_var("AWS_SECRET_ACCESS_KEY");
  if (!access_key.empty() && !secret_key.empty()) {
    AwsSigningConfig cfg;
    cfg.access_key_id = access_key;
    cfg.secret_access_key = secret_key;
    cfg.session_token = get_env_var("AWS_SESSION_TOKEN");
    cfg.region = config_.s3_region();
    signing = cfg;
  } else {
    app_log()->warn("AWS credentials not set; S3 requests are unsigned");
  }
  long timeout_ms = static_cast<long>(config_.http_timeout()) * 1000;
  auto http = make_retrying_client(
      std::make_unique<CurlHttpClient>(timeout_ms, signing),
      config_.http_retries());
  auto store =
      std::make_shared<S3ObjectStore>(config_.s3_location(), std::move(http));
  return std::make_shared<StorageGateway>(store, config_.s3_prefix());
}

void App::record_history(const CycleResult &cycle) {
  if (config_.history_db().empty() || cycle.dry_run) {
    return;
  }
  try {
    BackupHistory history(config_.history_db());
    history.append(cycle);
  } catch (const std::exception &e) {
    app_log()->error("Failed to record backup history: {}", e.what());
  }
}

void App::export_history() {
  if (options_.export_csv.empty() && options_.export_json.empty()) {
    return;
  }
  if (config_.history_db().empty()) {
    app_log()->warn("History export requested but no history_db configured");
    return;
  }
  BackupHistory history(config_.history_db());
  if (!options_.export_csv.empty()) {
    history.export_csv(options_.export_csv);
    app_log()->info("Exported backup history to {}", options_.export_csv);
  }
  if (!options_.export_json.empty()) {
    history.export_json(options_.export_json);
    app_log()->info("Exported backup history to {}", options_.export_json);
  }
}

int App::run_backup() {
  if (!config_.backup_enabled()) {
    app_log()->warn("Backup is not enabled in configuration");
    return 0;
  }
  config_.validate();

  auto hosting = std::make_shared<GitHubClient>(
      options_.github_tokens, nullptr, config_.http_timeout() * 1000,
      config_.http_retries(), config_.api_base());
  auto archiver =
      std::make_shared<GitMirrorArchiver>(options_.github_tokens.front());
  BackupOrchestrator orchestrator(hosting,
                                  RepositoryMatcher(config_.to_rule_set()),
                                  archiver, make_storage(),
                                  category_logger("backup"));

  CycleOptions cycle_options;
  cycle_options.organization = config_.organization();
  cycle_options.force = options_.force;
  cycle_options.dry_run = options_.dry_run;
  cycle_options.export_issues = config_.backup_issues();
  cycle_options.work_root = config_.work_dir();

  CycleResult cycle = orchestrator.run_cycle(cycle_options);
  for (const auto &line : summarize_cycle(cycle)) {
    if (!cycle.dry_run && cycle.has_failures() &&
        line.rfind("  - [", 0) == 0) {
      app_log()->error("{}", line);
    } else {
      app_log()->info("{}", line);
    }
  }
  record_history(cycle);
  return cycle.has_failures() ? 1 : 0;
}

int App::run_report() {
  config_.validate();
  auto hosting = std::make_shared<GitHubClient>(
      options_.github_tokens, nullptr, config_.http_timeout() * 1000,
      config_.http_retries(), config_.api_base());
  RepositoryMatcher matcher(config_.to_rule_set());
  auto repos = matcher.select(hosting->list_repositories(config_.organization()));

  ReportBuilder builder(make_storage());
  BackupReport report = builder.build(config_.organization(), repos);
  for (const auto &line : render_text(report)) {
    app_log()->info("{}", line);
  }
  std::cout << render_issue_export_summary(
      group_issue_exports_by_month(report),
      BackupDate::from_time_point(std::chrono::system_clock::now()));
  return 0;
}

/**
 * Execute the main application flow.
 *
 * Parses the command line, loads the configuration, initializes logging and
 * dispatches to the selected task. Configuration and listing errors end the
 * run with exit code 1.
 *
 * @param argc Argument count passed from @c main().
 * @param argv Argument vector passed from @c main().
 * @return Process exit code.
 */
int App::run(int argc, char **argv) {
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    return exit.exit_code();
  }

  try {
    config_ = Config::from_file(options_.config_file);
  } catch (const ConfigurationError &e) {
    app_log()->error("{}", e.what());
    return 1;
  }
  apply_overrides();
  setup_logging();

  if (options_.dry_run) {
    app_log()->info("Dry run mode enabled");
  }
  if (options_.github_tokens.empty()) {
    app_log()->error("GITHUB_TOKEN environment variable not set");
    return 1;
  }

  int code = 0;
  const char *task = options_.task == Task::Backup ? "Backup" : "Report";
  try {
    code = options_.task == Task::Backup ? run_backup() : run_report();
  } catch (const BackupError &e) {
    app_log()->error("{} task failed ({}): {}", task, to_string(e.kind()),
                     e.what());
    return 1;
  } catch (const std::exception &e) {
    app_log()->error("{} task failed: {}", task, e.what());
    return 1;
  }

  try {
    export_history();
  } catch (const std::exception &e) {
    app_log()->error("History export failed: {}", e.what());
    return 1;
  }
  return code;
}

} // namespace omb
