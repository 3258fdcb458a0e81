#include "cli.hpp"
#include "log.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <cstdlib>
#include <iostream>
#include <map>
#include <sstream>
#include <string_view>

#include <spdlog/spdlog.h>

namespace omb {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 15> categories = {
      "app",     "archive", "backup", "cli",     "config",
      "github.client", "history", "http", "issues", "logging",
      "process", "report",  "s3",     "storage", "workdir"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., "
         "storage=debug).";
  oss << " Configuration files accept the same mapping under 'log_categories'.";
  return oss.str();
}

std::string get_env_var(const char *name) {
  const char *env = std::getenv(name);
  return env ? std::string(env) : std::string();
}
} // namespace

/**
 * Parse command line arguments using CLI11.
 *
 * @param argc Argument count provided to @c main().
 * @param argv Argument vector provided to @c main().
 * @return Fully populated CLI options.
 */
CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"orgmirrorbackup: mirror organization repositories to S3"};
  app.footer(log_category_help_text());
  CliOptions options;

  const std::map<std::string, Task> tasks{{"backup", Task::Backup},
                                          {"report", Task::Report}};
  app.add_option("-t,--task", options.task, "Task to run (backup or report)")
      ->transform(CLI::CheckedTransformer(tasks, CLI::ignore_case))
      ->type_name("TASK")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file")
      ->type_name("FILE")
      ->default_val("config.yml")
      ->group("General");
  app.add_option("-o,--organization", options.organization,
                 "Organization to back up (overrides the config file)")
      ->type_name("ORG")
      ->group("General");
  app.add_flag("-f,--force", options.force,
               "Create a new backup even if one exists for today")
      ->group("General");
  app.add_flag("-D,--dry-run", options.dry_run,
               "List what would be backed up without doing anything")
      ->group("General");
  app.add_flag("-v,--verbose", options.verbose, "Enable verbose output")
      ->group("General");
  app.add_option("-k,--github-token", options.github_tokens,
                 "GitHub token (repeat to rotate between several)")
      ->type_name("TOKEN")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::size_t) {
           std::cout << "orgmirrorbackup " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  app.add_option(
         "-G,--log-level", options.log_level,
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to rotating log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<int>(
         "--log-rotate",
         [&options](int value) {
           if (value < 0) {
             throw CLI::ValidationError("--log-rotate",
                                        "rotation count must be non-negative");
           }
           options.log_rotate = value;
           options.log_rotate_explicit = true;
         },
         "Number of rotated log files to retain (0 disables rotation)")
      ->type_name("N")
      ->group("Logging");
  app.add_flag("--log-compress", options.log_compress,
               "Compress rotated log files")
      ->group("Logging");
  app.add_option_function<std::string>(
         "--log-category",
         [&options](const std::string &value) {
           auto pos = value.find('=');
           std::string name =
               pos == std::string::npos ? value : value.substr(0, pos);
           std::string level = pos == std::string::npos ? std::string{"debug"}
                                                        : value.substr(pos + 1);
           if (name.empty()) {
             throw CLI::ValidationError("--log-category",
                                        "category name must not be empty");
           }
           if (level.empty()) {
             level = "debug";
           }
           options.log_categories[name] = level;
         },
         "Enable a logging category (NAME or NAME=LEVEL). See help footer for "
         "available categories.")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");
  app.add_option("--history-db", options.history_db,
                 "SQLite catalog recording every backup record")
      ->type_name("FILE")
      ->group("History");
  app.add_option("--export-csv", options.export_csv,
                 "Export the backup catalog to CSV")
      ->type_name("FILE")
      ->group("History");
  app.add_option("--export-json", options.export_json,
                 "Export the backup catalog to JSON")
      ->type_name("FILE")
      ->group("History");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }

  if (options.github_tokens.empty()) {
    auto env = get_env_var("GITHUB_TOKEN");
    if (!env.empty()) {
      options.github_tokens.emplace_back(env);
    }
  }
  cli_log()->debug("CLI parsed: task={} config={} force={} dry_run={}",
                   options.task == Task::Backup ? "backup" : "report",
                   options.config_file, options.force, options.dry_run);
  return options;
}

} // namespace omb
