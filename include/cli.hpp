/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for orgmirrorbackup.
 *
 * Declares CLI parsing helpers, option structures, and related exceptions for
 * the tool.
 */

#ifndef ORGMIRRORBACKUP_CLI_HPP
#define ORGMIRRORBACKUP_CLI_HPP

#include <exception>
#include <string>
#include <unordered_map>
#include <vector>

namespace omb {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Process exit code that should be returned to the caller.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/// Work performed by one invocation.
enum class Task { Backup, Report };

/**
 * Parsed command line options supplied via the CLI.
 *
 * `*_explicit` members record whether a flag was given so that the values
 * only override the configuration file when the user asked for it.
 */
struct CliOptions {
  Task task{Task::Backup};              ///< Selected task
  std::string config_file{"config.yml"}; ///< Path to configuration file
  std::string organization;             ///< Overrides `backup.organization`
  bool force{false};                    ///< Re-archive even if today exists
  bool dry_run{false};                  ///< List what would be backed up
  bool verbose{false};                  ///< Enables debug output
  std::string log_level;                ///< Explicit logging level
  std::string log_file;                 ///< Optional path to rotating log file
  int log_rotate{3}; ///< Number of rotated log files to keep (0 disables)
  bool log_rotate_explicit{false};   ///< True if CLI set log rotation count
  bool log_compress{false};          ///< Compress rotated log files
  std::unordered_map<std::string, std::string>
      log_categories;                ///< Category -> level overrides
  std::string history_db;            ///< SQLite catalog path override
  std::string export_csv;            ///< Export the catalog to CSV
  std::string export_json;           ///< Export the catalog to JSON
  std::vector<std::string> github_tokens; ///< Tokens for the hosting API
};

/**
 * Parse command line arguments into a CliOptions structure.
 *
 * When no `--github-token` is given the `GITHUB_TOKEN` environment variable
 * supplies the token.
 *
 * @throws CliParseExit When help or version output was requested or the
 *         arguments are invalid.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace omb

#endif // ORGMIRRORBACKUP_CLI_HPP
