/**
 * @file app.hpp
 * @brief Main application entry point for orgmirrorbackup.
 *
 * Declares the App class, which manages high-level application flow,
 * configuration loading, and CLI parsing for the orgmirrorbackup tool.
 */

#ifndef ORGMIRRORBACKUP_APP_HPP
#define ORGMIRRORBACKUP_APP_HPP

#include "cli.hpp"
#include "config.hpp"
#include "models.hpp"
#include <memory>
#include <string>
#include <vector>

namespace omb {

class StorageGateway;

/**
 * Main application entry point responsible for orchestrating high level
 * application flow, configuration loading, and CLI parsing.
 */
class App {
public:
  /**
   * Run the application with the given command line arguments.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return Zero on success, non-zero when a repository failed or the run
   *         could not start.
   */
  int run(int argc, char **argv);

  /// Parsed command line options.
  const CliOptions &options() const { return options_; }

  /// Configuration after command line overrides.
  const Config &config() const { return config_; }

private:
  void apply_overrides();
  void setup_logging();
  std::shared_ptr<StorageGateway> make_storage() const;
  int run_backup();
  int run_report();
  void record_history(const CycleResult &cycle);
  void export_history();

  CliOptions options_;
  Config config_;
};

/**
 * Human readable summary of a finished cycle, one line per entry.
 *
 * Dry runs list what would be backed up; real runs give the counts and then
 * every failed repository with its error kind.
 */
std::vector<std::string> summarize_cycle(const CycleResult &cycle);

} // namespace omb

#endif // ORGMIRRORBACKUP_APP_HPP
