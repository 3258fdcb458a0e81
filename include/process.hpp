/**
 * @file process.hpp
 * @brief Blocking subprocess execution used by the archive producer.
 */

#ifndef ORGMIRRORBACKUP_PROCESS_HPP
#define ORGMIRRORBACKUP_PROCESS_HPP

#include <string>
#include <vector>

namespace omb {

/// Exit status and captured diagnostics of a finished process.
struct ProcessResult {
  int exit_code{-1};       ///< Exit status, or -1 when killed by a signal
  std::string error_output; ///< Tail of the process' standard error
};

/** Runs external commands to completion. */
class ProcessRunner {
public:
  virtual ~ProcessRunner() = default;

  /**
   * Run @p argv (searched on `PATH`) and wait for it to exit.
   *
   * @param argv Program followed by its arguments.
   * @param env `NAME=value` entries added to the inherited environment,
   *        replacing inherited variables of the same name.
   * @throws std::runtime_error When the process cannot be started.
   */
  virtual ProcessResult run(const std::vector<std::string> &argv,
                            const std::vector<std::string> &env = {}) = 0;
};

/**
 * ProcessRunner built on posix_spawnp. Standard output is discarded and
 * standard error is captured through a pipe.
 */
class SpawnProcessRunner : public ProcessRunner {
public:
  ProcessResult run(const std::vector<std::string> &argv,
                    const std::vector<std::string> &env = {}) override;
};

} // namespace omb

#endif // ORGMIRRORBACKUP_PROCESS_HPP
