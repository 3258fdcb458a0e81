/**
 * @file backup_orchestrator.hpp
 * @brief Drives one backup cycle across an organization.
 */

#ifndef ORGMIRRORBACKUP_BACKUP_ORCHESTRATOR_HPP
#define ORGMIRRORBACKUP_BACKUP_ORCHESTRATOR_HPP

#include "archive_producer.hpp"
#include "backup_date.hpp"
#include "github_client.hpp"
#include "issue_exporter.hpp"
#include "models.hpp"
#include "repo_matcher.hpp"
#include "storage_gateway.hpp"

#include <filesystem>
#include <memory>
#include <spdlog/logger.h>
#include <string>

namespace omb {

/// Per-invocation switches of a backup cycle.
struct CycleOptions {
  std::string organization;
  bool force{false};         ///< Re-create backups that already exist today
  bool dry_run{false};       ///< Report what would happen, write nothing
  bool export_issues{false}; ///< Also export issue metadata
  std::filesystem::path work_root; ///< Parent of per-repository work areas
};

/**
 * Runs the per-repository state machine
 * `ExistsCheck -> Skipped | Archiving -> Uploading -> Verifying ->
 * IssuesExporting -> Success`, with any failure ending in `Failed`.
 *
 * Repositories are processed sequentially. A failure is recorded against
 * its repository and the cycle moves on; only a failure to list the
 * organization aborts the cycle.
 */
class BackupOrchestrator {
public:
  /**
   * @param hosting Source of repositories and issues.
   * @param matcher Selection rules applied to the listing.
   * @param archiver Produces the archive of each selected repository.
   * @param storage Verified uploads and existence checks.
   * @param logger Progress sink; the `backup` category logger when null.
   * @param clock Time source for backup dates and metadata.
   */
  BackupOrchestrator(std::shared_ptr<HostingGateway> hosting,
                     RepositoryMatcher matcher,
                     std::shared_ptr<ArchiveProducer> archiver,
                     std::shared_ptr<StorageGateway> storage,
                     std::shared_ptr<spdlog::logger> logger = nullptr,
                     Clock clock = std::chrono::system_clock::now);

  /**
   * Back up every repository of @p options.organization selected by the
   * matcher.
   *
   * @throws HostingError When the organization cannot be listed.
   */
  CycleResult run_cycle(const CycleOptions &options);

private:
  BackupRecord backup_repository(const RepositoryDescriptor &repository,
                                 const CycleOptions &options,
                                 const BackupDate &today);
  void export_issues(const RepositoryDescriptor &repository,
                     const CycleOptions &options, const BackupDate &today,
                     BackupRecord &record);
  void log_selection(const MatchResult &match, std::size_t listed);

  std::shared_ptr<HostingGateway> hosting_;
  RepositoryMatcher matcher_;
  std::shared_ptr<ArchiveProducer> archiver_;
  std::shared_ptr<StorageGateway> storage_;
  std::shared_ptr<spdlog::logger> log_;
  Clock clock_;
  IssueExporter issue_exporter_;
};

} // namespace omb

#endif // ORGMIRRORBACKUP_BACKUP_ORCHESTRATOR_HPP
