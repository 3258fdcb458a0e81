/**
 * @file report_builder.hpp
 * @brief Aggregated views over what is stored for an organization.
 */

#ifndef ORGMIRRORBACKUP_REPORT_BUILDER_HPP
#define ORGMIRRORBACKUP_REPORT_BUILDER_HPP

#include "backup_date.hpp"
#include "models.hpp"
#include "storage_gateway.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace omb {

/// Stored objects of one repository.
struct RepositoryBackupSummary {
  std::size_t backup_count{0};
  std::uint64_t total_size{0};
  std::string latest_backup; ///< Greatest last-modified value
  std::vector<StoredBackup> backups;
};

/// Derived, read-only statistics. Never persisted.
struct BackupReport {
  std::string organization;
  std::size_t total_repos{0};
  std::size_t repos_with_backups{0};
  std::uint64_t total_backup_size{0};
  std::map<std::string, RepositoryBackupSummary> repositories;
};

/// An issue export object recognised from its key.
struct IssueExportEntry {
  std::string repository;
  BackupDate date;
  std::string key;
  std::uint64_t size{0};
};

/// Issue exports keyed by calendar month (`YYYY-MM`).
using MonthlyIssueExports = std::map<std::string, std::vector<IssueExportEntry>>;

/**
 * Aggregate listings that were already fetched.
 *
 * @param organization Organization the listings belong to.
 * @param listings Repository name and its stored objects, one entry per
 *        monitored repository.
 */
BackupReport
aggregate_report(const std::string &organization,
                 const std::vector<std::pair<std::string, std::vector<StoredBackup>>>
                     &listings);

/** Lists storage for the selected repositories and aggregates it. */
class ReportBuilder {
public:
  explicit ReportBuilder(std::shared_ptr<StorageGateway> storage);

  /**
   * Build the report for @p repositories.
   *
   * @throws StorageError When a listing fails.
   */
  BackupReport build(const std::string &organization,
                     const std::vector<RepositoryDescriptor> &repositories);

private:
  std::shared_ptr<StorageGateway> storage_;
};

/**
 * Recognise `{name}-issues-{YYYYMMDD}.json` keys.
 *
 * @return The parsed entry, or std::nullopt for any other key.
 */
std::optional<IssueExportEntry> parse_issue_export_key(const std::string &key,
                                                       std::uint64_t size = 0);

/// Group every issue export in @p report by calendar month.
MonthlyIssueExports group_issue_exports_by_month(const BackupReport &report);

/**
 * Markdown summary with one collapsed `<details>` block per month. A
 * reviewer reminder is appended from the 25th day of the month onwards.
 */
std::string render_issue_export_summary(const MonthlyIssueExports &groups,
                                        const BackupDate &today);

/// Operator summary lines as printed by the `report` task.
std::vector<std::string> render_text(const BackupReport &report);

/// Bytes as gigabytes with two decimals, e.g. `1.50 GB`.
std::string format_gigabytes(std::uint64_t bytes);

} // namespace omb

#endif // ORGMIRRORBACKUP_REPORT_BUILDER_HPP
