/**
 * @file models.hpp
 * @brief Value types shared by the selection, backup and reporting stages.
 */

#ifndef ORGMIRRORBACKUP_MODELS_HPP
#define ORGMIRRORBACKUP_MODELS_HPP

#include "backup_date.hpp"
#include "errors.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace omb {

/// Snapshot of a hosted repository taken once per cycle.
struct RepositoryDescriptor {
  std::string name;           ///< Repository name, unique per organization
  std::string full_name;      ///< `owner/name`
  bool archived{false};       ///< Archived flag reported by the host
  std::string default_branch; ///< Default branch name
  std::string clone_url;      ///< HTTPS clone URL
  bool is_private{false};     ///< Visibility flag, diagnostics only
};

/// Comment attached to an issue.
struct IssueComment {
  std::int64_t id{0};
  std::optional<std::string> author;
  std::string body;
  std::optional<std::string> created_at;
};

/// Issue fields as listed by the hosting API, without comments.
struct IssueSummary {
  int number{0};
  std::string title;
  std::string url;
  std::string state; ///< "open" or "closed"
  std::optional<std::string> author;
  std::optional<std::string> created_at;
  std::optional<std::string> updated_at;
  std::optional<std::string> closed_at;
  std::optional<std::string> closed_by;
  std::vector<std::string> labels;
  std::optional<std::string> milestone;
  std::vector<std::string> assignees;
  std::string body;
};

/// Issue together with its full comment thread.
struct IssueRecord {
  IssueSummary issue;
  std::vector<IssueComment> comments;
};

/// Header block of an issue export document.
struct IssueExportMetadata {
  std::string repository;
  std::string exported_at;
  std::size_t total_issues{0};
  std::size_t open_issues{0};
  std::size_t closed_issues{0};
};

/// Serialisable issue backup for one repository.
struct IssueExportDocument {
  IssueExportMetadata metadata;
  std::vector<IssueRecord> issues; ///< Ordered by issue number
};

/// Terminal state of a repository within a cycle.
enum class BackupStatus { Success, Skipped, Failed };

/// Why a repository ended in BackupStatus::Skipped.
enum class SkipReason {
  AlreadyExists, ///< Today's archive is already stored
  DryRun         ///< Dry-run mode; the archive would have been created
};

/// Outcome of the optional issue export step.
enum class IssueExportStatus { NotRequested, Success, Skipped, Failed };

std::string to_string(BackupStatus status);
std::string to_string(SkipReason reason);
std::string to_string(IssueExportStatus status);

/// Issue export result, tracked separately from the archive result.
struct IssueExportOutcome {
  IssueExportStatus status{IssueExportStatus::NotRequested};
  std::string storage_key;
  std::size_t total_issues{0};
  std::optional<ErrorKind> error;
  std::string error_message;
};

/// Result of one repository in one cycle.
struct BackupRecord {
  std::string repository; ///< Full name (`owner/name`)
  std::string name;       ///< Short name used in storage keys
  BackupDate backup_date;
  std::string storage_key;
  std::string checksum; ///< SHA-256 hex of the uploaded archive
  std::uint64_t size_bytes{0};
  BackupStatus status{BackupStatus::Failed};
  std::optional<SkipReason> skip_reason;
  std::optional<ErrorKind> error;
  std::string error_message;
  IssueExportOutcome issues;
};

/// All records of one orchestrator invocation.
struct CycleResult {
  std::string organization;
  std::chrono::system_clock::time_point started_at;
  bool dry_run{false};
  std::vector<BackupRecord> records;

  std::size_t total() const { return records.size(); }
  std::size_t count(BackupStatus status) const;
  std::size_t successful() const { return count(BackupStatus::Success); }
  std::size_t failed() const { return count(BackupStatus::Failed); }
  std::size_t skipped() const { return count(BackupStatus::Skipped); }

  /// Records whose issue export failed, regardless of archive status.
  std::size_t issue_export_failures() const;

  /// True when any repository failed its archive or issue export.
  bool has_failures() const {
    return failed() > 0 || issue_export_failures() > 0;
  }

  /// Records skipped because of dry-run mode.
  std::vector<const BackupRecord *> would_backup() const;

  /// Record for @p repository (full name), or nullptr.
  const BackupRecord *find(const std::string &repository) const;
};

} // namespace omb

#endif // ORGMIRRORBACKUP_MODELS_HPP
