#include "backup_orchestrator.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "work_dir.hpp"

#include <spdlog/spdlog.h>

namespace omb {

BackupOrchestrator::BackupOrchestrator(
    std::shared_ptr<HostingGateway> hosting, RepositoryMatcher matcher,
    std::shared_ptr<ArchiveProducer> archiver,
    std::shared_ptr<StorageGateway> storage,
    std::shared_ptr<spdlog::logger> logger, Clock clock)
    : hosting_(std::move(hosting)), matcher_(std::move(matcher)),
      archiver_(std::move(archiver)), storage_(std::move(storage)),
      log_(logger ? std::move(logger) : category_logger("backup")),
      clock_(std::move(clock)), issue_exporter_(hosting_, clock_) {}

void BackupOrchestrator::log_selection(const MatchResult &match,
                                       std::size_t listed) {
  if (!match.archived.empty()) {
    log_->info("Skipped {} archived repositories", match.archived.size());
  }
  if (!match.excluded.empty()) {
    log_->info("Excluded {} repositories:\n{}", match.excluded.size(),
               format_columns(match.excluded));
  }
  for (const auto &name : match.missing_names) {
    log_->warn("Configured repository '{}' was not found in the organization",
               name);
  }
  log_->info("Found {} matching repositories out of {}", match.selected.size(),
             listed);
}

CycleResult BackupOrchestrator::run_cycle(const CycleOptions &options) {
  CycleResult result;
  result.organization = options.organization;
  result.started_at = clock_();
  result.dry_run = options.dry_run;
  BackupDate today = BackupDate::from_time_point(result.started_at);

  if (options.dry_run) {
    log_->info("DRY RUN MODE - No actual backups will be performed");
  }
  log_->info("Starting backup process for organization: {}",
             options.organization);

  auto listed = hosting_->list_repositories(options.organization);
  MatchResult match = matcher_.evaluate(listed);
  log_selection(match, listed.size());

  result.records.reserve(match.selected.size());
  for (const auto &repo : match.selected) {
    result.records.push_back(backup_repository(repo, options, today));
  }

  if (options.dry_run) {
    log_->info("DRY RUN complete: {} would be backed up, {} already exist",
               result.would_backup().size(),
               result.skipped() - result.would_backup().size());
  } else {
    log_->info("Backup complete: {} successful, {} failed, {} skipped",
               result.successful(), result.failed(), result.skipped());
  }
  return result;
}

BackupRecord
BackupOrchestrator::backup_repository(const RepositoryDescriptor &repository,
                                      const CycleOptions &options,
                                      const BackupDate &today) {
  BackupRecord record;
  record.repository = repository.full_name;
  record.name = repository.name;
  record.backup_date = today;
  record.storage_key = storage_->archive_key(repository.name, today);
  log_->info("Processing repository: {}", repository.full_name);

  try {
    if (!options.force && storage_->backup_exists(repository.name, today)) {
      log_->info("Backup already exists, skipping: {}", record.storage_key);
      record.status = BackupStatus::Skipped;
      record.skip_reason = SkipReason::AlreadyExists;
      // A missing issue export of the same day is still produced.
      if (options.export_issues && !options.dry_run) {
        export_issues(repository, options, today, record);
      }
      return record;
    }
    if (options.dry_run) {
      log_->info("[DRY RUN] Would backup: {} -> {}", repository.full_name,
                 record.storage_key);
      record.status = BackupStatus::Skipped;
      record.skip_reason = SkipReason::DryRun;
      return record;
    }

    std::unique_ptr<ScopedWorkDir> work_dir;
    try {
      work_dir = std::make_unique<ScopedWorkDir>(options.work_root,
                                                 repository.name);
    } catch (const std::runtime_error &e) {
      throw ArchiveError(e.what());
    }
    ArchiveArtifact artifact = archiver_->produce(repository, work_dir->path());
    ObjectMetadata metadata{
        {"repository", repository.full_name},
        {"backup_date", iso8601_timestamp(clock_())},
        {"default_branch", artifact.default_branch},
        {"size_bytes", std::to_string(artifact.size_bytes)}};
    UploadResult uploaded = storage_->upload(
        record.storage_key, UploadPayload::from_file(artifact.path), metadata);
    record.checksum = uploaded.checksum;
    record.size_bytes = uploaded.size_bytes;
    record.status = BackupStatus::Success;
  } catch (const std::exception &e) {
    record.status = BackupStatus::Failed;
    record.error = classify_error(e);
    record.error_message = e.what();
    log_->error("Failed to backup {} ({}): {}", repository.full_name,
                to_string(*record.error), e.what());
    return record;
  }

  if (options.export_issues) {
    export_issues(repository, options, today, record);
  }
  return record;
}

void BackupOrchestrator::export_issues(const RepositoryDescriptor &repository,
                                       const CycleOptions &options,
                                       const BackupDate &today,
                                       BackupRecord &record) {
  IssueExportOutcome &outcome = record.issues;
  outcome.storage_key = storage_->issues_key(repository.name, today);
  try {
    if (!options.force &&
        storage_->issues_export_exists(repository.name, today)) {
      log_->info("Issues backup already exists, skipping: {}",
                 outcome.storage_key);
      outcome.status = IssueExportStatus::Skipped;
      return;
    }
    IssueExportDocument doc = issue_exporter_.export_issues(repository);
    ObjectMetadata metadata{
        {"repository", repository.full_name},
        {"backup_date", iso8601_timestamp(clock_())},
        {"content_type", "application/json"},
        {"total_issues", std::to_string(doc.metadata.total_issues)}};
    storage_->upload(outcome.storage_key,
                     UploadPayload::from_bytes(serialize_export(doc)),
                     metadata);
    outcome.total_issues = doc.metadata.total_issues;
    outcome.status = IssueExportStatus::Success;
    log_->info("Issues backup successful: {} ({} issues)", outcome.storage_key,
               outcome.total_issues);
  } catch (const std::exception &e) {
    outcome.status = IssueExportStatus::Failed;
    outcome.error = classify_error(e);
    outcome.error_message = e.what();
    log_->error("Failed to backup issues for {} ({}): {}",
                repository.full_name, to_string(*outcome.error), e.what());
  }
}

} // namespace omb
