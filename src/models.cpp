#include "models.hpp"

#include <algorithm>

namespace omb {

std::string to_string(BackupStatus status) {
  switch (status) {
  case BackupStatus::Success:
    return "success";
  case BackupStatus::Skipped:
    return "skipped";
  case BackupStatus::Failed:
    return "failed";
  }
  return "failed";
}

std::string to_string(SkipReason reason) {
  switch (reason) {
  case SkipReason::AlreadyExists:
    return "already_exists";
  case SkipReason::DryRun:
    return "dry_run";
  }
  return "already_exists";
}

std::string to_string(IssueExportStatus status) {
  switch (status) {
  case IssueExportStatus::NotRequested:
    return "not_requested";
  case IssueExportStatus::Success:
    return "success";
  case IssueExportStatus::Skipped:
    return "skipped";
  case IssueExportStatus::Failed:
    return "failed";
  }
  return "not_requested";
}

std::size_t CycleResult::count(BackupStatus status) const {
  return static_cast<std::size_t>(
      std::count_if(records.begin(), records.end(),
                    [status](const BackupRecord &r) { return r.status == status; }));
}

std::size_t CycleResult::issue_export_failures() const {
  return static_cast<std::size_t>(
      std::count_if(records.begin(), records.end(), [](const BackupRecord &r) {
        return r.issues.status == IssueExportStatus::Failed;
      }));
}

std::vector<const BackupRecord *> CycleResult::would_backup() const {
  std::vector<const BackupRecord *> out;
  for (const auto &r : records) {
    if (r.status == BackupStatus::Skipped && r.skip_reason &&
        *r.skip_reason == SkipReason::DryRun) {
      out.push_back(&r);
    }
  }
  return out;
}

const BackupRecord *CycleResult::find(const std::string &repository) const {
  for (const auto &r : records) {
    if (r.repository == repository) {
      return &r;
    }
  }
  return nullptr;
}

} // namespace omb
