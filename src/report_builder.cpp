#include "report_builder.hpp"
#include "log.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <spdlog/spdlog.h>

namespace omb {

namespace {

std::shared_ptr<spdlog::logger> report_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("report");
  }();
  return logger;
}

constexpr int kReminderDay = 25;

std::string format_kilobytes(std::uint64_t bytes) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1)
      << static_cast<double>(bytes) / 1024.0 << " KB";
  return oss.str();
}

} // namespace

BackupReport aggregate_report(
    const std::string &organization,
    const std::vector<std::pair<std::string, std::vector<StoredBackup>>>
        &listings) {
  BackupReport report;
  report.organization = organization;
  report.total_repos = listings.size();
  for (const auto &[name, backups] : listings) {
    if (backups.empty())
      continue;
    RepositoryBackupSummary summary;
    summary.backup_count = backups.size();
    for (const auto &b : backups) {
      summary.total_size += b.size;
      summary.latest_backup = std::max(summary.latest_backup, b.last_modified);
    }
    summary.backups = backups;
    ++report.repos_with_backups;
    report.total_backup_size += summary.total_size;
    report.repositories[name] = std::move(summary);
  }
  return report;
}

ReportBuilder::ReportBuilder(std::shared_ptr<StorageGateway> storage)
    : storage_(std::move(storage)) {}

BackupReport
ReportBuilder::build(const std::string &organization,
                     const std::vector<RepositoryDescriptor> &repositories) {
  std::vector<std::pair<std::string, std::vector<StoredBackup>>> listings;
  listings.reserve(repositories.size());
  for (const auto &repo : repositories) {
    listings.emplace_back(repo.name, storage_->list_backups(repo.name));
  }
  BackupReport report = aggregate_report(organization, listings);
  report_log()->debug("Report for {}: {} of {} repositories have backups",
                      organization, report.repos_with_backups,
                      report.total_repos);
  return report;
}

std::optional<IssueExportEntry> parse_issue_export_key(const std::string &key,
                                                       std::uint64_t size) {
  const std::string marker = "-issues-";
  const std::string suffix = ".json";
  auto slash = key.find_last_of('/');
  std::string file = slash == std::string::npos ? key : key.substr(slash + 1);
  if (file.size() <= suffix.size() ||
      file.compare(file.size() - suffix.size(), suffix.size(), suffix) != 0) {
    return std::nullopt;
  }
  auto pos = file.rfind(marker);
  if (pos == std::string::npos || pos == 0) {
    return std::nullopt;
  }
  std::string stamp = file.substr(pos + marker.size(),
                                  file.size() - suffix.size() - pos -
                                      marker.size());
  auto date = BackupDate::parse_compact(stamp);
  if (!date) {
    return std::nullopt;
  }
  return IssueExportEntry{file.substr(0, pos), *date, key, size};
}

MonthlyIssueExports group_issue_exports_by_month(const BackupReport &report) {
  MonthlyIssueExports groups;
  for (const auto &[name, summary] : report.repositories) {
    for (const auto &b : summary.backups) {
      if (auto entry = parse_issue_export_key(b.key, b.size)) {
        groups[entry->date.month_key()].push_back(std::move(*entry));
      }
    }
  }
  for (auto &[month, entries] : groups) {
    std::sort(entries.begin(), entries.end(),
              [](const IssueExportEntry &a, const IssueExportEntry &b) {
                if (a.date.day != b.date.day)
                  return a.date.day < b.date.day;
                return a.repository < b.repository;
              });
  }
  return groups;
}

std::string render_issue_export_summary(const MonthlyIssueExports &groups,
                                        const BackupDate &today) {
  std::ostringstream out;
  out << "## Issue exports\n\n";
  if (groups.empty()) {
    out << "No issue exports found.\n";
  }
  for (const auto &[month, entries] : groups) {
    out << "<details>\n<summary>" << month << " (" << entries.size()
        << (entries.size() == 1 ? " export" : " exports")
        << ")</summary>\n\n";
    out << "| Repository | Date | Size |\n|---|---|---|\n";
    for (const auto &e : entries) {
      out << "| " << e.repository << " | " << e.date.iso() << " | "
          << format_kilobytes(e.size) << " |\n";
    }
    out << "\n</details>\n\n";
  }
  if (today.day >= kReminderDay) {
    out << "> **Reminder:** the month is almost over. Please review the "
        << today.month_key() << " issue exports before the next cycle.\n";
  }
  return out.str();
}

std::string format_gigabytes(std::uint64_t bytes) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2)
      << static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0) << " GB";
  return oss.str();
}

std::vector<std::string> render_text(const BackupReport &report) {
  const std::string rule(60, '=');
  std::vector<std::string> lines;
  lines.push_back(rule);
  lines.push_back("Backup Report for " + report.organization);
  lines.push_back(rule);
  lines.push_back("Total repositories monitored: " +
                  std::to_string(report.total_repos));
  lines.push_back("Repositories with backups: " +
                  std::to_string(report.repos_with_backups));
  lines.push_back("Total backup size: " +
                  format_gigabytes(report.total_backup_size));
  lines.push_back(rule);
  for (const auto &[name, summary] : report.repositories) {
    lines.push_back("  " + name + ": " + std::to_string(summary.backup_count) +
                    " objects, " + format_gigabytes(summary.total_size) +
                    ", latest " + summary.latest_backup);
  }
  return lines;
}

} // namespace omb
