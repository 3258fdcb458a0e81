#include "issue_exporter.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace omb {

namespace {

std::shared_ptr<spdlog::logger> issues_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("issues");
  }();
  return logger;
}

nlohmann::json nullable(const std::optional<std::string> &value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // namespace

void to_json(nlohmann::json &j, const IssueComment &comment) {
  j = nlohmann::json{{"id", comment.id},
                     {"author", nullable(comment.author)},
                     {"created_at", nullable(comment.created_at)},
                     {"body", comment.body}};
}

void to_json(nlohmann::json &j, const IssueRecord &record) {
  const IssueSummary &i = record.issue;
  j = nlohmann::json{{"number", i.number},
                     {"title", i.title},
                     {"url", i.url},
                     {"state", i.state},
                     {"author", nullable(i.author)},
                     {"created_at", nullable(i.created_at)},
                     {"updated_at", nullable(i.updated_at)},
                     {"closed_at", nullable(i.closed_at)},
                     {"closed_by", nullable(i.closed_by)},
                     {"labels", i.labels},
                     {"milestone", nullable(i.milestone)},
                     {"assignees", i.assignees},
                     {"body", i.body},
                     {"comment_count", record.comments.size()},
                     {"comments", record.comments}};
}

void to_json(nlohmann::json &j, const IssueExportMetadata &metadata) {
  j = nlohmann::json{{"repository", metadata.repository},
                     {"exported_at", metadata.exported_at},
                     {"total_issues", metadata.total_issues},
                     {"open_issues", metadata.open_issues},
                     {"closed_issues", metadata.closed_issues}};
}

void to_json(nlohmann::json &j, const IssueExportDocument &document) {
  j = nlohmann::json{{"metadata", document.metadata},
                     {"issues", document.issues}};
}

IssueExporter::IssueExporter(std::shared_ptr<HostingGateway> hosting,
                             Clock clock)
    : hosting_(std::move(hosting)), clock_(std::move(clock)) {}

IssueExportDocument
IssueExporter::export_issues(const RepositoryDescriptor &repository) {
  issues_log()->info("Exporting issues for: {}", repository.full_name);
  IssueExportDocument doc;
  for (auto &summary : hosting_->list_issues(repository.full_name)) {
    IssueRecord record;
    record.comments =
        hosting_->list_comments(repository.full_name, summary.number);
    if (summary.state == "open") {
      ++doc.metadata.open_issues;
    } else {
      ++doc.metadata.closed_issues;
    }
    record.issue = std::move(summary);
    doc.issues.push_back(std::move(record));
  }
  std::stable_sort(doc.issues.begin(), doc.issues.end(),
                   [](const IssueRecord &a, const IssueRecord &b) {
                     return a.issue.number < b.issue.number;
                   });
  doc.metadata.repository = repository.full_name;
  doc.metadata.exported_at = iso8601_timestamp(clock_());
  doc.metadata.total_issues = doc.issues.size();
  issues_log()->info("Exported {} issues ({} open, {} closed) for {}",
                     doc.metadata.total_issues, doc.metadata.open_issues,
                     doc.metadata.closed_issues, repository.full_name);
  return doc;
}

std::string serialize_export(const IssueExportDocument &document) {
  return nlohmann::json(document).dump(
      2, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace omb
