/**
 * @file issue_exporter.hpp
 * @brief Builds the JSON issue backup of a repository.
 */

#ifndef ORGMIRRORBACKUP_ISSUE_EXPORTER_HPP
#define ORGMIRRORBACKUP_ISSUE_EXPORTER_HPP

#include "backup_date.hpp"
#include "github_client.hpp"
#include "models.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace omb {

void to_json(nlohmann::json &j, const IssueComment &comment);
void to_json(nlohmann::json &j, const IssueRecord &record);
void to_json(nlohmann::json &j, const IssueExportMetadata &metadata);
void to_json(nlohmann::json &j, const IssueExportDocument &document);

/**
 * Aggregates issues and their comments into an IssueExportDocument.
 *
 * Every issue (open and closed) is fetched along with its full comment
 * thread; the result is ordered by issue number. Any hosting failure,
 * including a rate limit, aborts the export so that no partial document is
 * produced.
 */
class IssueExporter {
public:
  explicit IssueExporter(std::shared_ptr<HostingGateway> hosting,
                         Clock clock = std::chrono::system_clock::now);

  /**
   * Export the issues of @p repository.
   *
   * @throws HostingError When listing issues or comments fails.
   */
  IssueExportDocument export_issues(const RepositoryDescriptor &repository);

private:
  std::shared_ptr<HostingGateway> hosting_;
  Clock clock_;
};

/// Two-space indented JSON text of @p document.
std::string serialize_export(const IssueExportDocument &document);

} // namespace omb

#endif // ORGMIRRORBACKUP_ISSUE_EXPORTER_HPP
