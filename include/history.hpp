/**
 * @file history.hpp
 * @brief Local backup catalog for orgmirrorbackup.
 *
 * Declares the BackupHistory class that appends every backup record to a
 * SQLite database and exports it.
 */

#ifndef ORGMIRRORBACKUP_HISTORY_HPP
#define ORGMIRRORBACKUP_HISTORY_HPP

#include "models.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace omb {

/// One stored row of the `backup_records` table.
struct HistoryRow {
  std::string cycle_started_at;
  std::string organization;
  std::string repository;
  std::string backup_date;
  std::string storage_key;
  std::string checksum;
  std::int64_t size_bytes{0};
  std::string status;
  std::string skip_reason;
  std::string error_kind;
  std::string error_message;
  std::string issues_status;
  std::string issues_key;
  std::int64_t total_issues{0};
};

/**
 * Simple RAII wrapper around SQLite storing the outcome of backup cycles.
 *
 * Rows are only ever appended; the catalog is a local audit trail and is
 * never consulted for idempotency decisions.
 */
class BackupHistory {
public:
  /**
   * Construct and open the database at `db_path`.
   *
   * @param db_path Filesystem path to the SQLite database file to create or
   *        open. Missing parent directories are not created automatically.
   * @throws std::runtime_error When the database cannot be opened or migrated.
   */
  explicit BackupHistory(const std::string &db_path);

  /**
   * Destroy the wrapper and close the database connection if it is open.
   */
  ~BackupHistory();

  BackupHistory(const BackupHistory &) = delete;
  BackupHistory &operator=(const BackupHistory &) = delete;

  /**
   * Append every record of @p cycle in a single transaction.
   *
   * @throws std::runtime_error When an insert fails; nothing is stored then.
   */
  void append(const CycleResult &cycle);

  /// All rows in insertion order.
  std::vector<HistoryRow> rows();

  /// Number of stored rows.
  std::size_t size();

  /**
   * Export the database contents to a CSV file.
   *
   * @throws std::runtime_error On I/O failures or when the query fails.
   */
  void export_csv(const std::string &path);

  /**
   * Export the database contents to a JSON file.
   *
   * @throws std::runtime_error On I/O failures or when the query fails.
   */
  void export_json(const std::string &path);

private:
  void exec(const char *sql);
  sqlite3 *db_ = nullptr;
};

} // namespace omb

#endif // ORGMIRRORBACKUP_HISTORY_HPP
