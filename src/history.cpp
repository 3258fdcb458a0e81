/**
 * @file history.cpp
 * @brief Implements the SQLite backed backup catalog and its exports.
 */
#include "history.hpp"
#include "log.hpp"

#include <fstream>
#include <memory>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string_view>

namespace omb {

namespace {
std::shared_ptr<spdlog::logger> history_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("history");
  }();
  return logger;
}

const char *kColumns =
    "cycle_started_at,organization,repository,backup_date,storage_key,"
    "checksum,size_bytes,status,skip_reason,error_kind,error_message,"
    "issues_status,issues_key,total_issues";

/// Finalizes the statement when leaving scope.
struct Statement {
  sqlite3_stmt *stmt{nullptr};
  ~Statement() { sqlite3_finalize(stmt); }
};

std::string column_text(sqlite3_stmt *stmt, int col) {
  const unsigned char *text = sqlite3_column_text(stmt, col);
  return text ? reinterpret_cast<const char *>(text) : "";
}

void bind(sqlite3_stmt *stmt, int index, const std::string &value) {
  sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string escape_csv_field(std::string_view field) {
  bool needs_wrap = field.find(',') != std::string_view::npos ||
                    field.find('"') != std::string_view::npos ||
                    field.find('\n') != std::string_view::npos ||
                    field.find('\r') != std::string_view::npos;
  std::string escaped;
  escaped.reserve(field.size());
  for (char c : field) {
    if (c == '"') {
      escaped += "\"\"";
    } else {
      escaped += c;
    }
  }
  if (needs_wrap) {
    return std::string("\"") + escaped + "\"";
  }
  return escaped;
}
} // namespace

BackupHistory::BackupHistory(const std::string &db_path) {
  history_log()->debug("History: opening DB {}", db_path);
  if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("Failed to open database " + db_path + ": " + msg);
  }
  exec("CREATE TABLE IF NOT EXISTS backup_records("
       "id INTEGER PRIMARY KEY AUTOINCREMENT,"
       "cycle_started_at TEXT NOT NULL, organization TEXT NOT NULL,"
       "repository TEXT NOT NULL, backup_date TEXT NOT NULL,"
       "storage_key TEXT, checksum TEXT, size_bytes INTEGER,"
       "status TEXT NOT NULL, skip_reason TEXT, error_kind TEXT,"
       "error_message TEXT, issues_status TEXT, issues_key TEXT,"
       "total_issues INTEGER);");
  history_log()->debug("History: DB initialized");
}

BackupHistory::~BackupHistory() {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

void BackupHistory::exec(const char *sql) {
  char *err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "";
    sqlite3_free(err);
    throw std::runtime_error("SQLite statement failed: " + msg);
  }
}

void BackupHistory::append(const CycleResult &cycle) {
  const std::string started = iso8601_timestamp(cycle.started_at);
  const std::string sql = std::string("INSERT INTO backup_records(") +
                          kColumns +
                          ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?)";
  exec("BEGIN");
  try {
    for (const auto &r : cycle.records) {
      Statement s;
      if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &s.stmt, nullptr) !=
          SQLITE_OK) {
        throw std::runtime_error("Failed to prepare insert");
      }
      bind(s.stmt, 1, started);
      bind(s.stmt, 2, cycle.organization);
      bind(s.stmt, 3, r.repository);
      bind(s.stmt, 4, r.backup_date.iso());
      bind(s.stmt, 5, r.storage_key);
      bind(s.stmt, 6, r.checksum);
      sqlite3_bind_int64(s.stmt, 7, static_cast<sqlite3_int64>(r.size_bytes));
      bind(s.stmt, 8, to_string(r.status));
      bind(s.stmt, 9, r.skip_reason ? to_string(*r.skip_reason) : "");
      bind(s.stmt, 10, r.error ? to_string(*r.error) : "");
      bind(s.stmt, 11, r.error_message);
      bind(s.stmt, 12, to_string(r.issues.status));
      bind(s.stmt, 13, r.issues.storage_key);
      sqlite3_bind_int64(s.stmt, 14,
                         static_cast<sqlite3_int64>(r.issues.total_issues));
      if (sqlite3_step(s.stmt) != SQLITE_DONE) {
        throw std::runtime_error("Failed to execute insert: " +
                                 std::string(sqlite3_errmsg(db_)));
      }
    }
  } catch (const std::exception &e) {
    char *err = nullptr;
    sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &err);
    sqlite3_free(err);
    history_log()->error("History: append failed: {}", e.what());
    throw;
  }
  exec("COMMIT");
  history_log()->debug("History: appended {} records", cycle.records.size());
}

std::vector<HistoryRow> BackupHistory::rows() {
  const std::string sql = std::string("SELECT ") + kColumns +
                          " FROM backup_records ORDER BY id";
  Statement s;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &s.stmt, nullptr) !=
      SQLITE_OK) {
    throw std::runtime_error("Failed to query database");
  }
  std::vector<HistoryRow> out;
  while (sqlite3_step(s.stmt) == SQLITE_ROW) {
    HistoryRow row;
    row.cycle_started_at = column_text(s.stmt, 0);
    row.organization = column_text(s.stmt, 1);
    row.repository = column_text(s.stmt, 2);
    row.backup_date = column_text(s.stmt, 3);
    row.storage_key = column_text(s.stmt, 4);
    row.checksum = column_text(s.stmt, 5);
    row.size_bytes = sqlite3_column_int64(s.stmt, 6);
    row.status = column_text(s.stmt, 7);
    row.skip_reason = column_text(s.stmt, 8);
    row.error_kind = column_text(s.stmt, 9);
    row.error_message = column_text(s.stmt, 10);
    row.issues_status = column_text(s.stmt, 11);
    row.issues_key = column_text(s.stmt, 12);
    row.total_issues = sqlite3_column_int64(s.stmt, 13);
    out.push_back(std::move(row));
  }
  return out;
}

std::size_t BackupHistory::size() {
  Statement s;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM backup_records", -1,
                         &s.stmt, nullptr) != SQLITE_OK) {
    throw std::runtime_error("Failed to query database");
  }
  if (sqlite3_step(s.stmt) != SQLITE_ROW) {
    throw std::runtime_error("Failed to count records");
  }
  return static_cast<std::size_t>(sqlite3_column_int64(s.stmt, 0));
}

void BackupHistory::export_csv(const std::string &path) {
  history_log()->debug("History: export_csv -> {}", path);
  auto all = rows();
  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("Failed to open CSV file");
  }
  out << kColumns << '\n';
  for (const auto &r : all) {
    out << escape_csv_field(r.cycle_started_at) << ','
        << escape_csv_field(r.organization) << ','
        << escape_csv_field(r.repository) << ','
        << escape_csv_field(r.backup_date) << ','
        << escape_csv_field(r.storage_key) << ','
        << escape_csv_field(r.checksum) << ',' << r.size_bytes << ','
        << escape_csv_field(r.status) << ','
        << escape_csv_field(r.skip_reason) << ','
        << escape_csv_field(r.error_kind) << ','
        << escape_csv_field(r.error_message) << ','
        << escape_csv_field(r.issues_status) << ','
        << escape_csv_field(r.issues_key) << ',' << r.total_issues << '\n';
  }
  history_log()->debug("History: export_csv done");
}

void BackupHistory::export_json(const std::string &path) {
  history_log()->debug("History: export_json -> {}", path);
  nlohmann::json j = nlohmann::json::array();
  for (const auto &r : rows()) {
    j.push_back({{"cycle_started_at", r.cycle_started_at},
                 {"organization", r.organization},
                 {"repository", r.repository},
                 {"backup_date", r.backup_date},
                 {"storage_key", r.storage_key},
                 {"checksum", r.checksum},
                 {"size_bytes", r.size_bytes},
                 {"status", r.status},
                 {"skip_reason", r.skip_reason},
                 {"error_kind", r.error_kind},
                 {"error_message", r.error_message},
                 {"issues_status", r.issues_status},
                 {"issues_key", r.issues_key},
                 {"total_issues", r.total_issues}});
  }
  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("Failed to open JSON file");
  }
  out << j.dump(2);
  history_log()->debug("History: export_json done");
}

} // namespace omb
