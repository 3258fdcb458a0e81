/**
 * @file backup_date.hpp
 * @brief Calendar-day and timestamp helpers for backup keys and metadata.
 */

#ifndef ORGMIRRORBACKUP_BACKUP_DATE_HPP
#define ORGMIRRORBACKUP_BACKUP_DATE_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace omb {

/// Source of the current time, replaceable in tests.
using Clock = std::function<std::chrono::system_clock::time_point()>;

/**
 * UTC calendar day. Backups are keyed by day, not by timestamp, so two runs
 * on the same day resolve to the same storage key.
 */
struct BackupDate {
  int year{1970};
  int month{1};
  int day{1};

  /// UTC calendar day containing @p tp.
  static BackupDate from_time_point(std::chrono::system_clock::time_point tp);

  /// Parse `YYYYMMDD`; returns std::nullopt for anything else.
  static std::optional<BackupDate> parse_compact(const std::string &value);

  /// `YYYYMMDD`, as used in object keys.
  std::string compact() const;

  /// `YYYY-MM-DD`.
  std::string iso() const;

  /// `YYYY-MM`, used to group exports by month.
  std::string month_key() const;

  bool operator==(const BackupDate &other) const {
    return year == other.year && month == other.month && day == other.day;
  }
  bool operator!=(const BackupDate &other) const { return !(*this == other); }
};

/// Format @p tp as `YYYY-MM-DDTHH:MM:SSZ` (UTC).
std::string iso8601_timestamp(std::chrono::system_clock::time_point tp);

/**
 * Parse an ISO-8601 UTC timestamp such as `2025-12-02T10:11:12Z` or
 * `2025-12-02T10:11:12.000Z`. Fractional seconds are ignored.
 */
std::optional<std::chrono::system_clock::time_point>
parse_iso8601_timestamp(const std::string &value);

} // namespace omb

#endif // ORGMIRRORBACKUP_BACKUP_DATE_HPP
