#include "backup_date.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace omb {

namespace {

std::tm to_utc_tm(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  return tm;
}

std::string pad(int value, int width) {
  std::ostringstream oss;
  oss << std::setw(width) << std::setfill('0') << value;
  return oss.str();
}

} // namespace

BackupDate
BackupDate::from_time_point(std::chrono::system_clock::time_point tp) {
  std::tm tm = to_utc_tm(tp);
  return {tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

std::optional<BackupDate> BackupDate::parse_compact(const std::string &value) {
  if (value.size() != 8) {
    return std::nullopt;
  }
  for (char c : value) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
  }
  BackupDate date{std::stoi(value.substr(0, 4)), std::stoi(value.substr(4, 2)),
                  std::stoi(value.substr(6, 2))};
  if (date.month < 1 || date.month > 12 || date.day < 1 || date.day > 31) {
    return std::nullopt;
  }
  return date;
}

std::string BackupDate::compact() const {
  return pad(year, 4) + pad(month, 2) + pad(day, 2);
}

std::string BackupDate::iso() const {
  return pad(year, 4) + "-" + pad(month, 2) + "-" + pad(day, 2);
}

std::string BackupDate::month_key() const {
  return pad(year, 4) + "-" + pad(month, 2);
}

std::string iso8601_timestamp(std::chrono::system_clock::time_point tp) {
  std::tm tm = to_utc_tm(tp);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::optional<std::chrono::system_clock::time_point>
parse_iso8601_timestamp(const std::string &value) {
  if (value.size() < 19) {
    return std::nullopt;
  }
  std::tm tm{};
  std::istringstream ss(value.substr(0, 19));
  ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (ss.fail()) {
    return std::nullopt;
  }
#ifdef _WIN32
  std::time_t t = _mkgmtime(&tm);
#else
  std::time_t t = timegm(&tm);
#endif
  return std::chrono::system_clock::from_time_t(t);
}

} // namespace omb
