#include "work_dir.hpp"
#include "log.hpp"

#include <cerrno>
#include <cstring>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <stdlib.h>
#include <vector>

namespace omb {

namespace {

std::shared_ptr<spdlog::logger> work_dir_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("workdir");
  }();
  return logger;
}

std::string sanitize(const std::string &label) {
  std::string out;
  for (char c : label) {
    bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
    out.push_back(safe ? c : '_');
  }
  return out.empty() ? "omb" : out;
}

} // namespace

ScopedWorkDir::ScopedWorkDir(const std::filesystem::path &parent,
                             const std::string &label) {
  std::filesystem::path base =
      parent.empty() ? std::filesystem::temp_directory_path() : parent;
  std::error_code ec;
  std::filesystem::create_directories(base, ec);
  if (ec) {
    throw std::runtime_error("Failed to create " + base.string() + ": " +
                             ec.message());
  }
  std::string tmpl = (base / (sanitize(label) + "-XXXXXX")).string();
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  if (::mkdtemp(buf.data()) == nullptr) {
    throw std::runtime_error("mkdtemp failed for " + tmpl + ": " +
                             std::strerror(errno));
  }
  path_ = buf.data();
  work_dir_log()->debug("Created work directory {}", path_.string());
}

ScopedWorkDir::~ScopedWorkDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  if (ec) {
    work_dir_log()->warn("Failed to remove work directory {}: {}",
                         path_.string(), ec.message());
  } else {
    work_dir_log()->debug("Removed work directory {}", path_.string());
  }
}

} // namespace omb
