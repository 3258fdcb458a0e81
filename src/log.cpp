#include "log.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>
#include <zlib.h>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

namespace fs = std::filesystem;

constexpr const char *kRootLoggerName = "omb";
constexpr std::size_t kRotateBytes = 1024 * 1024 * 5;

std::weak_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;
std::once_flag g_thread_pool_once;

void ensure_thread_pool() {
  std::call_once(g_thread_pool_once, [] {
    constexpr std::size_t queue_size = 8192;
    constexpr std::size_t num_threads = 1;
    spdlog::init_thread_pool(queue_size, num_threads);
  });
}

std::shared_ptr<spdlog::details::thread_pool> thread_pool() {
  auto pool = spdlog::thread_pool();
  if (!pool) {
    ensure_thread_pool();
    pool = spdlog::thread_pool();
  }
  return pool;
}

/**
 * Path of the rotated file with the given index (`app.log` -> `app.2.log`).
 */
fs::path rotated_path(const fs::path &base, std::size_t index) {
  if (index == 0) {
    return base;
  }
  fs::path rotated = base;
  rotated.replace_filename(base.stem().string() + "." + std::to_string(index) +
                           base.extension().string());
  return rotated;
}

fs::path gz_path(const fs::path &path) { return fs::path(path.string() + ".gz"); }

/**
 * Shift compressed rotations one slot up, dropping the oldest.
 */
void shift_compressed_logs(const fs::path &base, std::size_t max_files) {
  std::error_code ec;
  fs::remove(gz_path(rotated_path(base, max_files)), ec);
  for (std::size_t i = max_files; i > 1; --i) {
    fs::path src = gz_path(rotated_path(base, i - 1));
    if (!fs::exists(src, ec)) {
      continue;
    }
    fs::path dst = gz_path(rotated_path(base, i));
    fs::remove(dst, ec);
    fs::rename(src, dst, ec);
  }
}

/**
 * Gzip a rotated log file in place and remove the uncompressed original.
 *
 * @return `true` when the compressed file was written completely.
 */
bool gzip_file(const fs::path &path) {
  auto log = omb::category_logger("logging");
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    log->warn("Failed to open log file {} for compression", path.string());
    return false;
  }
  const fs::path target = gz_path(path);
  gzFile gz = gzopen(target.string().c_str(), "wb");
  if (!gz) {
    log->warn("Failed to open compressed log {}", target.string());
    return false;
  }
  char buffer[16 * 1024];
  bool ok = true;
  while (input && ok) {
    input.read(buffer, sizeof(buffer));
    std::streamsize read = input.gcount();
    if (read > 0 &&
        gzwrite(gz, buffer, static_cast<unsigned>(read)) != read) {
      int err = 0;
      const char *msg = gzerror(gz, &err);
      log->warn("Failed to compress log {}: {}", path.string(),
                msg ? msg : "unknown");
      ok = false;
    }
  }
  gzclose(gz);
  input.close();
  std::error_code ec;
  if (!ok) {
    fs::remove(target, ec);
    return false;
  }
  fs::remove(path, ec);
  if (ec) {
    log->warn("Failed to remove {} after compression: {}", path.string(),
              ec.message());
  }
  return true;
}

spdlog::sink_ptr make_file_sink(const std::string &file,
                                std::size_t rotate_files, bool compress) {
  if (rotate_files == 0) {
    return std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, true);
  }
  spdlog::file_event_handlers handlers;
  if (compress) {
    handlers.before_open = [rotate_files](const spdlog::filename_t &filename) {
      const fs::path base(spdlog::details::os::filename_to_str(filename));
      shift_compressed_logs(base, rotate_files);
      const fs::path newest = rotated_path(base, 1);
      std::error_code ec;
      if (fs::exists(newest, ec)) {
        gzip_file(newest);
      }
    };
  }
  return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      file, kRotateBytes, rotate_files, false, handlers);
}

} // namespace

namespace omb {

void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files,
                 bool compress_rotations) {
  ensure_thread_pool();
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(kRootLoggerName);
  if (!logger) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!file.empty()) {
      sinks.push_back(make_file_sink(file, rotate_files, compress_rotations));
    }
    logger = std::make_shared<spdlog::async_logger>(
        kRootLoggerName, sinks.begin(), sinks.end(), thread_pool(),
        spdlog::async_overflow_policy::block);
    spdlog::set_default_logger(logger);
    g_logger = logger;
  }
  lock.unlock();
  logger->set_level(level);
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->debug("Logger initialised (level={}, file='{}', rotate={}, "
                "compress={})",
                spdlog::level::to_string_view(level), file, rotate_files,
                compress_rotations);
}

void ensure_default_logger() {
  auto logger = spdlog::default_logger();
  auto locked = g_logger.lock();
  if (!logger || !locked || logger.get() != locked.get()) {
    init_logger(spdlog::level::info);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  ensure_thread_pool();
  const std::string name = std::string(kRootLoggerName) + "." + category;
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  auto default_logger = spdlog::default_logger();
  if (!default_logger) {
    lock.unlock();
    init_logger(spdlog::level::info);
    lock.lock();
    default_logger = spdlog::default_logger();
  }
  std::vector<spdlog::sink_ptr> sinks;
  if (default_logger) {
    sinks = default_logger->sinks();
  } else {
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  }
  auto logger = std::make_shared<spdlog::async_logger>(
      name, sinks.begin(), sinks.end(), thread_pool(),
      spdlog::async_overflow_policy::block);
  logger->set_level(default_logger ? default_logger->level()
                                   : spdlog::level::info);
  spdlog::register_logger(logger);
  return logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  for (const auto &[category, level] : overrides) {
    category_logger(category)->set_level(level);
  }
  if (!overrides.empty()) {
    category_logger("logging")->debug("Applied {} log category override(s)",
                                      overrides.size());
  }
}

spdlog::level::level_enum parse_log_level(const std::string &value,
                                          spdlog::level::level_enum fallback) {
  auto level = spdlog::level::from_str(value);
  // from_str maps unknown names to off; only accept off when spelled out.
  if (level == spdlog::level::off && value != "off") {
    return fallback;
  }
  return level;
}

void shutdown_logger() {
  spdlog::apply_all([](const std::shared_ptr<spdlog::logger> &logger) {
    logger->flush();
  });
  spdlog::shutdown();
}

} // namespace omb
