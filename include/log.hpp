/**
 * @file log.hpp
 * @brief Logging utilities for orgmirrorbackup.
 *
 * Declares logger initialization, category loggers, and log category
 * configuration.
 */

#ifndef ORGMIRRORBACKUP_LOG_HPP
#define ORGMIRRORBACKUP_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace omb {

/**
 * Initialize the global logger with console and optional rotating file sinks.
 *
 * @param level Logging verbosity level to use for all loggers.
 * @param pattern Log message pattern. Provide an empty string to keep the
 *        underlying spdlog default.
 * @param file Optional log file path. When empty only the console sink is
 *        configured.
 * @param rotate_files Maximum number of rotated files to retain when @p file
 *        is provided. Zero writes a single non-rotating file.
 * @param compress_rotations Whether rotated log files are gzip compressed.
 */
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 3, bool compress_rotations = false);

/**
 * Retrieve or create a logger dedicated to a specific category.
 *
 * Category loggers share sinks with the default logger so messages appear in
 * the same destinations while allowing per-category level overrides.
 *
 * @param category Category name, registered as `omb.<category>`.
 * @return Shared pointer to the category logger.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/**
 * Apply log level overrides for specific categories.
 *
 * @param overrides Mapping of category name to desired log level.
 */
void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides);

/// Ensure a default logger exists before logging.
void ensure_default_logger();

/**
 * Parse a textual log level.
 *
 * @param value Level name such as "debug" or "warn".
 * @param fallback Level returned when @p value is not a known level.
 */
spdlog::level::level_enum parse_log_level(const std::string &value,
                                          spdlog::level::level_enum fallback);

/// Flush every registered logger and stop the async worker.
void shutdown_logger();

} // namespace omb

#endif // ORGMIRRORBACKUP_LOG_HPP
