/**
 * @file log.hpp
 * @brief Logging utilities for usagemonitor.
 *
 * Declares logger initialization, category loggers, log category
 * configuration and helpers for keeping secrets out of log output.
 */

#ifndef USAGEMONITOR_LOG_HPP
#define USAGEMONITOR_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace umon {

/**
 * Initialize the process-wide logger with a console sink and an optional
 * rotating file sink.
 *
 * @param level Logging verbosity level to use for all loggers.
 * @param pattern Log message pattern. Provide an empty string to keep the
 *        underlying spdlog default.
 * @param file Optional log file path for enabling a rotating sink. When empty
 *        no file output is configured.
 * @param rotate_files Maximum number of rotated files to retain when
 *        @p file is provided. Zero selects a plain append-only file.
 * @param compress_rotations Whether rotated log files should be gzip
 *        compressed automatically.
 */
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 3, bool compress_rotations = false);

/**
 * Retrieve or create a logger dedicated to a specific category.
 *
 * Category loggers are registered as `umon.<category>` and share sinks with
 * the default logger so messages appear in the same destinations.
 *
 * @param category Category name such as `fetcher` or `supervisor`.
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

/**
 * Ensure a default logger exists before logging.
 *
 * Creates one at info level when the logging subsystem has not been
 * explicitly initialized.
 */
void ensure_default_logger();

/**
 * Parse a textual log level.
 *
 * @param name Level name (trace, debug, info, warn, error, critical, off).
 *        Matching is case-insensitive and `warning` is accepted.
 * @return Parsed level.
 * @throws std::invalid_argument When the name is not a known level.
 */
spdlog::level::level_enum parse_log_level(const std::string &name);

/**
 * Mask a secret so only its last four characters remain visible.
 *
 * @param secret Session token or other credential.
 * @return Masked representation safe to write to logs.
 */
std::string mask_secret(const std::string &secret);

} // namespace umon

#endif // USAGEMONITOR_LOG_HPP
