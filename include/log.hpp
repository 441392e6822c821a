/**
 * @file log.hpp
 * @brief Logging utilities for octoclient.
 *
 * Declares logger initialization, category loggers, and log category
 * configuration.
 */

#ifndef OCTOCLIENT_LOG_HPP
#define OCTOCLIENT_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace octo {

/// Settings for the process-wide logger.
struct LogOptions {
  spdlog::level::level_enum level{spdlog::level::info};
  /// Log message pattern. Empty keeps the spdlog default.
  std::string pattern;
  /// Optional log file enabling a rotating sink.
  std::string file;
  /// Maximum number of rotated files to retain when @ref file is set.
  std::size_t rotate_files{3};
  /// Gzip compress rotated files.
  bool compress_rotations{false};
};

/**
 * Initialize the global logger with console and optional rotating file sinks.
 *
 * Sinks are fixed by the first call; later calls only adjust the level and
 * pattern.
 *
 * @param options Level, pattern and file sink settings.
 */
void init_logger(const LogOptions &options);

/**
 * Retrieve or create a logger dedicated to a specific category.
 *
 * Category loggers share sinks with the default logger so messages appear in
 * the same destinations. They allow fine-grained log-level overrides.
 *
 * @param category Arbitrary category name used as the logger identifier.
 * @return Shared pointer to the category logger named `octo.<category>`.
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
 * Creates one on demand when the logging subsystem has not been explicitly
 * initialized.
 */
void ensure_default_logger();

/**
 * Parse a level name such as `debug` or `WARN`.
 *
 * @throws ConfigError When the name is not a spdlog level.
 */
spdlog::level::level_enum parse_log_level(const std::string &name);

/// Mask a secret for log output, keeping at most a short prefix.
std::string redact_secret(const std::string &secret);

} // namespace octo

#endif // OCTOCLIENT_LOG_HPP
