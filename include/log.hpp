/**
 * @file log.hpp
 * @brief Logging utilities for prdeck.
 *
 * Declares logger initialization, category loggers, the debug console
 * buffer and log category configuration.
 */

#ifndef PRDECK_LOG_HPP
#define PRDECK_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>
#include <vector>

namespace prdeck {

/**
 * Initialize the global logger with console, ring buffer and optional
 * rotating file sinks.
 *
 * @param level Logging verbosity level to use for all loggers.
 * @param pattern Log message pattern. Provide an empty string to keep the
 *        underlying spdlog default.
 * @param file Optional log file path for enabling a rotating sink. When empty
 *        no file output is configured.
 * @param rotate_files Maximum number of rotated files to retain when
 *        @p file is provided.
 * @param compress_rotations Whether rotated log files should be gzip
 *        compressed automatically.
 * @param console Whether messages are echoed to stdout. The terminal UI
 *        disables this while it owns the screen.
 */
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 3, bool compress_rotations = false,
                 bool console = true);

/**
 * Retrieve or create a logger dedicated to a specific category.
 *
 * Category loggers share sinks with the default logger so messages appear in
 * the same destinations. They allow fine-grained log-level overrides.
 *
 * @param category Arbitrary category name used as the logger identifier.
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
 * Calling spdlog logging macros requires a default logger. This helper creates
 * one on demand when the logging subsystem has not been explicitly
 * initialized.
 */
void ensure_default_logger();

/**
 * Return the most recent formatted log messages for the debug console.
 *
 * @param limit Maximum number of lines to return (0 returns everything kept
 *        in the buffer).
 * @return Oldest-first list of formatted messages.
 */
std::vector<std::string> recent_log_lines(std::size_t limit = 0);

/// Resize the in-memory debug console buffer used by the next init_logger().
void set_log_buffer_capacity(std::size_t capacity);

} // namespace prdeck

#endif // PRDECK_LOG_HPP
