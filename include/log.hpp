/**
 * @file log.hpp
 * @brief spdlog setup shared by every stud module.
 *
 * Diagnostics go to stderr and, optionally, a log file. Command results are
 * printed through Console instead so that they do not depend on the level.
 */

#ifndef STUD_LOG_HPP
#define STUD_LOG_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace stud {

/// Destinations and format of the default logger.
struct LogOptions {
  spdlog::level::level_enum level{spdlog::level::info};
  std::string pattern;         ///< Empty keeps the spdlog default
  std::string file;            ///< Empty disables file output
  std::size_t rotate_files{3}; ///< Rotated files kept; 0 writes one file
};

/**
 * Create the default `stud` logger.
 *
 * Sinks are fixed by the first call. Later calls only change the level of
 * every registered logger and the pattern.
 *
 * @param options Level, pattern and file settings.
 */
void init_logger(const LogOptions &options);

/// Same as init_logger() with only the level set.
void init_logger(spdlog::level::level_enum level);

/**
 * Logger named `stud.<category>` writing to the default logger's sinks.
 *
 * The logger is created on first use with the default logger's level.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/**
 * Set category levels from level names.
 *
 * Unknown level names are skipped with a warning on the `logging` category.
 *
 * @param levels Category name to level name, e.g. `git` -> `trace`.
 * @return Number of categories whose level was set.
 */
std::size_t configure_log_categories(
    const std::unordered_map<std::string, std::string> &levels);

/// Create an info level default logger unless init_logger() already ran.
void ensure_default_logger();

/**
 * Parse a level name as accepted by `--log-level`.
 *
 * @return Level, or `std::nullopt` for an unknown name.
 */
std::optional<spdlog::level::level_enum>
parse_log_level(const std::string &name);

/// `info` without `-v`, `debug` for `-v`, `trace` for `-vv` and more.
spdlog::level::level_enum level_from_verbosity(int verbosity);

} // namespace stud

#endif // STUD_LOG_HPP
