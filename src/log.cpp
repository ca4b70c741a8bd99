#include "log.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
std::weak_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;

constexpr const char *kLoggerName = "stud";
constexpr std::size_t kMaxLogFileSize = 1024 * 1024 * 5;

/**
 * Build the sink list of the default logger.
 *
 * @param options File and rotation settings.
 * @return stderr sink followed by the file sink, if any.
 */
std::vector<spdlog::sink_ptr> make_sinks(const stud::LogOptions &options) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (options.file.empty()) {
    return sinks;
  }
  if (options.rotate_files > 0) {
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        options.file, kMaxLogFileSize, options.rotate_files));
  } else {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        options.file, true));
  }
  return sinks;
}
} // namespace

namespace stud {

void init_logger(const LogOptions &options) {
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    auto sinks = make_sinks(options);
    logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(),
                                              sinks.end());
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    g_logger = logger;
  }
  lock.unlock();
  // Applies to category loggers created before this call as well.
  spdlog::set_level(options.level);
  if (!options.pattern.empty()) {
    spdlog::set_pattern(options.pattern);
  }
  logger->debug("Logger initialised (level={}, file='{}', rotate={})",
                spdlog::level::to_string_view(options.level), options.file,
                options.rotate_files);
}

void init_logger(spdlog::level::level_enum level) {
  LogOptions options;
  options.level = level;
  init_logger(options);
}

void ensure_default_logger() {
  auto logger = spdlog::default_logger();
  auto locked = g_logger.lock();
  if (!logger || !locked || logger.get() != locked.get()) {
    init_logger(spdlog::level::info);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  const std::string name = std::string(kLoggerName) + "." + category;
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  auto default_logger = g_logger.lock();
  if (!default_logger) {
    lock.unlock();
    init_logger(spdlog::level::info);
    lock.lock();
    if (auto existing = spdlog::get(name)) {
      return existing;
    }
    default_logger = g_logger.lock();
  }
  std::vector<spdlog::sink_ptr> sinks;
  if (default_logger) {
    sinks = default_logger->sinks();
  } else {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  auto logger =
      std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  logger->set_level(default_logger ? default_logger->level()
                                   : spdlog::level::info);
  spdlog::register_logger(logger);
  return logger;
}

std::size_t configure_log_categories(
    const std::unordered_map<std::string, std::string> &levels) {
  std::size_t applied = 0;
  for (const auto &[category, level_name] : levels) {
    auto level = parse_log_level(level_name);
    if (!level) {
      category_logger("logging")->warn(
          "Ignoring invalid log level '{}' for category '{}'", level_name,
          category);
      continue;
    }
    category_logger(category)->set_level(*level);
    ++applied;
  }
  if (applied > 0) {
    category_logger("logging")->debug("Applied {} log category override(s)",
                                      applied);
  }
  return applied;
}

std::optional<spdlog::level::level_enum>
parse_log_level(const std::string &name) {
  if (name == "off") {
    return spdlog::level::off;
  }
  // from_str reports every unknown name as off
  auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off) {
    return std::nullopt;
  }
  return level;
}

spdlog::level::level_enum level_from_verbosity(int verbosity) {
  if (verbosity >= 2) {
    return spdlog::level::trace;
  }
  if (verbosity == 1) {
    return spdlog::level::debug;
  }
  return spdlog::level::info;
}

} // namespace stud
