#include "log.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
std::weak_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;

constexpr std::size_t kMaxLogFileSize = 1024 * 1024 * 5;

/**
 * Sink shared by the default logger and every category logger. Replacing its
 * children redirects loggers that were created before init_logger() ran.
 */
std::shared_ptr<spdlog::sinks::dist_sink_mt> shared_sink() {
  static auto sink = [] {
    auto dist = std::make_shared<spdlog::sinks::dist_sink_mt>();
    dist->add_sink(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    return dist;
  }();
  return sink;
}

std::shared_ptr<spdlog::logger> make_logger(const std::string &name) {
  auto logger = std::make_shared<spdlog::logger>(name, shared_sink());
  spdlog::register_logger(logger);
  return logger;
}
} // namespace

namespace gitfindr {

/**
 * Initialize the global spdlog logger with optional file rotation.
 *
 * Diagnostics go to stderr so command output on stdout stays clean. Each call
 * replaces the file sink and applies @p level to every registered logger.
 *
 * @param level Logging verbosity level for all loggers.
 * @param pattern Log message pattern; empty string retains the default.
 * @param file Optional log file path.
 * @param rotate_files Maximum number of rotated files to keep.
 */
void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files) {
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!file.empty()) {
    if (rotate_files > 0) {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          file, kMaxLogFileSize, rotate_files));
    } else {
      sinks.push_back(
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(file));
    }
  }
  shared_sink()->set_sinks(std::move(sinks));

  auto logger = spdlog::get("gitfindr");
  if (!logger) {
    logger = make_logger("gitfindr");
    spdlog::set_default_logger(logger);
    g_logger = logger;
  }
  lock.unlock();
  spdlog::set_level(level);
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->debug("Logger initialised (level={}, file='{}', rotate={})",
                spdlog::level::to_string_view(level), file, rotate_files);
}

/**
 * Ensure that the default logger exists before logging.
 *
 * Creates a new logger when previous initialization was skipped or lost.
 */
void ensure_default_logger() {
  auto logger = spdlog::default_logger();
  auto locked = g_logger.lock();
  if (!logger || !locked || logger.get() != locked.get()) {
    init_logger(spdlog::level::warn, "[%l] %v");
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  ensure_default_logger();
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get("gitfindr." + category);
  if (logger) {
    return logger;
  }
  auto default_logger = g_logger.lock();
  auto new_logger = make_logger("gitfindr." + category);
  if (default_logger) {
    new_logger->set_level(default_logger->level());
  }
  return new_logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  if (overrides.empty()) {
    return;
  }
  for (const auto &[category, level] : overrides) {
    auto logger = category_logger(category);
    logger->set_level(level);
    logger->debug("Category '{}' set to level {}", category,
                  spdlog::level::to_string_view(level));
  }
  category_logger("logging")
      ->debug("Applied {} log category override(s)", overrides.size());
}

} // namespace gitfindr
