#include "app.hpp"
#include "log.hpp"
#include "registry_store.hpp"
#include <exception>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace gitfindr {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}
} // namespace

/**
 * Resolve logging settings from the command line and the settings file and
 * apply them. Command line values win.
 */
void App::init_logging() {
  std::string level_str = config_.log_level();
  if (!options_.log_level.empty()) {
    level_str = options_.log_level;
  } else if (options_.verbose) {
    level_str = "debug";
  }
  spdlog::level::level_enum lvl = spdlog::level::from_str(level_str);
  if (lvl == spdlog::level::off && level_str != "off") {
    app_log()->warn("Ignoring invalid log level '{}'", level_str);
    lvl = spdlog::level::warn;
  }
  std::string log_file =
      options_.log_file.empty() ? config_.log_file() : options_.log_file;
  init_logger(lvl, config_.log_pattern(), log_file,
              static_cast<std::size_t>(config_.log_rotate()));

  if (options_.log_categories_explicit) {
    config_.set_log_categories(options_.log_categories);
  }
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, category_level] : config_.log_categories()) {
    auto parsed = spdlog::level::from_str(category_level);
    if (parsed == spdlog::level::off && category_level != "off") {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      category_level, category);
      continue;
    }
    category_levels[category] = parsed;
  }
  configure_log_categories(category_levels);
}

/**
 * Execute the main application flow.
 *
 * Parses the command line, loads settings and the registry, runs the selected
 * command and saves the registry again. Only failures to read or write the
 * settings or registry files end the run with a non-zero status.
 *
 * @param argc Argument count passed from @c main().
 * @param argv Argument vector passed from @c main().
 * @return Process exit code.
 */
int App::run(int argc, char **argv) {
  status_ = CommandStatus::Ok;
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    return exit.exit_code();
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    return 1;
  }

  config_ = Config{};
  if (!options_.config_file.empty()) {
    try {
      config_ = Config::from_file(options_.config_file);
    } catch (const std::exception &e) {
      app_log()->error("Failed to load config {}: {}", options_.config_file,
                       e.what());
      return 1;
    }
  }
  if (options_.nested_repos_explicit) {
    config_.set_nested_repos(options_.nested_repos);
  } else {
    options_.nested_repos = config_.nested_repos();
  }
  if (!options_.registry_file.empty()) {
    config_.set_registry_file(options_.registry_file);
  }

  try {
    init_logging();
  } catch (const spdlog::spdlog_ex &e) {
    app_log()->error("Failed to initialise logging: {}", e.what());
    return 1;
  }

  registry_path_ = config_.registry_file().empty()
                       ? default_registry_path()
                       : std::filesystem::path(config_.registry_file());
  try {
    registry_ = load_registry(registry_path_);
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    return 1;
  }

  status_ = execute_command(options_, registry_, out_);
  out_.flush();

  try {
    save_registry(registry_path_, registry_);
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    return 1;
  }
  return 0;
}

} // namespace gitfindr
