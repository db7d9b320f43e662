#include "cli.hpp"
#include "log.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

namespace gitfindr {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 8> categories = {
      "app",     "cli",      "commands",       "config",
      "logging", "registry", "repo.discovery", "store"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., "
         "repo.discovery=debug).";
  return oss.str();
}

/**
 * Make a user-supplied path absolute and lexically normal, without requiring
 * it to exist. A trailing separator is dropped.
 *
 * @param input Path as typed on the command line.
 * @return Normalised path, or @p input unchanged when it is empty.
 */
std::string normalize_cli_path(const std::string &input) {
  if (input.empty()) {
    return input;
  }
  std::error_code ec;
  std::filesystem::path full = std::filesystem::absolute(input, ec);
  if (ec) {
    full = std::filesystem::path(input);
  }
  full = full.lexically_normal();
  if (!full.has_filename() && full.has_relative_path()) {
    full = full.parent_path();
  }
  return full.string();
}
} // namespace

/**
 * Parse command line arguments into the internal option structure.
 *
 * @param argc Argument count provided to @c main().
 * @param argv Argument vector provided to @c main().
 * @return Fully populated CLI options.
 */
CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"Helps you manage your local git repositories.", "gitfindr"};
  app.footer(log_category_help_text());
  app.require_subcommand(1);
  CliOptions options;

  app.add_flag("-v,--verbose", options.verbose, "Enable debug logging")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to settings file (YAML, TOML or JSON)")
      ->type_name("FILE")
      ->group("General");
  app.add_option("-R,--registry", options.registry_file,
                 "Path to the registry file (default: "
                 "$XDG_CONFIG_HOME/gitfindr/gitfindr.toml)")
      ->type_name("FILE")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::int64_t) {
           std::cout << "gitfindr " << GITFINDR_VERSION << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  app.add_option_function<std::string>(
         "--nested-repos",
         [&options](const std::string &value) {
           try {
             options.nested_repos = nested_repo_policy_from_string(value);
           } catch (const std::invalid_argument &) {
             throw CLI::ValidationError("--nested-repos",
                                        "must be one of: descend, stop");
           }
           options.nested_repos_explicit = true;
         },
         "Scan below repositories for nested ones (descend) or not (stop)")
      ->type_name("POLICY")
      ->group("General");
  app.add_option(
         "-l,--log-level", options.log_level,
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->check(CLI::IsMember(
          {"trace", "debug", "info", "warn", "error", "critical", "off"}))
      ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to a log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<std::vector<std::string>>(
         "--log-category",
         [&options](const std::vector<std::string> &values) {
           for (const auto &value : values) {
             auto pos = value.find('=');
             std::string name =
                 pos == std::string::npos ? value : value.substr(0, pos);
             std::string level = pos == std::string::npos
                                     ? std::string{"debug"}
                                     : value.substr(pos + 1);
             if (name.empty()) {
               throw CLI::ValidationError("--log-category",
                                          "category name must not be empty");
             }
             if (level.empty()) {
               level = "debug";
             }
             options.log_categories[name] = level;
           }
           options.log_categories_explicit = true;
         },
         "Enable a logging category (NAME or NAME=LEVEL). See help footer for "
         "available categories.")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");

  auto *add = app.add_subcommand("add", "Adds a local git repo to be tracked.");
  auto *path_opt =
      add->add_option("-p,--path", options.add_path,
                      "Repository to register")
          ->type_name("PATH");
  auto *alias_opt =
      add->add_option("-a,--alias", options.add_alias,
                      "Alias for --path (default: the directory name)")
          ->type_name("ALIAS");
  auto *dir_opt =
      add->add_option("-d,--dir", options.add_dir,
                      "Scan a directory tree and register every repository")
          ->type_name("DIR");
  dir_opt->excludes(path_opt);
  dir_opt->excludes(alias_opt);

  auto *remove = app.add_subcommand(
      "remove", "Removes a local git repo from being tracked.");
  remove->add_option("-n,--name", options.name, "Alias to remove")
      ->type_name("ALIAS")
      ->required();

  auto *list =
      app.add_subcommand("list", "Displays a list of tracked repositories.");
  list->add_flag("-v,--verbose", options.detail,
                 "Mark entries whose path is no longer a repository");

  auto *show = app.add_subcommand(
      "show", "Shows the stored record for the given repository.");
  show->add_option("-n,--name", options.name, "Alias to show")
      ->type_name("ALIAS")
      ->required();
  show->add_flag("-v,--verbose", options.detail, "Show every field");

  try {
    app.parse(argc, argv);
    if (add->parsed() && options.add_path.empty() && options.add_dir.empty()) {
      throw CLI::ValidationError("add", "one of --path or --dir is required");
    }
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }

  if (add->parsed()) {
    options.command = Command::Add;
  } else if (remove->parsed()) {
    options.command = Command::Remove;
  } else if (list->parsed()) {
    options.command = Command::List;
  } else {
    options.command = Command::Show;
  }
  options.add_path = normalize_cli_path(options.add_path);
  options.add_dir = normalize_cli_path(options.add_dir);
  cli_log()->debug("Parsed command line ({} argument(s))", argc);
  return options;
}

} // namespace gitfindr
