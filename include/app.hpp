/**
 * @file app.hpp
 * @brief Main application entry point and orchestrator for gitfindr.
 *
 * Declares the App class, which manages CLI parsing, settings loading,
 * logging setup, and the load/execute/save cycle of the registry.
 */

#ifndef GITFINDR_APP_HPP
#define GITFINDR_APP_HPP

#include "cli.hpp"
#include "commands.hpp"
#include "config.hpp"
#include "registry.hpp"

#include <filesystem>
#include <iostream>
#include <ostream>

namespace gitfindr {

/**
 * Main application entry point responsible for orchestrating high level
 * application flow.
 */
class App {
public:
  /**
   * Construct an application writing command output to @p out.
   *
   * @param out Stream receiving user-facing output.
   */
  explicit App(std::ostream &out = std::cout) : out_(out) {}

  /**
   * Run the application with the given command line arguments.
   *
   * The registry is saved after every command, including commands that
   * reported an error.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return Zero on success or after a non-fatal command error, non-zero when
   *         parsing failed or the registry/settings file could not be read
   *         or written.
   */
  int run(int argc, char **argv);

  /// Parsed command line options.
  const CliOptions &options() const { return options_; }

  /// Loaded settings.
  const Config &config() const { return config_; }

  /// Registry as left by the last run().
  const RepoRegistry &registry() const { return registry_; }

  /// Registry file used by the last run().
  const std::filesystem::path &registry_path() const { return registry_path_; }

  /// Status of the command executed by the last run().
  CommandStatus command_status() const { return status_; }

private:
  void init_logging();

  std::ostream &out_;
  CliOptions options_;
  Config config_;
  RepoRegistry registry_;
  std::filesystem::path registry_path_;
  CommandStatus status_{CommandStatus::Ok};
};

} // namespace gitfindr

#endif // GITFINDR_APP_HPP
