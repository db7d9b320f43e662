/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for gitfindr.
 *
 * Declares the parsed option structure, the subcommand selector, and the
 * exception used to request an early exit from parsing.
 */

#ifndef GITFINDR_CLI_HPP
#define GITFINDR_CLI_HPP

#include "repo_discovery.hpp"
#include <exception>
#include <string>
#include <unordered_map>

namespace gitfindr {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Process exit code that should be returned to the caller.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/// Subcommand selected on the command line.
enum class Command { Add, Remove, List, Show };

/**
 * Parsed command line options supplied via the CLI.
 *
 * Paths are stored absolute and lexically normalised.
 */
struct CliOptions {
  Command command{Command::List}; ///< Selected subcommand
  bool verbose = false;           ///< Debug logging
  std::string config_file;        ///< Optional settings file
  std::string registry_file;      ///< Registry location override
  std::string log_level;          ///< Logging level override (empty = unset)
  std::string log_file;           ///< Optional log file
  std::unordered_map<std::string, std::string>
      log_categories; ///< Category -> level overrides requested via CLI
  bool log_categories_explicit{false}; ///< True if CLI specified categories
  NestedRepoPolicy nested_repos{
      NestedRepoPolicy::Descend};   ///< Nested repository handling
  bool nested_repos_explicit{false}; ///< True if CLI set the policy

  std::string add_path;  ///< `add --path`: single repository
  std::string add_alias; ///< `add --alias`: empty derives from the path
  std::string add_dir;   ///< `add --dir`: directory to scan
  std::string name;      ///< `remove`/`show` alias
  bool detail{false};    ///< `list`/`show` verbose output
};

/**
 * Parse command line arguments and return the normalized options structure.
 *
 * @param argc Number of elements supplied in @p argv.
 * @param argv Null-terminated array of raw CLI argument strings.
 * @return Populated options structure describing the requested command.
 * @throws CliParseExit When parsing fails or `--help`/`--version` is given;
 *         CLI11 has already printed the corresponding message.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace gitfindr

#endif // GITFINDR_CLI_HPP
