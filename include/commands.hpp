/**
 * @file commands.hpp
 * @brief Execution of parsed subcommands against the registry.
 */
#ifndef GITFINDR_COMMANDS_HPP
#define GITFINDR_COMMANDS_HPP

#include "cli.hpp"
#include "registry.hpp"

#include <ostream>

namespace gitfindr {

/// Result of a single subcommand.
enum class CommandStatus {
  Ok,    ///< Command completed
  Failed ///< Command reported an error; the registry is still persisted
};

/**
 * Run the subcommand described by @p options.
 *
 * User-facing results are written to @p out; failures are logged as single
 * error lines and never thrown.
 *
 * @param options Parsed command line.
 * @param registry Registry to read or update.
 * @param out Destination for command output.
 * @return Whether the command succeeded.
 */
CommandStatus execute_command(const CliOptions &options,
                              RepoRegistry &registry, std::ostream &out);

} // namespace gitfindr

#endif // GITFINDR_COMMANDS_HPP
