/**
 * @file commands.cpp
 * @brief Implements the add, remove, list and show subcommands.
 */
#include "commands.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "repo_discovery.hpp"
#include "repo_validator.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

#include <spdlog/spdlog.h>

namespace gitfindr {

namespace {

namespace fs = std::filesystem;

std::shared_ptr<spdlog::logger> commands_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("commands");
  }();
  return logger;
}

CommandStatus add_single(const CliOptions &options, RepoRegistry &registry,
                         std::ostream &out) {
  const fs::path path(options.add_path);
  std::string alias = options.add_alias;
  if (alias.empty()) {
    auto derived = derive_repo_name(path);
    if (!derived) {
      commands_log()->error("{}", RepoError(RepoErrorKind::NameExtraction,
                                            path.string())
                                      .what());
      return CommandStatus::Failed;
    }
    alias = *derived;
  }
  if (!is_valid_utf8(path.string()) || !is_valid_utf8(alias)) {
    commands_log()->error("Cannot register {}: not valid UTF-8",
                          path.string());
    return CommandStatus::Failed;
  }
  try {
    validate_repository(path);
    registry.add(RepoRecord{alias, path});
  } catch (const RepoError &e) {
    commands_log()->error("{}", e.what());
    return CommandStatus::Failed;
  } catch (const fs::filesystem_error &e) {
    commands_log()->error("Cannot read {}: {}", path.string(),
                          e.code().message());
    return CommandStatus::Failed;
  }
  out << "Added '" << alias << "' -> " << path.string() << "\n";
  return CommandStatus::Ok;
}

CommandStatus add_directory(const CliOptions &options, RepoRegistry &registry,
                            std::ostream &out) {
  const fs::path root(options.add_dir);
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    commands_log()->error("Cannot scan {}: {}", root.string(),
                          ec ? ec.message() : "not a directory");
    return CommandStatus::Failed;
  }
  ScanOptions scan_options;
  scan_options.nested = options.nested_repos;
  ScanResult scan = scan_repositories(root, scan_options);

  BatchAddReport report = registry.add_all(scan.repositories);
  for (const auto &skipped : report.skipped) {
    commands_log()->warn("Skipped {}: {}", skipped.path.string(),
                         skipped.message);
  }
  out << "Added " << report.added.size() << " "
      << (report.added.size() == 1 ? "repository" : "repositories")
      << " from " << root.string() << "\n";
  return CommandStatus::Ok;
}

CommandStatus remove_repo(const CliOptions &options, RepoRegistry &registry,
                          std::ostream &out) {
  try {
    registry.remove(options.name);
  } catch (const RepoError &e) {
    commands_log()->error("{}", e.what());
    return CommandStatus::Failed;
  }
  out << "Removed '" << options.name << "'\n";
  return CommandStatus::Ok;
}

CommandStatus list_repos(const CliOptions &options,
                         const RepoRegistry &registry, std::ostream &out) {
  if (registry.empty()) {
    out << "No repos to show!\n";
    return CommandStatus::Ok;
  }
  for (const auto &[alias, record] : registry) {
    out << alias << " : " << record.path.string();
    if (options.detail && !is_repository(record.path)) {
      out << " [missing]";
    }
    out << "\n";
  }
  return CommandStatus::Ok;
}

CommandStatus show_repo(const CliOptions &options,
                        const RepoRegistry &registry, std::ostream &out) {
  auto record = registry.get(options.name);
  if (!record) {
    out << "No repo named '" << options.name << "'.\n";
    return CommandStatus::Failed;
  }
  if (!options.detail) {
    out << record->name << " : " << record->path.string() << "\n";
    return CommandStatus::Ok;
  }
  out << "name: " << record->name << "\n";
  out << "path: " << record->path.string() << "\n";
  out << "repository: " << (is_repository(record->path) ? "yes" : "missing")
      << "\n";
  return CommandStatus::Ok;
}

} // namespace

CommandStatus execute_command(const CliOptions &options,
                              RepoRegistry &registry, std::ostream &out) {
  switch (options.command) {
  case Command::Add:
    return options.add_dir.empty() ? add_single(options, registry, out)
                                   : add_directory(options, registry, out);
  case Command::Remove:
    return remove_repo(options, registry, out);
  case Command::List:
    return list_repos(options, registry, out);
  case Command::Show:
    return show_repo(options, registry, out);
  }
  return CommandStatus::Failed;
}

} // namespace gitfindr
