#ifndef GITFINDR_CONFIG_HPP
#define GITFINDR_CONFIG_HPP

#include "repo_discovery.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <utility>

namespace gitfindr {

/// Application settings loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /// Get logging verbosity level.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Get logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Path to the log file (empty disables file logging).
  const std::string &log_file() const { return log_file_; }

  /// Set path for the log file.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to keep (0 disables rotation).
  int log_rotate() const { return log_rotate_; }

  /// Set number of rotated log files to keep.
  void set_log_rotate(int files) { log_rotate_ = files < 0 ? 0 : files; }

  /// Per-category log level overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace per-category log level overrides.
  void set_log_categories(
      std::unordered_map<std::string, std::string> categories) {
    log_categories_ = std::move(categories);
  }

  /// Registry file location (empty selects the default location).
  const std::string &registry_file() const { return registry_file_; }

  /// Set registry file location.
  void set_registry_file(const std::string &file) { registry_file_ = file; }

  /// Handling of repositories nested inside other repositories.
  NestedRepoPolicy nested_repos() const { return nested_repos_; }

  /// Set handling of nested repositories.
  void set_nested_repos(NestedRepoPolicy policy) { nested_repos_ = policy; }

  /**
   * Load configuration from a file on disk.
   *
   * @param path Path to a `.yaml`, `.yml`, `.toml` or `.json` file.
   * @return Parsed configuration.
   * @throws std::runtime_error When the file cannot be read or parsed.
   */
  static Config from_file(const std::string &path);

  /**
   * Build a configuration from a JSON document. Keys may be flat or grouped
   * under `logging`, `registry` and `scan`.
   *
   * @param j Parsed document.
   * @return Populated configuration.
   * @throws std::runtime_error When a value has the wrong type.
   */
  static Config from_json(const nlohmann::json &j);

private:
  void load_json(const nlohmann::json &j);

  std::string log_level_ = "warn";
  std::string log_pattern_ = "[%l] %v";
  std::string log_file_;
  int log_rotate_ = 3;
  std::unordered_map<std::string, std::string> log_categories_;
  std::string registry_file_;
  NestedRepoPolicy nested_repos_ = NestedRepoPolicy::Descend;
};

} // namespace gitfindr

#endif // GITFINDR_CONFIG_HPP
