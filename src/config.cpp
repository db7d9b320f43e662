#include "config.hpp"
#include "document.hpp"
#include "log.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace gitfindr {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

/**
 * Merge recognised configuration sections into the root object so grouped
 * configuration files can expose the same flat keys that the loader expects.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  auto merge_section = [&normalized](std::string_view name) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      return;
    }
    const nlohmann::json section = *it;
    for (const auto &[key, value] : section.items()) {
      normalized[key] = value;
    }
  };

  for (std::string_view section : {"logging", "registry", "scan"}) {
    merge_section(section);
  }

  return normalized;
}

/**
 * Read a scalar setting, naming the key when its type is wrong.
 */
template <typename T>
T setting(const nlohmann::json &cfg, const char *key) {
  try {
    return cfg.at(key).get<T>();
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error(std::string("Invalid value for '") + key +
                             "': " + e.what());
  }
}

} // namespace

void Config::load_json(const nlohmann::json &j) {
  if (j.is_null()) {
    return;
  }
  if (!j.is_object()) {
    throw std::runtime_error("Configuration root must be a mapping");
  }
  nlohmann::json cfg = normalize_config_sections(j);

  if (cfg.contains("log_level")) {
    set_log_level(setting<std::string>(cfg, "log_level"));
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(setting<std::string>(cfg, "log_pattern"));
  }
  if (cfg.contains("log_file")) {
    set_log_file(setting<std::string>(cfg, "log_file"));
  }
  if (cfg.contains("log_rotate")) {
    set_log_rotate(setting<int>(cfg, "log_rotate"));
  }
  if (cfg.contains("log_categories")) {
    const auto &value = cfg["log_categories"];
    if (!value.is_object()) {
      throw std::runtime_error("'log_categories' must be a mapping");
    }
    std::unordered_map<std::string, std::string> categories;
    for (const auto &[category, level] : value.items()) {
      if (!level.is_string()) {
        throw std::runtime_error("Log level for category '" + category +
                                 "' must be a string");
      }
      categories[category] = level.get<std::string>();
    }
    set_log_categories(std::move(categories));
  }
  // Accept both the flat key and `registry: {file: ...}`.
  if (cfg.contains("registry_file")) {
    set_registry_file(setting<std::string>(cfg, "registry_file"));
  } else if (cfg.contains("file")) {
    set_registry_file(setting<std::string>(cfg, "file"));
  }
  if (cfg.contains("nested_repos")) {
    try {
      set_nested_repos(nested_repo_policy_from_string(
          setting<std::string>(cfg, "nested_repos")));
    } catch (const std::invalid_argument &e) {
      throw std::runtime_error(e.what());
    }
  }
}

/**
 * Construct a configuration object from a JSON representation.
 *
 * @param j JSON document with configuration values.
 * @return Populated configuration instance.
 */
Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

/**
 * Load configuration from a file on disk.
 *
 * The file type is inferred from the extension and may be YAML, JSON, or
 * TOML. Errors propagate to the caller, which reports them.
 */
Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  Config cfg;
  cfg.load_json(read_document(path, ScalarMode::Infer));
  config_log()->debug("Config loaded successfully from {}", path);
  return cfg;
}

} // namespace gitfindr
