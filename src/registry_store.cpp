/**
 * @file registry_store.cpp
 * @brief Implements loading and saving of the registry file.
 */
#include "registry_store.hpp"
#include "constants.hpp"
#include "document.hpp"
#include "log.hpp"

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace gitfindr {

namespace {

namespace fs = std::filesystem;

std::shared_ptr<spdlog::logger> store_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("store");
  }();
  return logger;
}

/**
 * Fetch an environment variable in a cross-platform, secure manner.
 *
 * @param name Null-terminated environment variable name.
 * @return Variable contents or an empty string if unavailable.
 */
std::string get_env_var(const char *name) {
#ifdef _WIN32
  char *buf = nullptr;
  size_t sz = 0;
  if (_dupenv_s(&buf, &sz, name) == 0 && buf) {
    std::string value(buf);
    std::free(buf);
    return value;
  }
  return {};
#else
  const char *env = std::getenv(name);
  return env ? std::string(env) : std::string();
#endif
}

} // namespace

fs::path default_registry_path() {
  const fs::path app_dir{std::string(kAppName)};
  const fs::path file{std::string(kDefaultRegistryFile)};
  auto xdg_config = get_env_var("XDG_CONFIG_HOME");
  if (!xdg_config.empty()) {
    return fs::path(xdg_config) / app_dir / file;
  }
  auto home = get_env_var("HOME");
#ifdef _WIN32
  if (home.empty()) {
    home = get_env_var("APPDATA");
    if (!home.empty()) {
      return fs::path(home) / app_dir / file;
    }
  }
#endif
  if (!home.empty()) {
    return fs::path(home) / ".config" / app_dir / file;
  }
  return file;
}

RepoRegistry load_registry(const fs::path &path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    if (ec) {
      throw std::runtime_error("Failed to access registry " + path.string() +
                               ": " + ec.message());
    }
    store_log()->debug("Registry {} does not exist yet; starting empty",
                       path.string());
    return RepoRegistry{};
  }
  nlohmann::json doc = read_document(path, ScalarMode::Verbatim);
  try {
    RepoRegistry registry = RepoRegistry::from_json(doc);
    store_log()->debug("Loaded {} repositor{} from {}", registry.size(),
                       registry.size() == 1 ? "y" : "ies", path.string());
    return registry;
  } catch (const std::exception &e) {
    throw std::runtime_error("Invalid registry " + path.string() + ": " +
                             e.what());
  }
}

void save_registry(const fs::path &path, const RepoRegistry &registry) {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("Failed to create directory " +
                               path.parent_path().string() + ": " +
                               ec.message());
    }
  }
  // Same extension as the target so write_document picks the same format.
  fs::path tmp = path;
  tmp.replace_filename("." + path.stem().string() + ".tmp" +
                       path.extension().string());
  try {
    write_document(tmp, registry.to_json());
  } catch (const std::exception &) {
    std::error_code cleanup_ec;
    fs::remove(tmp, cleanup_ec);
    throw;
  }
  fs::rename(tmp, path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    fs::remove(tmp, cleanup_ec);
    throw std::runtime_error("Failed to replace registry " + path.string() +
                             ": " + ec.message());
  }
  store_log()->debug("Saved {} repositor{} to {}", registry.size(),
                     registry.size() == 1 ? "y" : "ies", path.string());
}

} // namespace gitfindr
