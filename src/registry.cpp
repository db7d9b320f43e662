/**
 * @file registry.cpp
 * @brief Implements the alias-keyed repository registry.
 */
#include "registry.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace gitfindr {

namespace {
std::shared_ptr<spdlog::logger> registry_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("registry");
  }();
  return logger;
}
} // namespace

void RepoRegistry::add(const RepoRecord &record) {
  auto inserted = repos_.emplace(record.name, record);
  if (!inserted.second) {
    throw RepoError(RepoErrorKind::AlreadyExists, record.name);
  }
  registry_log()->debug("Registered '{}' -> {}", record.name,
                        record.path.string());
}

/**
 * Insert every record that does not collide with an existing alias.
 *
 * @param records Candidate repositories.
 * @return Report listing inserted aliases and skipped records.
 */
BatchAddReport RepoRegistry::add_all(const std::vector<RepoRecord> &records) {
  BatchAddReport report;
  for (const auto &record : records) {
    try {
      add(record);
      report.added.push_back(record.name);
    } catch (const RepoError &e) {
      report.skipped.push_back(ScanIssue{record.path, e.what()});
    }
  }
  return report;
}

void RepoRegistry::remove(const std::string &name) {
  if (repos_.erase(name) == 0) {
    throw RepoError(RepoErrorKind::DoesNotExist, name);
  }
  registry_log()->debug("Removed '{}'", name);
}

std::optional<RepoRecord> RepoRegistry::get(const std::string &name) const {
  auto it = repos_.find(name);
  if (it == repos_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool RepoRegistry::contains(const std::string &name) const {
  return repos_.find(name) != repos_.end();
}

nlohmann::json RepoRegistry::to_json() const {
  nlohmann::json repos = nlohmann::json::object();
  for (const auto &[alias, record] : repos_) {
    repos[alias] = {{"name", record.name}, {"path", record.path.string()}};
  }
  return nlohmann::json{{"repos", repos}};
}

/**
 * Load a registry from its JSON representation.
 *
 * @param j Document with a `repos` object.
 * @return Registry containing every entry of the document.
 * @throws std::runtime_error When `repos` or an entry has the wrong shape.
 */
RepoRegistry RepoRegistry::from_json(const nlohmann::json &j) {
  RepoRegistry registry;
  if (j.is_null()) {
    return registry;
  }
  if (!j.is_object()) {
    throw std::runtime_error("Registry document must be an object");
  }
  auto repos = j.find("repos");
  if (repos == j.end() || repos->is_null()) {
    return registry;
  }
  if (!repos->is_object()) {
    throw std::runtime_error("Registry 'repos' must be a mapping");
  }
  for (const auto &[alias, entry] : repos->items()) {
    if (!entry.is_object()) {
      throw std::runtime_error("Registry entry '" + alias +
                               "' must be a mapping");
    }
    auto path = entry.find("path");
    if (path == entry.end() || !path->is_string()) {
      throw std::runtime_error("Registry entry '" + alias +
                               "' has no string 'path'");
    }
    auto name = entry.find("name");
    if (name != entry.end() &&
        (!name->is_string() || name->get<std::string>() != alias)) {
      registry_log()->warn(
          "Registry entry '{}' carries a different name; using the key",
          alias);
    }
    registry.repos_.emplace(alias,
                            RepoRecord{alias, path->get<std::string>()});
  }
  return registry;
}

} // namespace gitfindr
