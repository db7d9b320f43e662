/**
 * @file repo_discovery.cpp
 * @brief Implements recursive repository discovery below a directory.
 *
 * The walk keeps its own stack of pending directories instead of recursing,
 * so tree depth is bounded only by memory.
 */
#include "repo_discovery.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "repo_validator.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

namespace gitfindr {

namespace {

namespace fs = std::filesystem;

std::shared_ptr<spdlog::logger> discovery_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("repo.discovery");
  }();
  return logger;
}

/**
 * Produce a lowercase copy of the input string.
 *
 * @param value String to normalize.
 * @return Lowercase version of the input string.
 */
std::string normalize(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

void record_issue(ScanResult &result, const fs::path &path,
                  const std::string &message) {
  discovery_log()->warn("{}: {}", path.string(), message);
  result.issues.push_back(ScanIssue{path, message});
}

/**
 * Collect the immediate subdirectories of @p dir. Symbolic links are
 * skipped.
 *
 * @param dir Directory to list.
 * @param out Receives the subdirectories found.
 * @param ec Set when listing fails; entries collected so far are kept.
 * @return `true` when the directory was listed completely.
 */
bool list_child_directories(const fs::path &dir, std::vector<fs::path> &out,
                            std::error_code &ec) {
  fs::directory_iterator it(dir, ec);
  if (ec) {
    return false;
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      return false;
    }
    std::error_code type_ec;
    const auto &entry = *it;
    if (entry.is_symlink(type_ec)) {
      continue;
    }
    if (entry.is_directory(type_ec)) {
      out.push_back(entry.path());
    } else if (type_ec) {
      discovery_log()->debug("Skipping '{}': {}", entry.path().string(),
                             type_ec.message());
    }
  }
  return !ec;
}

} // namespace

std::string to_string(NestedRepoPolicy policy) {
  switch (policy) {
  case NestedRepoPolicy::Descend:
    return "descend";
  case NestedRepoPolicy::StopAtRepository:
    return "stop";
  }
  return "descend";
}

/**
 * Parse a nested repository policy from a string.
 *
 * @param value Textual representation provided by the user.
 * @return Corresponding policy value.
 * @throws std::invalid_argument When the policy cannot be recognised.
 */
NestedRepoPolicy nested_repo_policy_from_string(const std::string &value) {
  static const std::unordered_map<std::string, NestedRepoPolicy> lookup = {
      {"descend", NestedRepoPolicy::Descend},
      {"all", NestedRepoPolicy::Descend},
      {"nested", NestedRepoPolicy::Descend},
      {"recurse", NestedRepoPolicy::Descend},
      {"stop", NestedRepoPolicy::StopAtRepository},
      {"boundary", NestedRepoPolicy::StopAtRepository},
      {"first", NestedRepoPolicy::StopAtRepository},
      {"outermost", NestedRepoPolicy::StopAtRepository}};

  auto it = lookup.find(normalize(value));
  if (it == lookup.end()) {
    throw std::invalid_argument("Unknown nested repository policy: " + value);
  }
  return it->second;
}

bool is_valid_utf8(std::string_view text) {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    std::size_t length = 0;
    unsigned int min = 0;
    unsigned int code = 0;
    if (lead < 0x80) {
      ++i;
      continue;
    } else if ((lead & 0xE0) == 0xC0) {
      length = 2;
      min = 0x80;
      code = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      min = 0x800;
      code = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      min = 0x10000;
      code = lead & 0x07;
    } else {
      return false;
    }
    if (text.size() - i < length) {
      return false;
    }
    for (std::size_t k = 1; k < length; ++k) {
      const auto cont = static_cast<unsigned char>(text[i + k]);
      if ((cont & 0xC0) != 0x80) {
        return false;
      }
      code = (code << 6) | (cont & 0x3F);
    }
    if (code < min || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
      return false;
    }
    i += length;
  }
  return true;
}

std::optional<std::string> derive_repo_name(const fs::path &dir) {
  fs::path normal = dir.lexically_normal();
  if (!normal.empty() && !normal.has_filename()) {
    normal = normal.parent_path();
  }
  std::string name = normal.filename().string();
  if (name.empty() || name == "." || name == "..") {
    return std::nullopt;
  }
  return name;
}

ScanResult scan_repositories(const fs::path &root, const ScanOptions &options) {
  ScanResult result;
  std::vector<fs::path> pending{root};
  std::size_t visited = 0;

  while (!pending.empty()) {
    fs::path dir = std::move(pending.back());
    pending.pop_back();
    ++visited;

    std::vector<fs::path> children;
    std::error_code ec;
    const bool listed = list_child_directories(dir, children, ec);
    if (!listed) {
      record_issue(result, dir, "Cannot read directory: " + ec.message());
    }

    bool repo = false;
    try {
      validate_repository(dir);
      repo = true;
    } catch (const RepoError &) {
      // plain directory
    } catch (const fs::filesystem_error &e) {
      if (listed) {
        record_issue(result, dir, e.what());
      }
      // otherwise the listing failure above already covers this directory
    }

    if (repo) {
      auto name = derive_repo_name(dir);
      if (!name) {
        record_issue(result, dir, to_string(RepoErrorKind::NameExtraction));
      } else if (!is_valid_utf8(dir.string())) {
        record_issue(result, dir, "Path is not valid UTF-8; not registered");
      } else {
        discovery_log()->debug("Discovered repository '{}' at {}", *name,
                               dir.string());
        result.repositories.push_back(RepoRecord{*name, dir});
      }
    }

    if (repo && options.nested == NestedRepoPolicy::StopAtRepository) {
      continue;
    }
    for (auto &child : children) {
      pending.push_back(std::move(child));
    }
  }

  discovery_log()->info(
      "Scanned {} director{} under {}: {} repositor{}, {} issue(s)", visited,
      visited == 1 ? "y" : "ies", root.string(), result.repositories.size(),
      result.repositories.size() == 1 ? "y" : "ies", result.issues.size());
  return result;
}

} // namespace gitfindr
