/**
 * @file repo_validator.cpp
 * @brief Implements the `.git` marker check for repository directories.
 */
#include "repo_validator.hpp"
#include "constants.hpp"
#include "errors.hpp"

#include <system_error>

namespace gitfindr {

void validate_repository(const std::filesystem::path &dir) {
  // Name-only check: a `.git` file (worktree link) counts as well.
  for (const auto &entry : std::filesystem::directory_iterator(dir)) {
    if (entry.path().filename().string() == kRepoMarker) {
      return;
    }
  }
  throw RepoError(RepoErrorKind::NotARepository, dir.string());
}

bool is_repository(const std::filesystem::path &dir) noexcept {
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    return false;
  }
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec) {
      return false;
    }
    if (it->path().filename().string() == kRepoMarker) {
      return true;
    }
  }
  return false;
}

} // namespace gitfindr
