/**
 * @file repo_validator.hpp
 * @brief Classification of directories as git repositories.
 *
 * A directory is a repository when it holds a direct child entry named
 * `.git`. Both `.git` directories and worktree `.git` link files match.
 */
#ifndef GITFINDR_REPO_VALIDATOR_HPP
#define GITFINDR_REPO_VALIDATOR_HPP

#include <filesystem>

namespace gitfindr {

/**
 * Check that @p dir is a git repository.
 *
 * @param dir Directory to inspect.
 * @throws RepoError With RepoErrorKind::NotARepository when the directory is
 *         readable but holds no `.git` entry.
 * @throws std::filesystem::filesystem_error When the directory cannot be
 *         listed.
 */
void validate_repository(const std::filesystem::path &dir);

/**
 * Non-throwing form of validate_repository().
 *
 * @param dir Directory to inspect.
 * @return `true` when @p dir holds a `.git` entry; unreadable directories
 *         yield `false`.
 */
bool is_repository(const std::filesystem::path &dir) noexcept;

} // namespace gitfindr

#endif // GITFINDR_REPO_VALIDATOR_HPP
