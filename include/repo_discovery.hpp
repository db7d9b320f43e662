/**
 * @file repo_discovery.hpp
 * @brief Recursive discovery of git repositories below a directory.
 *
 * Provides the nested-repository policy, its string conversions, default
 * name derivation, and the iterative directory walk that collects every
 * repository found under a root.
 */
#ifndef GITFINDR_REPO_DISCOVERY_HPP
#define GITFINDR_REPO_DISCOVERY_HPP

#include "repo_record.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitfindr {

/// How the walk treats directories below a repository.
enum class NestedRepoPolicy {
  Descend,         ///< Keep descending; nested repositories are reported
  StopAtRepository ///< Do not descend below a directory that is a repository
};

/**
 * @brief Convert a nested repository policy to lowercase string.
 * @param policy The policy.
 * @return Lowercase string representation of the policy.
 */
std::string to_string(NestedRepoPolicy policy);

/**
 * @brief Parse a string into a nested repository policy.
 * @param value String to parse (case-insensitive).
 * @return Parsed NestedRepoPolicy value.
 * @throws std::invalid_argument When the value is not recognised.
 */
NestedRepoPolicy nested_repo_policy_from_string(const std::string &value);

/// Options controlling scan_repositories().
struct ScanOptions {
  NestedRepoPolicy nested{NestedRepoPolicy::Descend};
};

/// Non-fatal problem encountered for a single path.
struct ScanIssue {
  std::filesystem::path path; ///< Directory or record the issue refers to
  std::string message;        ///< Single-line description
};

/// Outcome of a directory scan.
struct ScanResult {
  std::vector<RepoRecord> repositories; ///< Discovered repositories, unordered
  std::vector<ScanIssue> issues;        ///< Per-directory failures
};

/**
 * Derive the default alias for a repository directory.
 *
 * The alias is the last component of @p dir itself. Trailing separators are
 * ignored.
 *
 * @param dir Repository directory.
 * @return Derived name, or `std::nullopt` for paths without a final name
 *         component such as `/`, `.` or `..`.
 */
std::optional<std::string> derive_repo_name(const std::filesystem::path &dir);

/**
 * Check that @p text is well-formed UTF-8.
 *
 * Registry files only hold UTF-8 text, so names and paths that fail this
 * check cannot be stored.
 *
 * @param text Bytes to check.
 * @return `true` when @p text contains no truncated, overlong or surrogate
 *         sequences.
 */
bool is_valid_utf8(std::string_view text);

/**
 * Walk the tree below @p root and collect every git repository in it.
 *
 * The walk uses an explicit stack, visits each directory once and does not
 * follow symbolic links. The root itself is validated too. Directories that
 * cannot be listed, repositories without a derivable name and repositories
 * whose name or path is not valid UTF-8 are recorded in ScanResult::issues
 * and the walk continues. A directory that fails part way through listing is
 * still validated and the children listed so far are still visited.
 *
 * @param root Directory to scan.
 * @param options Scan behaviour.
 * @return Repositories and issues found during the walk.
 */
ScanResult scan_repositories(const std::filesystem::path &root,
                             const ScanOptions &options = {});

} // namespace gitfindr

#endif // GITFINDR_REPO_DISCOVERY_HPP
