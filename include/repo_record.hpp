/**
 * @file repo_record.hpp
 * @brief Value type describing one tracked repository.
 */
#ifndef GITFINDR_REPO_RECORD_HPP
#define GITFINDR_REPO_RECORD_HPP

#include <filesystem>
#include <string>

namespace gitfindr {

/// A repository registered under an alias.
struct RepoRecord {
  std::string name;            ///< Alias, unique within a registry
  std::filesystem::path path;  ///< Repository root
};

inline bool operator==(const RepoRecord &lhs, const RepoRecord &rhs) {
  return lhs.name == rhs.name && lhs.path == rhs.path;
}

inline bool operator!=(const RepoRecord &lhs, const RepoRecord &rhs) {
  return !(lhs == rhs);
}

} // namespace gitfindr

#endif // GITFINDR_REPO_RECORD_HPP
