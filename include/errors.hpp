/**
 * @file errors.hpp
 * @brief Error kinds raised by repository validation and registry updates.
 */
#ifndef GITFINDR_ERRORS_HPP
#define GITFINDR_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace gitfindr {

/// Closed set of recoverable registry failures.
enum class RepoErrorKind {
  NotARepository, ///< Directory has no `.git` entry
  AlreadyExists,  ///< Alias already registered
  DoesNotExist,   ///< Alias not registered
  NameExtraction  ///< No default name could be derived from a path
};

/**
 * @brief Human-readable message describing an error kind.
 * @param kind The error kind.
 * @return Fixed message text for @p kind.
 */
std::string to_string(RepoErrorKind kind);

/**
 * Raised by the validator and the registry for the failures listed in
 * RepoErrorKind. The subject is the path or alias the failure refers to.
 */
class RepoError : public std::runtime_error {
public:
  /**
   * Construct an error for the given kind and subject.
   *
   * @param kind Failure category.
   * @param subject Path or alias involved in the failure.
   */
  RepoError(RepoErrorKind kind, const std::string &subject);

  /// Failure category.
  RepoErrorKind kind() const noexcept { return kind_; }

  /// Path or alias the failure refers to.
  const std::string &subject() const noexcept { return subject_; }

private:
  RepoErrorKind kind_;
  std::string subject_;
};

} // namespace gitfindr

#endif // GITFINDR_ERRORS_HPP
