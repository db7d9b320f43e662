#include "errors.hpp"

namespace gitfindr {

std::string to_string(RepoErrorKind kind) {
  switch (kind) {
  case RepoErrorKind::NotARepository:
    return "The given directory is not a valid repository.";
  case RepoErrorKind::AlreadyExists:
    return "The given repository already exists.";
  case RepoErrorKind::DoesNotExist:
    return "The given repository does not exist.";
  case RepoErrorKind::NameExtraction:
    return "Could not derive a repository name from the path.";
  }
  return "Unknown repository error.";
}

RepoError::RepoError(RepoErrorKind kind, const std::string &subject)
    : std::runtime_error(to_string(kind) + " (" + subject + ")"), kind_(kind),
      subject_(subject) {}

} // namespace gitfindr
