/**
 * @file registry.hpp
 * @brief In-memory registry of tracked repositories keyed by alias.
 */
#ifndef GITFINDR_REGISTRY_HPP
#define GITFINDR_REGISTRY_HPP

#include "repo_discovery.hpp"
#include "repo_record.hpp"

#include <cstddef>
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace gitfindr {

/// Outcome of RepoRegistry::add_all().
struct BatchAddReport {
  std::vector<std::string> added;  ///< Aliases inserted
  std::vector<ScanIssue> skipped;  ///< Records rejected, with the reason
};

/**
 * Mapping from alias to repository record. Every key maps to a record whose
 * name equals the key and no alias appears twice.
 */
class RepoRegistry {
public:
  using container_type = std::map<std::string, RepoRecord>;
  using const_iterator = container_type::const_iterator;

  /**
   * Register a repository under its name.
   *
   * @param record Repository to insert.
   * @throws RepoError With RepoErrorKind::AlreadyExists when the name is
   *         already registered. The registry is left unchanged.
   */
  void add(const RepoRecord &record);

  /**
   * Register several repositories, one add() per record.
   *
   * A name collision skips that record only; the remaining records are still
   * processed.
   *
   * @param records Repositories to insert, typically a scan result.
   * @return Aliases added and records skipped.
   */
  BatchAddReport add_all(const std::vector<RepoRecord> &records);

  /**
   * Remove the repository registered under @p name.
   *
   * @throws RepoError With RepoErrorKind::DoesNotExist when the name is not
   *         registered. The registry is left unchanged.
   */
  void remove(const std::string &name);

  /// Look up a repository; absence is not an error.
  std::optional<RepoRecord> get(const std::string &name) const;

  /// Whether @p name is registered.
  bool contains(const std::string &name) const;

  bool empty() const { return repos_.empty(); }
  std::size_t size() const { return repos_.size(); }

  const_iterator begin() const { return repos_.begin(); }
  const_iterator end() const { return repos_.end(); }

  /**
   * Serialise to `{"repos": {alias: {"name": ..., "path": ...}}}`.
   */
  nlohmann::json to_json() const;

  /**
   * Build a registry from its serialised form.
   *
   * A missing or null `repos` member yields an empty registry. When a
   * record's stored name differs from its key the key wins.
   *
   * @param j Document produced by to_json() or read from the registry file.
   * @return Loaded registry.
   * @throws std::runtime_error When the document is malformed.
   */
  static RepoRegistry from_json(const nlohmann::json &j);

private:
  container_type repos_;
};

} // namespace gitfindr

#endif // GITFINDR_REGISTRY_HPP
