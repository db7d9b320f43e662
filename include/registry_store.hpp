/**
 * @file registry_store.hpp
 * @brief Loading and persisting the repository registry file.
 */
#ifndef GITFINDR_REGISTRY_STORE_HPP
#define GITFINDR_REGISTRY_STORE_HPP

#include "registry.hpp"

#include <filesystem>

namespace gitfindr {

/**
 * Location of the registry when none is configured.
 *
 * Uses `$XDG_CONFIG_HOME/gitfindr/gitfindr.toml`, then
 * `$HOME/.config/gitfindr/gitfindr.toml`, then `gitfindr.toml` in the
 * working directory.
 */
std::filesystem::path default_registry_path();

/**
 * Load the registry stored at @p path.
 *
 * @param path Registry file; its extension selects the format.
 * @return Loaded registry, empty when the file does not exist yet.
 * @throws std::runtime_error When the file exists but cannot be read or
 *         parsed.
 */
RepoRegistry load_registry(const std::filesystem::path &path);

/**
 * Replace the registry file at @p path with @p registry.
 *
 * The document is written to a sibling temporary file which is then renamed
 * over @p path. Missing parent directories are created.
 *
 * @throws std::runtime_error When the file cannot be written.
 */
void save_registry(const std::filesystem::path &path,
                   const RepoRegistry &registry);

} // namespace gitfindr

#endif // GITFINDR_REGISTRY_STORE_HPP
