/**
 * @file constants.hpp
 * @brief Process-wide constants shared by the registry and discovery code.
 */
#ifndef GITFINDR_CONSTANTS_HPP
#define GITFINDR_CONSTANTS_HPP

#include <string_view>

namespace gitfindr {

/// Entry whose presence marks a directory as a git repository.
inline constexpr std::string_view kRepoMarker = ".git";

/// Application identifier used for the default registry location.
inline constexpr std::string_view kAppName = "gitfindr";

/// File name of the registry when no explicit location is configured.
inline constexpr std::string_view kDefaultRegistryFile = "gitfindr.toml";

} // namespace gitfindr

#endif // GITFINDR_CONSTANTS_HPP
