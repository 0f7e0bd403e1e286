#pragma once

/**
 * @file locator.hpp
 * @brief Host profile discovery for idscrub
 *
 * Resolves where each host application keeps its identity file, local-storage
 * stores and machineid file. Everything here is read-only: the only side
 * effect is asking the file system whether a path exists.
 */

#include "idscrub.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace idscrub {
namespace locator {

/// Identity file name inside User/globalStorage
constexpr const char* IDENTITY_FILE_NAME = "storage.json";

/// Local-storage store names inside User/globalStorage and each workspace directory
constexpr const char* STORE_FILE_NAME = "state.vscdb";
constexpr const char* STORE_BACKUP_FILE_NAME = "state.vscdb.backup";

/**
 * @brief Build an Environment from the running process
 *
 * Reads HOME / USERPROFILE, XDG_CONFIG_HOME, XDG_STATE_HOME, APPDATA and
 * LOCALAPPDATA. This is the only function in the locator that touches process
 * state.
 */
[[nodiscard]] Environment current_environment();

/**
 * @brief Get the platform this binary was built for
 */
[[nodiscard]] Platform current_platform() noexcept;

/**
 * @brief Directories that may contain host application data directories
 *
 * Linux adds the snap and flatpak locations of the VS Code packages.
 */
[[nodiscard]] std::vector<std::filesystem::path> base_directories(const Environment& env);

/**
 * @brief Inspect one candidate profile root
 *
 * @param root Host data directory (e.g. ~/.config/Code)
 * @param host Host name recorded in the result
 * @return ProfilePaths with every existing target, NotFound if the root holds none
 */
[[nodiscard]] Result<ProfilePaths> inspect_profile(const std::filesystem::path& root,
                                                   const std::string& host);

/**
 * @brief Find every installed host profile
 *
 * @param hosts Host directory names (e.g. "Code", "Cursor")
 * @param env Directories to resolve against
 * @return Detected profiles in base-directory order, NotFound if none
 */
[[nodiscard]] Result<std::vector<ProfilePaths>> locate(const std::vector<std::string>& hosts,
                                                       const Environment& env);

/**
 * @brief Resolve an explicit profile path
 *
 * Accepts either a profile root (containing User/globalStorage) or a
 * globalStorage directory.
 */
[[nodiscard]] Result<ProfilePaths> locate_override(const std::filesystem::path& path);

/**
 * @brief Default directory for persisted lock states
 *
 * - Linux: $XDG_STATE_HOME/idscrub
 * - macOS: ~/Library/Application Support/idscrub
 * - Windows: %LOCALAPPDATA%\\idscrub
 */
[[nodiscard]] std::filesystem::path default_state_directory(const Environment& env);

}  // namespace locator
}  // namespace idscrub
