#pragma once

/**
 * @file fileio.hpp
 * @brief File helpers for idscrub
 *
 * All-or-nothing file replacement and error classification for file system
 * failures.
 */

#include "idscrub.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <system_error>

namespace idscrub {
namespace fileio {

/**
 * @brief Options for atomic_replace
 */
struct ReplaceOptions {
    /// Permission bits for the new file (copied from the existing target if unset)
    std::optional<uint32_t> mode;

    /// Called with the flushed temporary file just before the rename.
    /// Returning false abandons the replace; the target is left untouched.
    std::function<bool(const std::filesystem::path& temp_path)> before_rename;
};

/**
 * @brief Replace a file's content atomically
 *
 * Writes to a temporary file in the target's directory, flushes it to durable
 * storage, renames it over the target and flushes the directory. Readers see
 * either the old content or the new content, never a mix. On any failure the
 * temporary file is removed and the target is untouched.
 *
 * @return WriteFailure, PermissionDenied or NotFound on error
 */
[[nodiscard]] Result<void> atomic_replace(const std::filesystem::path& target,
                                          const std::string& content,
                                          const ReplaceOptions& options = {});

/// Read a whole file as bytes
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path& path);

/// Classify an errno value
[[nodiscard]] ErrorCode error_from_errno(int err) noexcept;

/// Classify a std::error_code from std::filesystem
[[nodiscard]] ErrorCode error_from_error_code(const std::error_code& ec) noexcept;

}  // namespace fileio
}  // namespace idscrub
