#pragma once

/**
 * @file guard.hpp
 * @brief Write protection for sanitized files
 *
 * Removes write permission from a file so the host cannot silently regenerate
 * it, and puts the original permission bits back on release.
 *
 * State machine per file: Unprotected -> Protected (protect) -> Unprotected
 * (release). Protecting an already protected file returns the existing record.
 */

#include "idscrub.hpp"
#include "storage.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace idscrub {

/// Render permission bits as four octal digits (e.g. "0640")
[[nodiscard]] std::string format_permissions(uint32_t mode);

/**
 * @brief Applies and reverts write protection, persisting a LockState per file
 *
 * Thread Safety: safe to share between threads when the LockStateStore is.
 */
class FileGuard {
  public:
    /// Construct a guard persisting records in the given store
    explicit FileGuard(std::shared_ptr<LockStateStore> store);

    /**
     * @brief Protect a file against writes
     *
     * A record whose applied bits no longer match the file is stale and is
     * replaced.
     *
     * @return The LockState (the existing one if the file is already protected)
     */
    [[nodiscard]] Result<LockState> protect(const std::filesystem::path& path);

    /**
     * @brief Restore the recorded permission bits and drop the record
     *
     * @return NotFound if no record exists for the path
     */
    [[nodiscard]] Result<void> release(const std::filesystem::path& path);

    /// A record exists and the file still carries the applied bits
    [[nodiscard]] bool is_protected(const std::filesystem::path& path) const;

    /// Every persisted record
    [[nodiscard]] std::vector<LockState> protected_files() const;

    /// Strongest protection this platform offers an unprivileged process
    [[nodiscard]] static ProtectionMode capability() noexcept;

    /// Key a path is recorded under (absolute, normalized)
    [[nodiscard]] static std::string record_key(const std::filesystem::path& path);

  private:
    std::shared_ptr<LockStateStore> store_;
};

}  // namespace idscrub
