#pragma once

/**
 * @file storage.hpp
 * @brief Lock state persistence for idscrub
 *
 * Remembers which files the guard protected and their original permission
 * bits, so a later run can restore them.
 */

#include "idscrub.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace idscrub {

/**
 * @brief Storage interface for lock state persistence
 *
 * Keyed by the protected file's path.
 */
class LockStateStore {
  public:
    virtual ~LockStateStore() = default;

    /// Store or replace the record for state.path
    [[nodiscard]] virtual Result<void> set_lock_state(const LockState& state) = 0;

    /// Retrieve the record for a path
    [[nodiscard]] virtual std::optional<LockState> get_lock_state(const std::string& path) = 0;

    /// Remove the record for a path
    [[nodiscard]] virtual Result<void> clear_lock_state(const std::string& path) = 0;

    /// Every stored record, sorted by path
    [[nodiscard]] virtual std::vector<LockState> list_lock_states() = 0;
};

/**
 * @brief File-based storage implementation
 *
 * One JSON file per protected path in a state directory, named after the
 * path's SHA-256. Files are written with an atomic replace.
 */
class FileLockStateStore : public LockStateStore {
  public:
    /**
     * @brief Construct file storage
     *
     * @param storage_path Directory path for storage (created on first write)
     * @param prefix Optional prefix for file names
     */
    explicit FileLockStateStore(const std::string& storage_path,
                                const std::string& prefix = "idscrub");

    Result<void> set_lock_state(const LockState& state) override;
    std::optional<LockState> get_lock_state(const std::string& path) override;
    Result<void> clear_lock_state(const std::string& path) override;
    std::vector<LockState> list_lock_states() override;

    /// Directory the records are kept in
    [[nodiscard]] const std::filesystem::path& storage_path() const noexcept { return storage_path_; }

  private:
    Result<std::filesystem::path> get_record_path(const std::string& path) const;
    bool is_record_file(const std::filesystem::path& file) const;

    Result<void> ensure_directory() const;

    std::filesystem::path storage_path_;
    std::string prefix_;
    mutable std::mutex mutex_;
};

/**
 * @brief In-memory storage implementation (for testing or no persistence)
 */
class MemoryLockStateStore : public LockStateStore {
  public:
    Result<void> set_lock_state(const LockState& state) override;
    std::optional<LockState> get_lock_state(const std::string& path) override;
    Result<void> clear_lock_state(const std::string& path) override;
    std::vector<LockState> list_lock_states() override;

  private:
    std::map<std::string, LockState> states_;
    mutable std::mutex mutex_;
};

}  // namespace idscrub
