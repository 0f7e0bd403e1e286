#pragma once

/**
 * @file purger.hpp
 * @brief Telemetry row removal from local-storage stores
 *
 * A local-storage store is the SQLite database a host keeps its key/value
 * state in (state.vscdb). Matching rows are deleted in one transaction that
 * either fully commits or leaves the store unchanged.
 */

#include "idscrub.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

struct sqlite3;

namespace idscrub {
namespace purger {

/// Classify an SQLite result code
[[nodiscard]] ErrorCode error_from_sqlite(int rc) noexcept;

/**
 * @brief Checks whether a running host holds a store open for writing
 */
class HostLockProbe {
  public:
    virtual ~HostLockProbe() = default;

    /**
     * @brief Try to take and immediately drop exclusive access
     *
     * @return Success if nobody holds the store, StoreLocked if a host does,
     *         another code if the store cannot be inspected
     */
    [[nodiscard]] virtual ErrorCode try_open_exclusive(const std::filesystem::path& store) = 0;

    /// Check if a host currently holds the store
    [[nodiscard]] bool is_locked(const std::filesystem::path& store) {
        return try_open_exclusive(store) == ErrorCode::StoreLocked;
    }
};

/**
 * @brief Probe using SQLite's own locking (BEGIN EXCLUSIVE, then ROLLBACK)
 */
class SqliteLockProbe : public HostLockProbe {
  public:
    [[nodiscard]] ErrorCode try_open_exclusive(const std::filesystem::path& store) override;
};

/// Upper bound for a single backoff delay
constexpr int MAX_RETRY_DELAY_MS = 5000;

/// Delay for the retry after one that waited delay_ms (doubled, capped)
[[nodiscard]] int next_retry_delay(int delay_ms) noexcept;

/**
 * @brief Options for LocalStore::open
 *
 * The retry settings also cover the write transaction of purge_matching().
 */
struct OpenOptions {
    /// Retries while the store is locked (0 = fail on first contention)
    int max_retries = 3;

    /// Delay before the first retry; doubles on every retry up to MAX_RETRY_DELAY_MS
    int retry_interval_ms = 200;

    /// Lock probe (SqliteLockProbe if null)
    std::shared_ptr<HostLockProbe> probe;

    /// Called before sleeping for a retry
    std::function<void(int attempt, int delay_ms)> on_retry;
};

/**
 * @brief Hooks into a purge transaction
 */
struct PurgeHooks {
    /// Called after the delete, before commit. Returning false rolls back.
    std::function<bool()> before_commit;
};

/**
 * @brief An open local-storage store
 *
 * Move-only; closes the connection on destruction.
 */
class LocalStore {
  public:
    /**
     * @brief Open an existing store for purging
     *
     * Waits for a host lock with exponential backoff, then runs an integrity
     * check.
     *
     * @return NotFound, StoreLocked (after retries), StoreCorrupt or PermissionDenied
     */
    [[nodiscard]] static Result<LocalStore> open(const std::filesystem::path& path,
                                                 const OpenOptions& options = {});

    ~LocalStore();

    LocalStore(const LocalStore&) = delete;
    LocalStore& operator=(const LocalStore&) = delete;

    LocalStore(LocalStore&& other) noexcept;
    LocalStore& operator=(LocalStore&& other) noexcept;

    /// Total rows in the criteria's table (0 if the table does not exist)
    [[nodiscard]] Result<std::size_t> count_rows(const TelemetryRowCriteria& criteria) const;

    /// Rows matching the criteria (0 if the table does not exist)
    [[nodiscard]] Result<std::size_t> count_matching(const TelemetryRowCriteria& criteria) const;

    /**
     * @brief Delete every matching row in one transaction
     *
     * Either every matching row is removed or the store is left exactly as it
     * was. If a host takes the write lock between open() and the purge, the
     * transaction start is retried with the open() backoff.
     *
     * @return Number of rows removed
     */
    [[nodiscard]] Result<std::size_t> purge_matching(const TelemetryRowCriteria& criteria,
                                                     const PurgeHooks& hooks = {});

    /// Rebuild the store to reclaim free pages (VACUUM)
    [[nodiscard]] Result<void> compact();

    /// Path the store was opened from
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

  private:
    LocalStore(sqlite3* db, std::filesystem::path path, OpenOptions options);

    void close() noexcept;

    sqlite3* db_ = nullptr;
    std::filesystem::path path_;
    OpenOptions options_;
};

/**
 * @brief Check if a purge removed enough rows to warrant compaction
 *
 * True when rows were removed and removed / total exceeds the threshold.
 */
[[nodiscard]] bool should_compact(std::size_t removed, std::size_t total, double threshold) noexcept;

}  // namespace purger
}  // namespace idscrub
