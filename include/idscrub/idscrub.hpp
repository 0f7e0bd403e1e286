#pragma once

/**
 * @file idscrub.hpp
 * @brief idscrub core types and the Scrubber entry point
 *
 * Rotates the per-installation telemetry identifiers of Electron/VS Code family
 * editors, purges telemetry rows from their local-storage database and guards
 * the rewritten files against being silently regenerated.
 */

#include <any>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace idscrub {

/// Library version
constexpr const char* VERSION = "0.1.0";

/// Error codes returned by idscrub operations
enum class ErrorCode {
    Success = 0,

    // Target errors
    NotFound,
    ParseError,

    // Local-storage errors
    StoreLocked,
    StoreCorrupt,

    // File system errors
    PermissionDenied,
    WriteFailure,

    // Request errors
    InvalidParameter,
    Cancelled,

    Unknown
};

/// Convert error code to string
[[nodiscard]] constexpr const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::NotFound:
            return "Not found";
        case ErrorCode::ParseError:
            return "Parse error";
        case ErrorCode::StoreLocked:
            return "Store locked";
        case ErrorCode::StoreCorrupt:
            return "Store corrupt";
        case ErrorCode::PermissionDenied:
            return "Permission denied";
        case ErrorCode::WriteFailure:
            return "Write failure";
        case ErrorCode::InvalidParameter:
            return "Invalid parameter";
        case ErrorCode::Cancelled:
            return "Cancelled";
        case ErrorCode::Unknown:
            return "Unknown error";
    }
    return "Unknown error";
}

/// Whether an operation failing with this code may succeed when retried
[[nodiscard]] constexpr bool is_recoverable(ErrorCode code) noexcept {
    return code == ErrorCode::StoreLocked;
}

/**
 * @brief Result type for operations that can fail
 * @tparam T The success value type
 */
template <typename T> class Result {
  public:
    /// Construct a success result
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        r.error_ = ErrorCode::Success;
        return r;
    }

    /// Construct an error result
    static Result error(ErrorCode code, std::string message = "") {
        Result r;
        r.error_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    /// Check if the result is successful
    [[nodiscard]] bool is_ok() const noexcept { return error_ == ErrorCode::Success; }

    /// Check if the result is an error
    [[nodiscard]] bool is_error() const noexcept { return error_ != ErrorCode::Success; }

    /// Get the value (undefined behavior if is_error())
    [[nodiscard]] const T& value() const& { return *value_; }
    [[nodiscard]] T& value() & { return *value_; }
    [[nodiscard]] T&& value() && { return std::move(*value_); }

    /// Get the error code
    [[nodiscard]] ErrorCode error_code() const noexcept { return error_; }

    /// Get the error message
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

  private:
    Result() = default;
    std::optional<T> value_;
    ErrorCode error_ = ErrorCode::Unknown;
    std::string error_message_;
};

/// Specialization for void results
template <> class Result<void> {
  public:
    static Result ok() {
        Result r;
        r.error_ = ErrorCode::Success;
        return r;
    }

    static Result error(ErrorCode code, std::string message = "") {
        Result r;
        r.error_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    [[nodiscard]] bool is_ok() const noexcept { return error_ == ErrorCode::Success; }
    [[nodiscard]] bool is_error() const noexcept { return error_ != ErrorCode::Success; }
    [[nodiscard]] ErrorCode error_code() const noexcept { return error_; }
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

  private:
    Result() = default;
    ErrorCode error_ = ErrorCode::Unknown;
    std::string error_message_;
};

/// Timestamp type used throughout idscrub
using Timestamp = std::chrono::system_clock::time_point;

/// Operating system family
enum class Platform { Linux, MacOS, Windows, Unknown };

/// Convert platform to string
[[nodiscard]] constexpr const char* platform_to_string(Platform platform) noexcept {
    switch (platform) {
        case Platform::Linux:
            return "linux";
        case Platform::MacOS:
            return "macos";
        case Platform::Windows:
            return "windows";
        case Platform::Unknown:
            return "unknown";
    }
    return "unknown";
}

/**
 * @brief Directories the locator resolves profiles against
 *
 * Built once from the process environment by locator::current_environment(),
 * or by hand in tests.
 */
struct Environment {
    Platform platform = Platform::Unknown;
    std::filesystem::path home;
    std::filesystem::path config_home;  // XDG_CONFIG_HOME, APPDATA, ~/Library/Application Support
    std::filesystem::path state_home;   // XDG_STATE_HOME, LOCALAPPDATA, ~/Library/Application Support
};

/**
 * @brief Files belonging to one detected host installation
 *
 * Every path listed here existed when the profile was located.
 */
struct ProfilePaths {
    std::string host;                                     // e.g. "Code", "Cursor"
    std::filesystem::path root;                           // <config-home>/<host>
    std::optional<std::filesystem::path> identity_file;   // User/globalStorage/storage.json
    std::optional<std::filesystem::path> machine_id_file; // <root>/machineid
    std::vector<std::filesystem::path> databases;         // state.vscdb, state.vscdb.backup
    std::vector<std::filesystem::path> auxiliary_dirs;    // User/workspaceStorage/<hash>
};

/// Identifier key to value, as read from the identity file
using IdentityRecord = std::map<std::string, std::string>;

/// How a pattern is compared against the key column
enum class MatchKind { Prefix, Contains, Exact };

/// Convert match kind to string
[[nodiscard]] constexpr const char* match_kind_to_string(MatchKind kind) noexcept {
    switch (kind) {
        case MatchKind::Prefix:
            return "prefix";
        case MatchKind::Contains:
            return "contains";
        case MatchKind::Exact:
            return "exact";
    }
    return "exact";
}

/// Parse match kind from config string
[[nodiscard]] inline std::optional<MatchKind> match_kind_from_string(const std::string& str) noexcept {
    if (str == "prefix")
        return MatchKind::Prefix;
    if (str == "contains")
        return MatchKind::Contains;
    if (str == "exact")
        return MatchKind::Exact;
    return std::nullopt;
}

/// One case-sensitive pattern over the key column
struct KeyPattern {
    MatchKind kind = MatchKind::Prefix;
    std::string text;
};

/**
 * @brief Selects the rows to remove from a local-storage store
 *
 * A row matches when its key matches any of the patterns. No patterns means no
 * rows match.
 */
struct TelemetryRowCriteria {
    std::string table = "ItemTable";
    std::string key_column = "key";
    std::vector<KeyPattern> patterns;

    /// Check a key against the patterns in memory (same semantics as the SQL filter)
    [[nodiscard]] bool matches(const std::string& key) const {
        for (const auto& pattern : patterns) {
            switch (pattern.kind) {
                case MatchKind::Prefix:
                    if (key.compare(0, pattern.text.size(), pattern.text) == 0) {
                        return true;
                    }
                    break;
                case MatchKind::Contains:
                    if (key.find(pattern.text) != std::string::npos) {
                        return true;
                    }
                    break;
                case MatchKind::Exact:
                    if (key == pattern.text) {
                        return true;
                    }
                    break;
            }
        }
        return false;
    }
};

/// Default purge criteria for the VS Code family
[[nodiscard]] inline TelemetryRowCriteria default_criteria() {
    TelemetryRowCriteria criteria;
    criteria.patterns = {{MatchKind::Prefix, "telemetry."}, {MatchKind::Contains, "augment"}};
    return criteria;
}

/// Strength of the protection a platform can apply
enum class ProtectionMode {
    Soft,  // Permission bits only; a process with enough rights can undo it
    Hard   // Enforced by the OS regardless of the host's rights
};

/// Convert protection mode to string
[[nodiscard]] constexpr const char* protection_mode_to_string(ProtectionMode mode) noexcept {
    switch (mode) {
        case ProtectionMode::Soft:
            return "soft";
        case ProtectionMode::Hard:
            return "hard";
    }
    return "soft";
}

/**
 * @brief Persisted record of a protected file
 *
 * Owned by FileGuard. `original_mode` is restored bit-for-bit on release.
 */
struct LockState {
    std::string path;
    uint32_t original_mode = 0;
    uint32_t applied_mode = 0;
    ProtectionMode mode = ProtectionMode::Soft;
    Timestamp protected_at;

    [[nodiscard]] bool operator==(const LockState& other) const {
        return path == other.path && original_mode == other.original_mode &&
               applied_mode == other.applied_mode && mode == other.mode &&
               protected_at == other.protected_at;
    }
    [[nodiscard]] bool operator!=(const LockState& other) const { return !(*this == other); }
};

/// What a report entry acted on
enum class TargetKind { IdentityFile, MachineIdFile, Store, Guard };

/// Convert target kind to string
[[nodiscard]] constexpr const char* target_kind_to_string(TargetKind kind) noexcept {
    switch (kind) {
        case TargetKind::IdentityFile:
            return "identity";
        case TargetKind::MachineIdFile:
            return "machineid";
        case TargetKind::Store:
            return "store";
        case TargetKind::Guard:
            return "guard";
    }
    return "unknown";
}

/// Per-file outcome
enum class OutcomeStatus { Ok, Skipped, Failed };

/// Convert outcome status to string
[[nodiscard]] constexpr const char* outcome_status_to_string(OutcomeStatus status) noexcept {
    switch (status) {
        case OutcomeStatus::Ok:
            return "OK";
        case OutcomeStatus::Skipped:
            return "SKIPPED";
        case OutcomeStatus::Failed:
            return "FAILED";
    }
    return "FAILED";
}

/// Map an error to the outcome it produces in the report
[[nodiscard]] constexpr OutcomeStatus outcome_for_error(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return OutcomeStatus::Ok;
        case ErrorCode::NotFound:
        case ErrorCode::ParseError:
        case ErrorCode::StoreLocked:
        case ErrorCode::PermissionDenied:
        case ErrorCode::Cancelled:
            return OutcomeStatus::Skipped;
        default:
            return OutcomeStatus::Failed;
    }
}

/**
 * @brief One row of the final report
 */
struct FileOutcome {
    std::filesystem::path path;
    TargetKind kind = TargetKind::IdentityFile;
    OutcomeStatus status = OutcomeStatus::Ok;
    ErrorCode error = ErrorCode::Success;
    std::string detail;
};

/// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_PARTIAL = 1;
constexpr int EXIT_FATAL = 2;

/**
 * @brief Result of a whole run
 */
struct RunReport {
    std::vector<FileOutcome> outcomes;
    bool fatal = false;
    ErrorCode fatal_error = ErrorCode::Success;
    std::string fatal_message;
    bool cancelled = false;

    /// Number of outcomes with the given status
    [[nodiscard]] std::size_t count(OutcomeStatus status) const noexcept {
        std::size_t n = 0;
        for (const auto& outcome : outcomes) {
            if (outcome.status == status) {
                ++n;
            }
        }
        return n;
    }

    /// 0 full success, 1 partial failure, 2 fatal
    [[nodiscard]] int exit_code() const noexcept {
        if (fatal) {
            return EXIT_FATAL;
        }
        for (const auto& outcome : outcomes) {
            if (outcome.status != OutcomeStatus::Ok) {
                return EXIT_PARTIAL;
            }
        }
        return EXIT_OK;
    }
};

/**
 * @brief Configuration for a Scrubber run
 */
struct Config {
    /// Explicit profile directory (auto-detected if empty)
    std::string profile_override;

    /// Host application directory names to look for
    std::vector<std::string> hosts = {"Code", "Code - Insiders", "Cursor", "VSCodium", "Windsurf"};

    /// Identity file keys whose values get rotated
    std::vector<std::string> identity_keys = {"telemetry.machineId", "telemetry.macMachineId",
                                              "telemetry.devDeviceId", "telemetry.sqmId",
                                              "storage.serviceMachineId"};

    /// Rows to remove from each local-storage store
    TelemetryRowCriteria criteria = default_criteria();

    /// Directory for persisted lock states (Locator default if empty)
    std::string state_directory;

    /// Report only, change nothing
    bool dry_run = false;

    /// Release every previously applied protection instead of scrubbing
    bool restore = false;

    /// Protect rewritten files after the run
    bool protect_files = true;

    /// Purge telemetry rows from local-storage stores
    bool purge_stores = true;

    /// Rotate the plain-text machineid file
    bool rewrite_machine_id = true;

    /// Run each discovered profile as its own task
    bool parallel = false;

    /// Compact a store when more than this fraction of its rows was removed
    double compact_threshold = 0.25;

    /// Lock contention retries when opening a store
    int max_retries = 3;

    /// First retry delay in milliseconds (doubles on every attempt)
    int retry_interval_ms = 200;

    /// Emit "log:debug" events
    bool debug = false;
};

/**
 * @brief Overlay a JSON config file onto a base configuration
 *
 * @param path JSON file to read
 * @param base Values used for every key the file does not set
 * @return The merged configuration, ParseError on malformed input
 */
[[nodiscard]] Result<Config> load_config(const std::filesystem::path& path, Config base = {});

// Forward declarations for callback types
class Subscription;
using EventHandler = std::function<void(const std::any&)>;

/**
 * @brief Runs the scrub pipeline over every detected profile
 *
 * Locator -> identity rewrite -> telemetry purge -> file guard, per file.
 * Per-file failures become report entries; only the absence of any profile is
 * fatal.
 *
 * Thread Safety: cancel() may be called from any thread or a signal handler.
 */
class Scrubber {
  public:
    /// Construct a scrubber resolving profiles against the process environment
    explicit Scrubber(Config config);

    /// Construct a scrubber with an explicit environment
    Scrubber(Config config, Environment environment);

    /// Destructor
    ~Scrubber();

    // Non-copyable
    Scrubber(const Scrubber&) = delete;
    Scrubber& operator=(const Scrubber&) = delete;

    // Movable
    Scrubber(Scrubber&&) noexcept;
    Scrubber& operator=(Scrubber&&) noexcept;

    /// Run the configured mode (scrub, dry-run or restore)
    [[nodiscard]] RunReport run();

    /// Stop the run before the next file
    void cancel() noexcept;

    /// Check if cancel() was called
    [[nodiscard]] bool is_cancelled() const noexcept;

    /// Subscribe to progress events
    /// @param event Event name (e.g., "store:purged")
    /// @param handler Callback function
    /// @return Subscription handle (call cancel() to unsubscribe)
    Subscription on(const std::string& event, EventHandler handler);

    /// Get the current configuration
    [[nodiscard]] const Config& config() const noexcept;

    /// Get the environment profiles are resolved against
    [[nodiscard]] const Environment& environment() const noexcept;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Subscription handle for event unsubscription
 */
class Subscription {
  public:
    Subscription() = default;
    explicit Subscription(std::function<void()> unsubscribe) : unsubscribe_(std::move(unsubscribe)) {}

    /// Cancel this subscription
    void cancel() {
        if (unsubscribe_) {
            unsubscribe_();
            unsubscribe_ = nullptr;
        }
    }

    /// Check if subscription is active
    [[nodiscard]] bool is_active() const { return unsubscribe_ != nullptr; }

  private:
    std::function<void()> unsubscribe_;
};

}  // namespace idscrub
