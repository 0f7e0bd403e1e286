#include "idscrub/guard.hpp"
#include "idscrub/fileio.hpp"

#include <chrono>
#include <cstdio>
#include <optional>
#include <system_error>

namespace idscrub {

namespace fs = std::filesystem;

namespace {

constexpr uint32_t kWriteBits = 0222;
constexpr uint32_t kModeMask = 07777;

Result<uint32_t> current_mode(const fs::path& path) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return Result<uint32_t>::error(ErrorCode::NotFound, "File does not exist: " + path.string());
    }
    return Result<uint32_t>::ok(static_cast<uint32_t>(status.permissions() & fs::perms::mask) &
                                kModeMask);
}

Result<void> set_mode(const fs::path& path, uint32_t mode) {
    std::error_code ec;
    fs::permissions(path, static_cast<fs::perms>(mode & kModeMask), fs::perm_options::replace, ec);
    if (ec) {
        return Result<void>::error(fileio::error_from_error_code(ec),
                                   "Cannot set permissions " + format_permissions(mode) + " on " +
                                       path.string() + ": " + ec.message());
    }
    return Result<void>::ok();
}

}  // namespace

std::string format_permissions(uint32_t mode) {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "%04o", static_cast<unsigned>(mode & kModeMask));
    return buffer;
}

FileGuard::FileGuard(std::shared_ptr<LockStateStore> store) : store_(std::move(store)) {}

ProtectionMode FileGuard::capability() noexcept {
    // Permission bits and the read-only attribute are both undoable by the owner
    return ProtectionMode::Soft;
}

std::string FileGuard::record_key(const fs::path& path) {
    std::error_code ec;
    auto absolute = fs::absolute(path, ec);
    return (ec ? path : absolute).lexically_normal().string();
}

Result<LockState> FileGuard::protect(const fs::path& path) {
    auto mode = current_mode(path);
    if (mode.is_error()) {
        return Result<LockState>::error(mode.error_code(), mode.error_message());
    }

    std::string key = record_key(path);
    if (auto existing = store_->get_lock_state(key)) {
        if (existing->applied_mode == mode.value()) {
            return Result<LockState>::ok(*existing);
        }
        // Stale: the file was rewritten or chmod'ed since it was protected
        auto cleared = store_->clear_lock_state(key);
        if (cleared.is_error()) {
            return Result<LockState>::error(cleared.error_code(), cleared.error_message());
        }
    }

    LockState state;
    state.path = key;
    state.original_mode = mode.value();
    state.applied_mode = mode.value() & ~kWriteBits;
    state.mode = capability();
    state.protected_at =
        std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());

    auto applied = set_mode(path, state.applied_mode);
    if (applied.is_error()) {
        return Result<LockState>::error(applied.error_code(), applied.error_message());
    }

    auto saved = store_->set_lock_state(state);
    if (saved.is_error()) {
        // Without a record the protection could never be released
        auto reverted = set_mode(path, state.original_mode);
        std::string message = "Cannot record lock state: " + saved.error_message();
        if (reverted.is_error()) {
            message += "; " + reverted.error_message();
        }
        return Result<LockState>::error(saved.error_code(), message);
    }

    return Result<LockState>::ok(state);
}

Result<void> FileGuard::release(const fs::path& path) {
    std::string key = record_key(path);
    auto state = store_->get_lock_state(key);
    if (!state) {
        return Result<void>::error(ErrorCode::NotFound, "No lock state recorded for " + key);
    }

    auto mode = current_mode(path);
    if (mode.is_error()) {
        // The file is gone; the record has nothing left to restore
        auto cleared = store_->clear_lock_state(key);
        if (cleared.is_error()) {
            return cleared;
        }
        return Result<void>::error(mode.error_code(), mode.error_message());
    }

    auto restored = set_mode(path, state->original_mode);
    if (restored.is_error()) {
        return restored;
    }

    return store_->clear_lock_state(key);
}

bool FileGuard::is_protected(const fs::path& path) const {
    auto state = store_->get_lock_state(record_key(path));
    if (!state) {
        return false;
    }
    auto mode = current_mode(path);
    return mode.is_ok() && mode.value() == state->applied_mode;
}

std::vector<LockState> FileGuard::protected_files() const {
    return store_->list_lock_states();
}

}  // namespace idscrub
