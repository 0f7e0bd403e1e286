#include "idscrub/storage.hpp"
#include "idscrub/crypto.hpp"
#include "idscrub/fileio.hpp"
#include "idscrub/json.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <system_error>

namespace idscrub {

namespace {

// Record file names use a truncated SHA-256 of the protected path
constexpr std::size_t kRecordHashLength = 32;
constexpr const char* kRecordInfix = "_lock_";
constexpr const char* kRecordSuffix = ".json";

bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

// ==================== FileLockStateStore Implementation ====================

FileLockStateStore::FileLockStateStore(const std::string& storage_path, const std::string& prefix)
    : storage_path_(storage_path), prefix_(prefix) {}

Result<std::filesystem::path> FileLockStateStore::get_record_path(const std::string& path) const {
    auto hash = crypto::sha256_hex(path);
    if (hash.is_error()) {
        return Result<std::filesystem::path>::error(
            hash.error_code(), "Cannot name lock state for " + path + ": " + hash.error_message());
    }
    return Result<std::filesystem::path>::ok(
        storage_path_ /
        (prefix_ + kRecordInfix + hash.value().substr(0, kRecordHashLength) + kRecordSuffix));
}

bool FileLockStateStore::is_record_file(const std::filesystem::path& file) const {
    std::string name = file.filename().string();
    return name.rfind(prefix_ + kRecordInfix, 0) == 0 && ends_with(name, kRecordSuffix);
}

Result<void> FileLockStateStore::ensure_directory() const {
    std::error_code ec;
    std::filesystem::create_directories(storage_path_, ec);
    if (ec) {
        return Result<void>::error(fileio::error_from_error_code(ec),
                                   "Cannot create state directory " + storage_path_.string() +
                                       ": " + ec.message());
    }
    return Result<void>::ok();
}

Result<void> FileLockStateStore::set_lock_state(const LockState& state) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto dir = ensure_directory();
    if (dir.is_error()) {
        return dir;
    }

    auto record = get_record_path(state.path);
    if (record.is_error()) {
        return Result<void>::error(record.error_code(), record.error_message());
    }

    fileio::ReplaceOptions options;
    options.mode = 0600;
    return fileio::atomic_replace(record.value(), json::lock_state_to_json(state).dump(2),
                                  options);
}

std::optional<LockState> FileLockStateStore::get_lock_state(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto record = get_record_path(path);
    if (record.is_error()) {
        return std::nullopt;
    }

    auto content = fileio::read_file(record.value());
    if (content.is_error()) {
        return std::nullopt;
    }

    try {
        auto state = json::parse_lock_state(nlohmann::json::parse(content.value()));
        // Hash prefix collision or a hand-edited record
        if (state.path != path) {
            return std::nullopt;
        }
        return state;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

Result<void> FileLockStateStore::clear_lock_state(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto record = get_record_path(path);
    if (record.is_error()) {
        return Result<void>::error(record.error_code(), record.error_message());
    }

    std::error_code ec;
    std::filesystem::remove(record.value(), ec);
    if (ec) {
        return Result<void>::error(fileio::error_from_error_code(ec),
                                   "Cannot remove lock state for " + path + ": " + ec.message());
    }
    return Result<void>::ok();
}

std::vector<LockState> FileLockStateStore::list_lock_states() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<LockState> states;
    std::error_code ec;
    std::filesystem::directory_iterator it(storage_path_, ec);
    if (ec) {
        return states;
    }

    for (const auto& entry : it) {
        if (!is_record_file(entry.path())) {
            continue;
        }
        auto content = fileio::read_file(entry.path());
        if (content.is_error()) {
            continue;
        }
        try {
            states.push_back(json::parse_lock_state(nlohmann::json::parse(content.value())));
        } catch (const nlohmann::json::exception&) {
            // Unreadable record; restore cannot act on it
            continue;
        }
    }

    std::sort(states.begin(), states.end(),
              [](const LockState& a, const LockState& b) { return a.path < b.path; });
    return states;
}

// ==================== MemoryLockStateStore Implementation ====================

Result<void> MemoryLockStateStore::set_lock_state(const LockState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    states_[state.path] = state;
    return Result<void>::ok();
}

std::optional<LockState> MemoryLockStateStore::get_lock_state(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(path);
    if (it != states_.end()) {
        return it->second;
    }
    return std::nullopt;
}

Result<void> MemoryLockStateStore::clear_lock_state(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    states_.erase(path);
    return Result<void>::ok();
}

std::vector<LockState> MemoryLockStateStore::list_lock_states() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<LockState> states;
    for (const auto& [path, state] : states_) {
        states.push_back(state);
    }
    return states;
}

}  // namespace idscrub
