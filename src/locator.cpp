#include "idscrub/locator.hpp"

#include <algorithm>
#include <cstdlib>
#include <set>
#include <system_error>

// Platform detection
#if defined(__APPLE__)
#define IDSCRUB_PLATFORM_MACOS 1
#elif defined(_WIN32) || defined(_WIN64)
#define IDSCRUB_PLATFORM_WINDOWS 1
#elif defined(__linux__)
#define IDSCRUB_PLATFORM_LINUX 1
#endif

namespace idscrub {
namespace locator {

namespace fs = std::filesystem;

namespace {

std::string get_env(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

bool is_file(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool is_dir(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

// Portable installs keep everything under <root>/data
fs::path effective_root(const fs::path& root) {
    if (!is_dir(root / "User") && is_dir(root / "data" / "User")) {
        return root / "data";
    }
    return root;
}

std::vector<fs::path> workspace_directories(const fs::path& workspace_storage) {
    std::vector<fs::path> result;
    std::error_code ec;
    fs::directory_iterator it(workspace_storage, ec);
    if (ec) {
        return result;
    }
    for (const auto& entry : it) {
        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            result.push_back(entry.path());
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

void collect_storage_files(const fs::path& storage_dir, ProfilePaths& profile) {
    auto identity = storage_dir / IDENTITY_FILE_NAME;
    if (is_file(identity)) {
        profile.identity_file = identity;
    }
    for (const char* name : {STORE_FILE_NAME, STORE_BACKUP_FILE_NAME}) {
        auto store = storage_dir / name;
        if (is_file(store)) {
            profile.databases.push_back(store);
        }
    }
}

bool has_targets(const ProfilePaths& profile) {
    return profile.identity_file || profile.machine_id_file || !profile.databases.empty() ||
           !profile.auxiliary_dirs.empty();
}

std::string path_key(const fs::path& path) {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(path, ec);
    return ec ? path.lexically_normal().string() : canonical.string();
}

}  // namespace

Platform current_platform() noexcept {
#if defined(IDSCRUB_PLATFORM_MACOS)
    return Platform::MacOS;
#elif defined(IDSCRUB_PLATFORM_LINUX)
    return Platform::Linux;
#elif defined(IDSCRUB_PLATFORM_WINDOWS)
    return Platform::Windows;
#else
    return Platform::Unknown;
#endif
}

Environment current_environment() {
    Environment env;
    env.platform = current_platform();

#if defined(IDSCRUB_PLATFORM_WINDOWS)
    env.home = get_env("USERPROFILE");
    env.config_home = get_env("APPDATA");
    env.state_home = get_env("LOCALAPPDATA");
    if (env.config_home.empty() && !env.home.empty()) {
        env.config_home = env.home / "AppData" / "Roaming";
    }
    if (env.state_home.empty() && !env.home.empty()) {
        env.state_home = env.home / "AppData" / "Local";
    }
#elif defined(IDSCRUB_PLATFORM_MACOS)
    env.home = get_env("HOME");
    if (!env.home.empty()) {
        env.config_home = env.home / "Library" / "Application Support";
        env.state_home = env.config_home;
    }
#else
    env.home = get_env("HOME");
    std::string xdg_config = get_env("XDG_CONFIG_HOME");
    std::string xdg_state = get_env("XDG_STATE_HOME");
    if (!xdg_config.empty()) {
        env.config_home = xdg_config;
    } else if (!env.home.empty()) {
        env.config_home = env.home / ".config";
    }
    if (!xdg_state.empty()) {
        env.state_home = xdg_state;
    } else if (!env.home.empty()) {
        env.state_home = env.home / ".local" / "state";
    }
#endif

    return env;
}

std::vector<fs::path> base_directories(const Environment& env) {
    std::vector<fs::path> bases;
    if (!env.config_home.empty()) {
        bases.push_back(env.config_home);
    }

    if (env.platform == Platform::Linux && !env.home.empty()) {
        bases.push_back(env.home / "snap" / "code" / "common" / ".config");
        bases.push_back(env.home / ".var" / "app" / "com.visualstudio.code" / "config");
        bases.push_back(env.home / ".var" / "app" / "com.visualstudio.code-insiders" / "config");
    }

    return bases;
}

Result<ProfilePaths> inspect_profile(const fs::path& root, const std::string& host) {
    if (!is_dir(root)) {
        return Result<ProfilePaths>::error(ErrorCode::NotFound,
                                           "No such directory: " + root.string());
    }

    ProfilePaths profile;
    profile.host = host;
    profile.root = root;

    auto data_root = effective_root(root);
    collect_storage_files(data_root / "User" / "globalStorage", profile);

    // VS Code writes "machineid"; some forks use "machineId"
    for (const char* name : {"machineid", "machineId"}) {
        auto candidate = data_root / name;
        if (is_file(candidate)) {
            profile.machine_id_file = candidate;
            break;
        }
    }

    profile.auxiliary_dirs = workspace_directories(data_root / "User" / "workspaceStorage");

    if (!has_targets(profile)) {
        return Result<ProfilePaths>::error(ErrorCode::NotFound,
                                           "No host data found in " + root.string());
    }

    return Result<ProfilePaths>::ok(std::move(profile));
}

Result<std::vector<ProfilePaths>> locate(const std::vector<std::string>& hosts,
                                         const Environment& env) {
    std::vector<ProfilePaths> profiles;
    std::set<std::string> seen;

    auto bases = base_directories(env);
    for (const auto& base : bases) {
        for (const auto& host : hosts) {
            auto profile = inspect_profile(base / host, host);
            if (profile.is_error()) {
                continue;
            }
            if (!seen.insert(path_key(profile.value().root)).second) {
                continue;
            }
            profiles.push_back(std::move(profile).value());
        }
    }

    if (profiles.empty()) {
        return Result<std::vector<ProfilePaths>>::error(
            ErrorCode::NotFound, "No host installation found in " + std::to_string(bases.size()) +
                                     " search location(s)");
    }

    return Result<std::vector<ProfilePaths>>::ok(std::move(profiles));
}

Result<ProfilePaths> locate_override(const fs::path& path) {
    if (!is_dir(path)) {
        return Result<ProfilePaths>::error(ErrorCode::NotFound,
                                           "Profile directory does not exist: " + path.string());
    }

    auto normalized = path.lexically_normal();
    if (normalized.filename().empty()) {
        normalized = normalized.parent_path();
    }

    // A globalStorage directory given directly
    if (normalized.filename() == "globalStorage" &&
        normalized.parent_path().filename() == "User") {
        auto root = normalized.parent_path().parent_path();
        auto profile = inspect_profile(root, root.filename().string());
        if (profile.is_ok()) {
            return profile;
        }
    }

    if (is_dir(effective_root(normalized) / "User")) {
        return inspect_profile(normalized, normalized.filename().string());
    }

    // Bare directory holding storage.json / state.vscdb
    ProfilePaths profile;
    profile.host = normalized.filename().string();
    profile.root = normalized;
    collect_storage_files(normalized, profile);
    if (!has_targets(profile)) {
        return Result<ProfilePaths>::error(ErrorCode::NotFound,
                                           "No host data found in " + normalized.string());
    }
    return Result<ProfilePaths>::ok(std::move(profile));
}

fs::path default_state_directory(const Environment& env) {
    if (!env.state_home.empty()) {
        return env.state_home / "idscrub";
    }
    std::error_code ec;
    auto temp = fs::temp_directory_path(ec);
    return ec ? fs::path("idscrub-state") : temp / "idscrub";
}

}  // namespace locator
}  // namespace idscrub
