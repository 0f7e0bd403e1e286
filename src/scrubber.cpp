#include "idscrub/idscrub.hpp"
#include "idscrub/events.hpp"
#include "idscrub/guard.hpp"
#include "idscrub/identity.hpp"
#include "idscrub/locator.hpp"
#include "idscrub/purger.hpp"
#include "idscrub/storage.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <system_error>

namespace idscrub {

namespace fs = std::filesystem;

namespace {

constexpr const char* kPermissionHint =
    " (run as the file's owner, or close the host and check directory permissions)";

using EventMap = std::map<std::string, std::string>;

const char* mode_name(const Config& config) {
    if (config.restore) {
        return "restore";
    }
    return config.dry_run ? "dry-run" : "scrub";
}

bool is_under(const std::string& path, const std::string& root) {
    if (path.compare(0, root.size(), root) != 0) {
        return false;
    }
    return path.size() == root.size() || path[root.size()] == '/' || path[root.size()] == '\\' ||
           (!root.empty() && (root.back() == '/' || root.back() == '\\'));
}

}  // namespace

// PIMPL implementation
class Scrubber::Impl {
  public:
    Impl(Config config, Environment environment)
        : config_(std::move(config)), environment_(std::move(environment)) {
        fs::path state_dir = config_.state_directory.empty()
                                 ? locator::default_state_directory(environment_)
                                 : fs::path(config_.state_directory);
        guard_ = std::make_unique<FileGuard>(
            std::make_shared<FileLockStateStore>(state_dir.string()));
    }

    RunReport run() {
        RunReport report;
        event_bus_.emit(events::RUN_START, EventMap{{"mode", mode_name(config_)}});

        if (config_.restore) {
            report.outcomes = restore();
        } else {
            auto profiles = resolve_profiles();
            if (profiles.is_error()) {
                report.fatal = true;
                report.fatal_error = profiles.error_code();
                report.fatal_message = profiles.error_message();
                event_bus_.emit(events::RUN_COMPLETE, report);
                return report;
            }
            report.outcomes = scrub_all(profiles.value());
        }

        report.cancelled = cancelled_;
        if (auto failures = event_bus_.handler_failures()) {
            debug(std::to_string(failures) + " event handler call(s) threw");
        }
        if (report.cancelled) {
            event_bus_.emit(events::RUN_CANCELLED, EventMap{});
        }
        event_bus_.emit(events::RUN_COMPLETE, report);
        return report;
    }

    void cancel() noexcept { cancelled_ = true; }

    bool is_cancelled() const noexcept { return cancelled_; }

    // ========== Event Handling ==========

    Subscription on(const std::string& event, EventHandler handler) {
        return event_bus_.on(event, std::move(handler));
    }

    const Config& config() const noexcept { return config_; }
    const Environment& environment() const noexcept { return environment_; }

  private:
    // ========== Profiles ==========

    Result<std::vector<ProfilePaths>> resolve_profiles() {
        if (!config_.profile_override.empty()) {
            auto profile = locator::locate_override(config_.profile_override);
            if (profile.is_error()) {
                return Result<std::vector<ProfilePaths>>::error(profile.error_code(),
                                                                profile.error_message());
            }
            return Result<std::vector<ProfilePaths>>::ok({std::move(profile).value()});
        }
        return locator::locate(config_.hosts, environment_);
    }

    std::vector<FileOutcome> scrub_all(const std::vector<ProfilePaths>& profiles) {
        for (const auto& profile : profiles) {
            event_bus_.emit(events::PROFILE_FOUND, profile);
            debug("Profile " + profile.host + " at " + profile.root.string());
        }

        std::vector<FileOutcome> outcomes;
        if (config_.parallel && profiles.size() > 1) {
            std::vector<std::future<std::vector<FileOutcome>>> units;
            for (const auto& profile : profiles) {
                units.push_back(std::async(std::launch::async,
                                           [this, &profile]() { return scrub_profile(profile); }));
            }
            for (auto& unit : units) {
                auto part = unit.get();
                outcomes.insert(outcomes.end(), part.begin(), part.end());
            }
        } else {
            for (const auto& profile : profiles) {
                auto part = scrub_profile(profile);
                outcomes.insert(outcomes.end(), part.begin(), part.end());
            }
        }
        return outcomes;
    }

    std::vector<FileOutcome> scrub_profile(const ProfilePaths& profile) {
        std::vector<FileOutcome> outcomes;
        std::vector<fs::path> rewritten;

        if (profile.identity_file) {
            outcomes.push_back(scrub_identity_file(*profile.identity_file));
            if (outcomes.back().status == OutcomeStatus::Ok) {
                rewritten.push_back(*profile.identity_file);
            }
        }

        if (profile.machine_id_file && config_.rewrite_machine_id) {
            outcomes.push_back(scrub_machine_id_file(*profile.machine_id_file));
            if (outcomes.back().status == OutcomeStatus::Ok) {
                rewritten.push_back(*profile.machine_id_file);
            }
        }

        if (config_.purge_stores) {
            for (const auto& store : store_targets(profile)) {
                outcomes.push_back(purge_store(store));
            }
        }

        if (config_.protect_files && !config_.dry_run) {
            for (const auto& path : rewritten) {
                outcomes.push_back(protect_file(path));
            }
        }

        return outcomes;
    }

    std::vector<fs::path> store_targets(const ProfilePaths& profile) const {
        std::vector<fs::path> stores = profile.databases;
        for (const auto& dir : profile.auxiliary_dirs) {
            auto store = dir / locator::STORE_FILE_NAME;
            std::error_code ec;
            if (fs::is_regular_file(store, ec)) {
                stores.push_back(store);
            }
        }
        return stores;
    }

    // ========== Per-file steps ==========

    FileOutcome scrub_identity_file(const fs::path& path) {
        if (cancelled_) {
            return cancelled(path, TargetKind::IdentityFile);
        }

        auto doc = identity::read_identities(path, config_.identity_keys);
        if (doc.is_error()) {
            return failure(path, TargetKind::IdentityFile, doc.error_code(), doc.error_message());
        }

        std::size_t present = doc.value().record().size();
        if (present == 0) {
            return success(path, TargetKind::IdentityFile, "no identifier keys present");
        }
        if (config_.dry_run) {
            return success(path, TargetKind::IdentityFile,
                           "would rotate " + std::to_string(present) + " identifier(s)");
        }

        auto rotated = identity::rotate_identities(doc.value());
        if (rotated.is_error()) {
            return failure(path, TargetKind::IdentityFile, rotated.error_code(),
                           rotated.error_message());
        }

        auto written = identity::write_identities(path, doc.value());
        if (written.is_error()) {
            return failure(path, TargetKind::IdentityFile, written.error_code(),
                           written.error_message());
        }

        event_bus_.emit(events::IDENTITY_REWRITTEN,
                        EventMap{{"path", path.string()},
                                 {"count", std::to_string(rotated.value())}});
        return success(path, TargetKind::IdentityFile,
                       "rotated " + std::to_string(rotated.value()) + " identifier(s)");
    }

    FileOutcome scrub_machine_id_file(const fs::path& path) {
        if (cancelled_) {
            return cancelled(path, TargetKind::MachineIdFile);
        }

        if (config_.dry_run) {
            auto current = identity::read_machine_id(path);
            if (current.is_error()) {
                return failure(path, TargetKind::MachineIdFile, current.error_code(),
                               current.error_message());
            }
            return success(path, TargetKind::MachineIdFile,
                           std::string("would rotate ") +
                               identity::format_class_to_string(
                                   identity::classify(current.value())) +
                               " identifier");
        }

        auto rewritten = identity::rewrite_machine_id_file(path);
        if (rewritten.is_error()) {
            return failure(path, TargetKind::MachineIdFile, rewritten.error_code(),
                           rewritten.error_message());
        }

        event_bus_.emit(events::MACHINE_ID_REWRITTEN, EventMap{{"path", path.string()}});
        return success(path, TargetKind::MachineIdFile, "rotated identifier");
    }

    FileOutcome purge_store(const fs::path& path) {
        if (cancelled_) {
            return cancelled(path, TargetKind::Store);
        }

        purger::OpenOptions options;
        options.max_retries = config_.max_retries;
        options.retry_interval_ms = config_.retry_interval_ms;
        options.on_retry = [this, &path](int attempt, int delay_ms) {
            event_bus_.emit(events::STORE_LOCKED,
                            EventMap{{"path", path.string()},
                                     {"attempt", std::to_string(attempt)},
                                     {"delay_ms", std::to_string(delay_ms)}});
        };

        auto store = purger::LocalStore::open(path, options);
        if (store.is_error()) {
            return failure(path, TargetKind::Store, store.error_code(), store.error_message());
        }

        auto total = store.value().count_rows(config_.criteria);
        if (total.is_error()) {
            return failure(path, TargetKind::Store, total.error_code(), total.error_message());
        }

        if (config_.dry_run) {
            auto matching = store.value().count_matching(config_.criteria);
            if (matching.is_error()) {
                return failure(path, TargetKind::Store, matching.error_code(),
                               matching.error_message());
            }
            return success(path, TargetKind::Store,
                           "would remove " + std::to_string(matching.value()) + " of " +
                               std::to_string(total.value()) + " rows");
        }

        auto removed = store.value().purge_matching(config_.criteria);
        if (removed.is_error()) {
            return failure(path, TargetKind::Store, removed.error_code(), removed.error_message());
        }

        event_bus_.emit(events::STORE_PURGED, EventMap{{"path", path.string()},
                                                       {"removed", std::to_string(removed.value())},
                                                       {"total", std::to_string(total.value())}});

        std::string detail = "removed " + std::to_string(removed.value()) + " of " +
                             std::to_string(total.value()) + " rows";

        if (purger::should_compact(removed.value(), total.value(), config_.compact_threshold)) {
            auto compacted = store.value().compact();
            if (compacted.is_error()) {
                return failure(path, TargetKind::Store, compacted.error_code(),
                               detail + "; " + compacted.error_message());
            }
            event_bus_.emit(events::STORE_COMPACTED, EventMap{{"path", path.string()}});
            detail += ", compacted";
        }

        return success(path, TargetKind::Store, detail);
    }

    FileOutcome protect_file(const fs::path& path) {
        if (cancelled_) {
            return cancelled(path, TargetKind::Guard);
        }

        auto state = guard_->protect(path);
        if (state.is_error()) {
            return failure(path, TargetKind::Guard, state.error_code(), state.error_message());
        }

        event_bus_.emit(events::GUARD_PROTECTED, state.value());
        return success(path, TargetKind::Guard,
                       std::string(protection_mode_to_string(state.value().mode)) + " " +
                           format_permissions(state.value().original_mode) + " -> " +
                           format_permissions(state.value().applied_mode));
    }

    // ========== Restore ==========

    // Records under the override's profile root; a globalStorage override still
    // covers the root's machineid. Empty when every record is in scope.
    std::string restore_scope() const {
        if (config_.profile_override.empty()) {
            return {};
        }
        auto profile = locator::locate_override(config_.profile_override);
        if (profile.is_ok()) {
            return FileGuard::record_key(profile.value().root);
        }
        return FileGuard::record_key(config_.profile_override);
    }

    std::vector<FileOutcome> restore() {
        std::vector<FileOutcome> outcomes;

        std::string scope = restore_scope();

        for (const auto& state : guard_->protected_files()) {
            if (!scope.empty() && !is_under(state.path, scope)) {
                continue;
            }

            fs::path path(state.path);
            if (cancelled_) {
                outcomes.push_back(cancelled(path, TargetKind::Guard));
                continue;
            }

            std::string restored = format_permissions(state.original_mode);
            if (config_.dry_run) {
                outcomes.push_back(success(path, TargetKind::Guard, "would restore " + restored));
                continue;
            }

            auto released = guard_->release(path);
            if (released.is_error()) {
                outcomes.push_back(failure(path, TargetKind::Guard, released.error_code(),
                                           released.error_message()));
                continue;
            }

            event_bus_.emit(events::GUARD_RELEASED, state);
            outcomes.push_back(success(path, TargetKind::Guard, "restored " + restored));
        }

        debug("Restore processed " + std::to_string(outcomes.size()) + " record(s)");
        return outcomes;
    }

    // ========== Outcomes ==========

    FileOutcome success(const fs::path& path, TargetKind kind, std::string detail) {
        debug(std::string(target_kind_to_string(kind)) + " " + path.string() + ": " + detail);
        return FileOutcome{path, kind, OutcomeStatus::Ok, ErrorCode::Success, std::move(detail)};
    }

    FileOutcome failure(const fs::path& path, TargetKind kind, ErrorCode code,
                        std::string detail) {
        if (code == ErrorCode::PermissionDenied) {
            detail += kPermissionHint;
        }

        FileOutcome outcome{path, kind, outcome_for_error(code), code, std::move(detail)};
        event_bus_.emit(outcome.status == OutcomeStatus::Skipped ? events::FILE_SKIPPED
                                                                 : events::FILE_FAILED,
                        outcome);
        return outcome;
    }

    FileOutcome cancelled(const fs::path& path, TargetKind kind) {
        return failure(path, kind, ErrorCode::Cancelled, "run cancelled");
    }

    void debug(const std::string& message) {
        if (config_.debug) {
            event_bus_.emit(events::LOG_DEBUG, message);
        }
    }

    Config config_;
    Environment environment_;
    std::unique_ptr<FileGuard> guard_;
    std::atomic<bool> cancelled_{false};

    // Event bus
    EventBus event_bus_;
};

// Scrubber implementation
Scrubber::Scrubber(Config config) : Scrubber(std::move(config), locator::current_environment()) {}

Scrubber::Scrubber(Config config, Environment environment)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(environment))) {}

Scrubber::~Scrubber() = default;

Scrubber::Scrubber(Scrubber&&) noexcept = default;
Scrubber& Scrubber::operator=(Scrubber&&) noexcept = default;

RunReport Scrubber::run() { return impl_->run(); }

void Scrubber::cancel() noexcept { impl_->cancel(); }

bool Scrubber::is_cancelled() const noexcept { return impl_->is_cancelled(); }

Subscription Scrubber::on(const std::string& event, EventHandler handler) {
    return impl_->on(event, std::move(handler));
}

const Config& Scrubber::config() const noexcept { return impl_->config(); }

const Environment& Scrubber::environment() const noexcept { return impl_->environment(); }

}  // namespace idscrub
