#pragma once

/**
 * @file json.hpp
 * @brief JSON serialization utilities for idscrub types
 *
 * Uses nlohmann/json for config files and persisted lock states.
 */

#include "idscrub.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <stdexcept>

namespace idscrub {
namespace json {

using nlohmann::json;

// ==================== Timestamp Helpers ====================

/// Parse Unix timestamp (seconds) to Timestamp
[[nodiscard]] inline Timestamp parse_unix_timestamp(int64_t unix_ts) {
    return std::chrono::system_clock::from_time_t(static_cast<std::time_t>(unix_ts));
}

/// Format Timestamp as Unix seconds
[[nodiscard]] inline int64_t to_unix_timestamp(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
}

// ==================== LockState ====================

/// Parse protection mode from its string form
[[nodiscard]] inline ProtectionMode parse_protection_mode(const std::string& str) {
    return str == "hard" ? ProtectionMode::Hard : ProtectionMode::Soft;
}

/// Serialize a LockState
[[nodiscard]] inline json lock_state_to_json(const LockState& state) {
    json j;
    j["path"] = state.path;
    j["original_mode"] = state.original_mode;
    j["applied_mode"] = state.applied_mode;
    j["mode"] = protection_mode_to_string(state.mode);
    j["protected_at"] = to_unix_timestamp(state.protected_at);
    return j;
}

/// Parse a LockState (throws nlohmann::json::exception on malformed input)
[[nodiscard]] inline LockState parse_lock_state(const json& j) {
    LockState state;
    state.path = j.at("path").get<std::string>();
    state.original_mode = j.at("original_mode").get<uint32_t>();
    state.applied_mode = j.at("applied_mode").get<uint32_t>();
    state.mode = parse_protection_mode(j.value("mode", "soft"));
    state.protected_at = parse_unix_timestamp(j.value("protected_at", int64_t{0}));
    return state;
}

// ==================== Config ====================

/// Parse one key pattern: {"kind": "prefix", "text": "telemetry."}
[[nodiscard]] inline KeyPattern parse_key_pattern(const json& j) {
    auto kind = match_kind_from_string(j.at("kind").get<std::string>());
    if (!kind) {
        throw std::invalid_argument("Unknown pattern kind: " + j.at("kind").get<std::string>());
    }
    KeyPattern pattern;
    pattern.kind = *kind;
    pattern.text = j.at("text").get<std::string>();
    return pattern;
}

/// Parse purge criteria, keeping base values for missing fields
[[nodiscard]] inline TelemetryRowCriteria parse_criteria(const json& j, TelemetryRowCriteria base) {
    if (!j.is_object()) {
        throw std::invalid_argument("\"criteria\" must be an object");
    }
    if (j.contains("table")) {
        base.table = j["table"].get<std::string>();
    }
    if (j.contains("key_column")) {
        base.key_column = j["key_column"].get<std::string>();
    }
    if (j.contains("patterns")) {
        base.patterns.clear();
        for (const auto& item : j["patterns"]) {
            base.patterns.push_back(parse_key_pattern(item));
        }
    }
    return base;
}

/**
 * @brief Overlay config JSON onto a Config
 *
 * Unknown keys are ignored. Throws nlohmann::json::exception on a wrong type
 * and std::invalid_argument on an out-of-range value.
 */
inline void apply_config(const json& j, Config& config) {
    if (!j.is_object()) {
        throw std::invalid_argument("Config root must be an object");
    }

    if (j.contains("profile")) {
        config.profile_override = j["profile"].get<std::string>();
    }
    if (j.contains("hosts")) {
        config.hosts = j["hosts"].get<std::vector<std::string>>();
    }
    if (j.contains("identity_keys")) {
        config.identity_keys = j["identity_keys"].get<std::vector<std::string>>();
    }
    if (j.contains("criteria")) {
        config.criteria = parse_criteria(j["criteria"], config.criteria);
    }
    if (j.contains("state_directory")) {
        config.state_directory = j["state_directory"].get<std::string>();
    }
    if (j.contains("dry_run")) {
        config.dry_run = j["dry_run"].get<bool>();
    }
    if (j.contains("restore")) {
        config.restore = j["restore"].get<bool>();
    }
    if (j.contains("protect_files")) {
        config.protect_files = j["protect_files"].get<bool>();
    }
    if (j.contains("purge_stores")) {
        config.purge_stores = j["purge_stores"].get<bool>();
    }
    if (j.contains("rewrite_machine_id")) {
        config.rewrite_machine_id = j["rewrite_machine_id"].get<bool>();
    }
    if (j.contains("parallel")) {
        config.parallel = j["parallel"].get<bool>();
    }
    if (j.contains("compact_threshold")) {
        config.compact_threshold = j["compact_threshold"].get<double>();
        if (config.compact_threshold < 0.0 || config.compact_threshold > 1.0) {
            throw std::invalid_argument("\"compact_threshold\" must be between 0 and 1");
        }
    }
    if (j.contains("max_retries")) {
        config.max_retries = j["max_retries"].get<int>();
        if (config.max_retries < 0 || config.max_retries > 20) {
            throw std::invalid_argument("\"max_retries\" must be between 0 and 20");
        }
    }
    if (j.contains("retry_interval_ms")) {
        config.retry_interval_ms = j["retry_interval_ms"].get<int>();
        if (config.retry_interval_ms < 0) {
            throw std::invalid_argument("\"retry_interval_ms\" must not be negative");
        }
    }
    if (j.contains("debug")) {
        config.debug = j["debug"].get<bool>();
    }
}

}  // namespace json
}  // namespace idscrub
