/**
 * @file basic_usage.cpp
 * @brief Basic usage example for the idscrub library
 *
 * This example demonstrates how to:
 * - Configure a Scrubber
 * - Subscribe to progress events
 * - Preview a scrub with a dry run
 * - Inspect identifier formats without changing anything
 * - Handle errors using the Result type
 */

#include <idscrub/events.hpp>
#include <idscrub/identity.hpp>
#include <idscrub/idscrub.hpp>
#include <idscrub/locator.hpp>

#include <iostream>
#include <map>
#include <string>

int main(int argc, char* argv[]) {
    // Configure the scrubber
    idscrub::Config config;

    // Preview only: nothing is written, no protection is applied
    config.dry_run = true;

    // Point at one profile directory, or leave empty to auto-detect
    if (argc > 1) {
        config.profile_override = argv[1];
    }

    // Only look for these hosts when auto-detecting
    config.hosts = {"Code", "Cursor"};

    // Remove rows whose key starts with "telemetry." plus one exact key
    config.criteria.patterns = {{idscrub::MatchKind::Prefix, "telemetry."},
                                {idscrub::MatchKind::Exact, "workbench.telemetry.optIn"}};

    idscrub::Scrubber scrubber(config);

    // Example 0: Subscribe to events
    std::cout << "=== Event Subscription ===\n";
    auto found = scrubber.on(idscrub::events::PROFILE_FOUND, [](const std::any& data) {
        const auto& profile = std::any_cast<const idscrub::ProfilePaths&>(data);
        std::cout << "[Event] Found " << profile.host << " at " << profile.root.string() << "\n";
    });

    auto locked = scrubber.on(idscrub::events::STORE_LOCKED, [](const std::any& data) {
        const auto& fields = std::any_cast<const std::map<std::string, std::string>&>(data);
        std::cout << "[Event] " << fields.at("path") << " is in use, retry "
                  << fields.at("attempt") << "\n";
    });

    auto skipped = scrubber.on(idscrub::events::FILE_SKIPPED, [](const std::any& data) {
        const auto& outcome = std::any_cast<const idscrub::FileOutcome&>(data);
        std::cout << "[Event] Skipped " << outcome.path.string() << ": " << outcome.detail << "\n";
    });

    // Example 1: Dry run
    std::cout << "\n=== Dry Run ===\n";
    auto report = scrubber.run();

    if (report.fatal) {
        std::cout << "Nothing to do: " << report.fatal_message << "\n";
        return report.exit_code();
    }

    for (const auto& outcome : report.outcomes) {
        std::cout << idscrub::outcome_status_to_string(outcome.status) << "  "
                  << idscrub::target_kind_to_string(outcome.kind) << "  "
                  << outcome.path.string() << "  " << outcome.detail << "\n";
    }

    // Example 2: Inspect identifier formats with the Result type
    std::cout << "\n=== Identifier Formats ===\n";
    auto profiles = idscrub::locator::locate(config.hosts, scrubber.environment());
    if (profiles.is_error()) {
        std::cout << "Error: " << profiles.error_message() << "\n";
    } else {
        for (const auto& profile : profiles.value()) {
            if (!profile.identity_file) {
                continue;
            }
            auto doc = idscrub::identity::read_identities(*profile.identity_file,
                                                          config.identity_keys);
            if (doc.is_error()) {
                std::cout << profile.host << ": "
                          << idscrub::error_code_to_string(doc.error_code()) << " - "
                          << doc.error_message() << "\n";
                continue;
            }
            for (const auto& [key, value] : doc.value().record()) {
                std::cout << profile.host << "  " << key << "  "
                          << idscrub::identity::format_signature(value) << "\n";
            }
        }
    }

    // Subscriptions can be cancelled early
    found.cancel();
    locked.cancel();
    skipped.cancel();

    std::cout << "\n" << report.count(idscrub::OutcomeStatus::Ok) << " ok, "
              << report.count(idscrub::OutcomeStatus::Skipped) << " skipped, "
              << report.count(idscrub::OutcomeStatus::Failed) << " failed\n";
    return report.exit_code();
}
