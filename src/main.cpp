/**
 * @file main.cpp
 * @brief idscrub command line front end
 *
 * Parses flags, wires SIGINT to Scrubber::cancel(), prints progress events and
 * the per-file outcome table, and exits with the run's exit code.
 */

#include "idscrub/idscrub.hpp"
#include "idscrub/events.hpp"
#include "idscrub/guard.hpp"

#include <algorithm>
#include <any>
#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace {

std::atomic<idscrub::Scrubber*> g_scrubber{nullptr};

extern "C" void handle_sigint(int) {
    if (auto* scrubber = g_scrubber.load()) {
        scrubber->cancel();
    }
}

struct CliOptions {
    std::optional<std::string> profile;
    std::optional<std::string> config_file;
    std::optional<std::string> state_dir;
    bool dry_run = false;
    bool restore = false;
    bool no_protect = false;
    bool no_purge = false;
    bool parallel = false;
    bool verbose = false;
    bool help = false;
    bool version = false;
};

void print_usage(std::ostream& out) {
    out << "Usage: idscrub [options]\n"
           "\n"
           "Rotates the telemetry identifiers of VS Code family editors, purges telemetry\n"
           "rows from their local storage and write-protects the rewritten files.\n"
           "\n"
           "Options:\n"
           "  --profile <dir>     Act on this profile directory instead of detecting one\n"
           "  --dry-run           Report what would change, change nothing\n"
           "  --restore           Undo the write protection applied by earlier runs\n"
           "  --config <file>     Read settings from a JSON file\n"
           "  --state-dir <dir>   Where protection records are kept\n"
           "  --no-protect        Do not write-protect rewritten files\n"
           "  --no-purge          Do not touch local-storage databases\n"
           "  --parallel          Process detected profiles concurrently\n"
           "  --verbose           Print progress and diagnostics\n"
           "  --help              Show this help\n"
           "  --version           Show the version\n"
           "\n"
           "Exit status: 0 success, 1 some files skipped or failed, 2 fatal error.\n"
           "Close the editor before running; open databases are skipped.\n";
}

idscrub::Result<CliOptions> parse_args(int argc, char** argv) {
    using idscrub::ErrorCode;
    using idscrub::Result;

    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::optional<std::string> inline_value;
        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            inline_value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
        }

        auto take_value = [&](std::optional<std::string>& target) -> bool {
            if (inline_value) {
                target = *inline_value;
                return true;
            }
            if (i + 1 >= argc) {
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "--profile" || arg == "--config" || arg == "--state-dir") {
            auto& target = arg == "--profile"  ? options.profile
                           : arg == "--config" ? options.config_file
                                               : options.state_dir;
            if (!take_value(target) || target->empty()) {
                return Result<CliOptions>::error(ErrorCode::InvalidParameter,
                                                 "option " + arg + " requires a value");
            }
            continue;
        }

        if (inline_value) {
            return Result<CliOptions>::error(ErrorCode::InvalidParameter,
                                             "option " + arg + " takes no value");
        }

        if (arg == "--dry-run") {
            options.dry_run = true;
        } else if (arg == "--restore") {
            options.restore = true;
        } else if (arg == "--no-protect") {
            options.no_protect = true;
        } else if (arg == "--no-purge") {
            options.no_purge = true;
        } else if (arg == "--parallel") {
            options.parallel = true;
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--version") {
            options.version = true;
        } else {
            return Result<CliOptions>::error(ErrorCode::InvalidParameter,
                                             "unknown option " + arg);
        }
    }
    return Result<CliOptions>::ok(std::move(options));
}

// Command line flags win over the config file
idscrub::Result<idscrub::Config> build_config(const CliOptions& options) {
    idscrub::Config config;
    if (options.config_file) {
        auto loaded = idscrub::load_config(*options.config_file);
        if (loaded.is_error()) {
            return loaded;
        }
        config = std::move(loaded).value();
    }

    if (options.profile) {
        config.profile_override = *options.profile;
    }
    if (options.state_dir) {
        config.state_directory = *options.state_dir;
    }
    config.dry_run = config.dry_run || options.dry_run;
    config.restore = config.restore || options.restore;
    config.protect_files = config.protect_files && !options.no_protect;
    config.purge_stores = config.purge_stores && !options.no_purge;
    config.parallel = config.parallel || options.parallel;
    config.debug = config.debug || options.verbose;
    return idscrub::Result<idscrub::Config>::ok(std::move(config));
}

std::vector<idscrub::Subscription> subscribe_progress(idscrub::Scrubber& scrubber, bool verbose) {
    std::vector<idscrub::Subscription> subs;

    subs.push_back(scrubber.on(idscrub::events::STORE_LOCKED, [](const std::any& data) {
        const auto& info = std::any_cast<const std::map<std::string, std::string>&>(data);
        std::cerr << "Store in use, retrying in " << info.at("delay_ms")
                  << " ms: " << info.at("path") << "\n";
    }));

    if (!verbose) {
        return subs;
    }

    subs.push_back(scrubber.on(idscrub::events::PROFILE_FOUND, [](const std::any& data) {
        const auto& profile = std::any_cast<const idscrub::ProfilePaths&>(data);
        std::cerr << "Found " << profile.host << " at " << profile.root.string() << "\n";
    }));

    subs.push_back(scrubber.on(idscrub::events::LOG_DEBUG, [](const std::any& data) {
        std::cerr << "[debug] " << std::any_cast<const std::string&>(data) << "\n";
    }));

    return subs;
}

void print_report(const idscrub::RunReport& report) {
    if (report.outcomes.empty()) {
        std::cout << "Nothing to do.\n";
        return;
    }

    std::size_t path_width = 4;
    for (const auto& outcome : report.outcomes) {
        path_width = std::max(path_width, outcome.path.string().size());
    }

    std::cout << std::left << std::setw(9) << "STATUS" << std::setw(11) << "KIND"
              << std::setw(static_cast<int>(path_width) + 2) << "PATH"
              << "DETAIL\n";
    for (const auto& outcome : report.outcomes) {
        std::string detail = outcome.detail;
        if (outcome.status != idscrub::OutcomeStatus::Ok) {
            detail = std::string(idscrub::error_code_to_string(outcome.error)) + ": " + detail;
        }
        std::cout << std::left << std::setw(9) << idscrub::outcome_status_to_string(outcome.status)
                  << std::setw(11) << idscrub::target_kind_to_string(outcome.kind)
                  << std::setw(static_cast<int>(path_width) + 2) << outcome.path.string()
                  << detail << "\n";
    }

    std::cout << "\n"
              << report.count(idscrub::OutcomeStatus::Ok) << " ok, "
              << report.count(idscrub::OutcomeStatus::Skipped) << " skipped, "
              << report.count(idscrub::OutcomeStatus::Failed) << " failed";
    if (report.cancelled) {
        std::cout << " (cancelled)";
    }
    std::cout << "\n";
}

}  // namespace

int main(int argc, char** argv) {
    auto options = parse_args(argc, argv);
    if (options.is_error()) {
        std::cerr << "idscrub: " << options.error_message() << "\n";
        print_usage(std::cerr);
        return idscrub::EXIT_FATAL;
    }
    if (options.value().help) {
        print_usage(std::cout);
        return idscrub::EXIT_OK;
    }
    if (options.value().version) {
        std::cout << "idscrub " << idscrub::VERSION << "\n";
        return idscrub::EXIT_OK;
    }

    auto config = build_config(options.value());
    if (config.is_error()) {
        std::cerr << "idscrub: " << config.error_message() << "\n";
        return idscrub::EXIT_FATAL;
    }

    idscrub::Scrubber scrubber(std::move(config).value());
    auto subscriptions = subscribe_progress(scrubber, options.value().verbose);

    g_scrubber.store(&scrubber);
    std::signal(SIGINT, handle_sigint);

    if (scrubber.config().dry_run) {
        std::cout << "Dry run: no files will be changed.\n";
    }
    if (options.value().verbose && !scrubber.config().restore) {
        std::cerr << "Protection: " << idscrub::protection_mode_to_string(
                                           idscrub::FileGuard::capability())
                  << "\n";
    }

    auto report = scrubber.run();

    std::signal(SIGINT, SIG_DFL);
    g_scrubber.store(nullptr);

    if (report.fatal) {
        std::cerr << "idscrub: " << report.fatal_message << "\n";
        return report.exit_code();
    }

    print_report(report);
    return report.exit_code();
}
