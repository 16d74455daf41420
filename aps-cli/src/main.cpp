//
// Created by cv2 on 10/19/26.
//

#include <cstdlib>
#include <expected>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

// Our library and UI helpers
#include "ui_helpers.h"
#include <cxxopts.hpp>
#include <libaps/context.h>
#include <libaps/fs_utils.h>
#include <libaps/init.h>
#include <libaps/installer.h>
#include <libaps/lockfile.h>
#include <libaps/manifest.h>
#include <libaps/parser.h>
#include <libaps/source.h>
#include <libaps/sync.h>
#include <libaps/ui.h>

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help() << "\n"
              << "Commands:\n"
              << "  init                Create aps.yaml here and ignore .aps-backups/\n"
              << "  list                Show manifest entries and whether they are synced\n"
              << "  sync                Install every manifest entry and update aps.lock.yaml\n"
              << "  status              Show what the lockfile records\n"
              << "  validate            Check the manifest and its sources\n\n"
              << "Set APS_VERBOSE=1 for the same output as --verbose.\n";
}

struct CliOptions {
    std::string command;
    std::optional<std::string> manifest;
    aps::SyncOptions sync;
    bool verbose = false;
};

static std::string describe(const aps::Error& error) {
    return std::string(aps::to_string(error.kind)) + ": " + error.message;
}

static std::expected<std::filesystem::path, aps::Error> locate_manifest(const std::optional<std::string>& override_path) {
    if (override_path) {
        auto path = std::filesystem::absolute(aps::fs::expand_path(*override_path)).lexically_normal();
        if (!std::filesystem::exists(path)) {
            return std::unexpected(aps::Error{aps::ErrorKind::ManifestInvalid, "Manifest not found: " + path.string()});
        }
        return path;
    }

    std::error_code ec;
    const auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        return std::unexpected(aps::io_error("Failed to get current directory", ec));
    }
    return aps::discover_manifest(cwd);
}

static aps::RunContext make_context(const std::filesystem::path& manifest_path, bool verbose) {
    aps::RunContext ctx;
    ctx.base_dir = manifest_path.parent_path();
    ctx.interactive = aps::ui::is_interactive();
    ctx.confirm = ui::confirm;
    ctx.logger = aps::log::Logger(std::cout, verbose, aps::ui::stdout_is_terminal());
    return ctx;
}

// --- COMMAND HANDLERS ---

int do_init(const CliOptions& cli) {
    std::filesystem::path manifest_path;
    if (cli.manifest) {
        manifest_path = std::filesystem::absolute(aps::fs::expand_path(*cli.manifest)).lexically_normal();
    } else {
        std::error_code ec;
        const auto cwd = std::filesystem::current_path(ec);
        if (ec) {
            ui::error(describe(aps::io_error("Failed to get current directory", ec)));
            return 1;
        }
        manifest_path = cwd / aps::MANIFEST_NAME;
    }

    const auto ctx = make_context(manifest_path, cli.verbose);
    if (cli.sync.install.dry_run) {
        ui::warning("Dry run, would create " + manifest_path.string());
        return 0;
    }
    if (auto created = aps::init_manifest(manifest_path, ctx.logger); !created) {
        ui::error(describe(created.error()));
        return 1;
    }
    return 0;
}

int do_list(const CliOptions& cli) {
    auto manifest_path = locate_manifest(cli.manifest);
    if (!manifest_path) {
        ui::error(describe(manifest_path.error()));
        return 1;
    }
    const auto ctx = make_context(*manifest_path, cli.verbose);

    auto manifest = aps::ManifestParser::parse(*manifest_path);
    if (!manifest) {
        ui::error(describe(manifest.error()));
        return 1;
    }

    // An unreadable lockfile only hides the sync markers.
    auto lockfile = aps::Lockfile::load(aps::Lockfile::path_for_manifest(*manifest_path), ctx.logger);
    if (!lockfile) {
        ui::warning(describe(lockfile.error()));
        lockfile = aps::Lockfile();
    }

    ui::print_manifest_entries(*manifest, manifest_path->filename().string(), *lockfile);
    return 0;
}

int do_sync(const CliOptions& cli) {
    auto manifest_path = locate_manifest(cli.manifest);
    if (!manifest_path) {
        ui::error(describe(manifest_path.error()));
        return 1;
    }
    const auto ctx = make_context(*manifest_path, cli.verbose);
    const bool dry_run = cli.sync.install.dry_run;

    ui::action("Syncing from " + manifest_path->string());
    if (dry_run) ui::warning("Dry run, nothing will be written.");

    auto manifest = aps::ManifestParser::parse(*manifest_path);
    if (!manifest) {
        ui::error(describe(manifest.error()));
        return 1;
    }

    auto report = aps::run_sync(*manifest, *manifest_path, cli.sync, ctx);
    if (!report) {
        ui::error(describe(report.error()));
        return 1;
    }

    ui::print_sync_results(*report, dry_run);

    if (report->failure) {
        const auto& failure = *report->failure;
        ui::error("Entry '" + failure.entry_id + "' (" + failure.dest.string() + ") failed. " + describe(failure.error));
        if (report->lockfile_saved && !report->results.empty()) {
            ui::warning("The lockfile records the " + std::to_string(report->results.size()) + " entries processed before the failure.");
        }
        return 1;
    }

    ui::print_sync_summary(*report, dry_run);
    return 0;
}

int do_status(const CliOptions& cli) {
    auto manifest_path = locate_manifest(cli.manifest);
    if (!manifest_path) {
        ui::error(describe(manifest_path.error()));
        return 1;
    }
    const auto ctx = make_context(*manifest_path, cli.verbose);

    auto lockfile = aps::Lockfile::load(aps::Lockfile::path_for_manifest(*manifest_path), ctx.logger);
    if (!lockfile) {
        ui::error(describe(lockfile.error()));
        return 1;
    }
    ui::print_lockfile_status(*lockfile);
    return 0;
}

int do_validate(const CliOptions& cli) {
    auto manifest_path = locate_manifest(cli.manifest);
    if (!manifest_path) {
        ui::error(describe(manifest_path.error()));
        return 1;
    }
    const auto ctx = make_context(*manifest_path, cli.verbose);
    const bool strict = cli.sync.install.strict;

    ui::action("Validating manifest at " + manifest_path->string());
    auto manifest = aps::ManifestParser::parse(*manifest_path);
    if (!manifest) {
        ui::error(describe(manifest.error()));
        return 1;
    }
    if (auto valid = manifest->validate(); !valid) {
        ui::error(describe(valid.error()));
        return 1;
    }
    ui::item("Schema validation passed");
    for (const auto& overlap : manifest->detect_overlapping_destinations()) {
        ui::warning(overlap);
    }

    aps::InstallOptions options;
    options.strict = strict;
    const aps::Lockfile no_history;
    const aps::Installer installer(ctx, no_history, options);

    size_t warning_count = 0;
    ui::header("\nValidating entries:");
    for (const auto& entry : manifest->entries) {
        const std::vector<aps::Source> sources = entry.is_composite() ? entry.sources : std::vector<aps::Source>{*entry.source};

        bool entry_ok = true;
        for (const auto& source : sources) {
            std::string problem;
            auto resolved = aps::resolve(source, ctx);
            if (!resolved) {
                problem = "Source validation failed: " + resolved.error().message;
            } else if (!std::filesystem::exists(resolved->source_path)) {
                problem = "Source path not found: " + resolved->source_path.string();
            } else if (!entry.is_composite()) {
                auto structural = installer.validate_structure(entry, resolved->source_path);
                if (!structural) {
                    ui::error(describe(structural.error()));
                    return 1;
                }
                for (const auto& warning : *structural) {
                    ui::warning(entry.id + ": " + warning);
                    ++warning_count;
                    entry_ok = false;
                }
            }

            if (!problem.empty()) {
                if (strict) {
                    ui::error(entry.id + ": " + problem);
                    return 1;
                }
                ui::warning(entry.id + ": " + problem);
                ++warning_count;
                entry_ok = false;
            }
        }

        if (entry_ok) {
            ui::item("[OK] " + entry.id + " (" + aps::to_string(entry.kind) + ")");
        }
    }

    if (warning_count == 0) {
        ui::header("\nManifest is valid. All " + std::to_string(manifest->entries.size()) + " entries validated successfully.");
    } else {
        ui::header("\nManifest is valid with " + std::to_string(warning_count) + " warning(s).");
        if (!strict) ui::item("Run with --strict to treat warnings as errors.");
    }
    return 0;
}

// --- Main Function ---

int main(int argc, char* argv[]) {
    cxxopts::Options options("aps <command>", "Syncs agent assets declared in aps.yaml into this project");
    options.add_options()
            ("manifest", "Use this manifest instead of searching for aps.yaml", cxxopts::value<std::string>())
            ("dry-run", "Show what would change without writing anything")
            ("y,yes", "Overwrite conflicts and delete orphans without asking")
            ("strict", "Treat structural warnings as errors")
            ("upgrade", "Follow the declared git refs instead of locked commits")
            ("only", "Only sync this entry (repeatable)", cxxopts::value<std::vector<std::string>>())
            ("v,verbose", "Print debug output")
            ("h,help", "Show this help")
            ;

    if (argc < 2) {
        print_usage(options);
        return 1;
    }

    CliOptions cli;
    cli.command = argv[1];
    if (cli.command == "--help" || cli.command == "-h") {
        print_usage(options);
        return 0;
    }

    try {
        // Parse the arguments after the command.
        auto result = options.parse(argc - 1, argv + 1);
        if (result.count("help")) {
            print_usage(options);
            return 0;
        }
        if (!result.unmatched().empty()) {
            ui::error("Unexpected argument: " + result.unmatched().front());
            return 1;
        }

        if (result.count("manifest")) cli.manifest = result["manifest"].as<std::string>();
        if (result.count("only")) cli.sync.only = result["only"].as<std::vector<std::string>>();
        cli.sync.install.dry_run = result.count("dry-run") > 0;
        cli.sync.install.yes = result.count("yes") > 0;
        cli.sync.install.strict = result.count("strict") > 0;
        cli.sync.install.upgrade = result.count("upgrade") > 0;

        const char* verbose_env = std::getenv("APS_VERBOSE");
        cli.verbose = result.count("verbose") > 0 || (verbose_env && std::string(verbose_env) == "1");
    } catch (const std::exception& e) {
        ui::error(std::string("Invalid arguments: ") + e.what());
        print_usage(options);
        return 1;
    }

    // Command dispatch.
    if (cli.command == "init") {
        return do_init(cli);
    } else if (cli.command == "list") {
        return do_list(cli);
    } else if (cli.command == "sync") {
        return do_sync(cli);
    } else if (cli.command == "status") {
        return do_status(cli);
    } else if (cli.command == "validate") {
        return do_validate(cli);
    }

    ui::error("Unknown command: " + cli.command);
    print_usage(options);
    return 1;
}
