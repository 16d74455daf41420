//
// Created by cv2 on 10/19/26.
//

#pragma once

#include <iostream>
#include <string>
#include <libaps/git.h>
#include <libaps/lockfile.h>
#include <libaps/sync.h>

namespace ui {

// --- ANSI Color Codes ---
    inline const char* const RESET = "\033[0m";
    inline const char* const BOLD = "\033[1m";
    inline const char* const DIM = "\033[2m";
    inline const char* const BLUE = "\033[1;34m";
    inline const char* const GREEN = "\033[0;32m";
    inline const char* const RED = "\033[1;31m";
    inline const char* const YELLOW = "\033[1;33m";
    inline const char* const CYAN = "\033[0;36m";

// --- Formatted Printing Functions ---

    inline void action(const std::string& msg) {
        std::cout << BLUE << ":: " << RESET << BOLD << msg << RESET << std::endl;
    }

    inline void header(const std::string& msg) {
        std::cout << BOLD << msg << RESET << std::endl;
    }

    inline void item(const std::string& msg) {
        std::cout << " " << GREEN << "-" << RESET << " " << msg << std::endl;
    }

    inline void error(const std::string& msg) {
        std::cerr << RED << "error: " << RESET << msg << std::endl;
    }

    inline void warning(const std::string& msg) {
        std::cout << YELLOW << "warning: " << RESET << msg << std::endl;
    }

// Asks the user a "Yes/No" question. Anything but an explicit yes is a no.
    inline bool confirm(const std::string& question) {
        std::cout << CYAN << ":: " << RESET << BOLD << question << " [y/N] " << RESET;
        std::string response;
        if (!std::getline(std::cin, response)) {
            return false;
        }
        return !response.empty() && (response[0] == 'y' || response[0] == 'Y');
    }

    inline const char* status_color(aps::SyncStatus status) {
        switch (status) {
            case aps::SyncStatus::Synced: return GREEN;
            case aps::SyncStatus::Copied: return GREEN;
            case aps::SyncStatus::Current: return DIM;
            case aps::SyncStatus::Upgradable: return CYAN;
            case aps::SyncStatus::Warning: return YELLOW;
        }
        return RESET;
    }

    // One line per entry: status, id, destination and an optional note.
    inline void print_sync_results(const aps::SyncReport& report, bool dry_run) {
        header(dry_run ? "\nSync plan (dry run):" : "\nSync results:");
        for (const auto& result : report.results) {
            const auto status = aps::status_of(result);
            std::string line = std::string(status_color(status)) + "[" + aps::to_string(status) + "]" + RESET + " " +
                               result.id + " " + DIM + "-> " + result.dest_path.string() + RESET;

            if (!result.warnings.empty()) {
                std::string joined;
                for (const auto& warning : result.warnings) {
                    joined += joined.empty() ? warning : ", " + warning;
                }
                line += " (" + joined + ")";
            }
            if (result.upgrade_available) {
                line += " (" + aps::git::short_commit(result.upgrade_available->current_commit) + " -> " +
                        aps::git::short_commit(result.upgrade_available->available_commit) + ", run with --upgrade)";
            }
            std::cout << "  " << line << std::endl;
        }
    }

    inline void print_sync_summary(const aps::SyncReport& report, bool dry_run) {
        size_t synced = 0, copied = 0, current = 0, upgradable = 0, warnings = 0;
        for (const auto& result : report.results) {
            switch (aps::status_of(result)) {
                case aps::SyncStatus::Synced: ++synced; break;
                case aps::SyncStatus::Copied: ++copied; break;
                case aps::SyncStatus::Current: ++current; break;
                case aps::SyncStatus::Upgradable: ++upgradable; break;
                case aps::SyncStatus::Warning: ++warnings; break;
            }
        }

        std::string summary = std::to_string(synced) + " synced, " + std::to_string(copied) + " copied, " +
                              std::to_string(current) + " current";
        if (upgradable > 0) summary += ", " + std::to_string(upgradable) + " upgradable";
        if (warnings > 0) summary += ", " + std::to_string(warnings) + " with warnings";
        if (report.orphans_removed > 0) summary += ", " + std::to_string(report.orphans_removed) + " orphaned path(s) removed";

        header(std::string(dry_run ? "\n[dry-run] " : "\n") + summary);
    }

    inline void print_lockfile_status(const aps::Lockfile& lockfile) {
        if (!lockfile.aps_version().empty()) {
            std::cout << "APS version:  " << lockfile.aps_version() << std::endl;
        }
        if (lockfile.entries().empty()) {
            header("No entries in lockfile.");
            return;
        }

        header("Synced entries:");
        std::cout << std::string(80, '-') << std::endl;
        for (const auto& [id, entry] : lockfile.entries()) {
            std::cout << "ID:           " << id << "\n"
                      << "Source:       " << entry.source_description() << "\n"
                      << "Destination:  " << entry.dest << "\n";
            if (entry.resolved_ref) std::cout << "Ref:          " << *entry.resolved_ref << "\n";
            if (entry.commit) std::cout << "Commit:       " << *entry.commit << "\n";
            if (entry.is_symlink) {
                std::cout << "Symlink:      yes";
                if (entry.target_path) std::cout << " -> " << *entry.target_path;
                std::cout << "\n";
            }
            std::cout << "Last updated: " << entry.last_updated_at << "\n"
                      << "Checksum:     " << entry.checksum << "\n"
                      << std::string(80, '-') << std::endl;
        }
    }

    // Manifest entries with their source, destination and whether the lockfile knows them.
    inline void print_manifest_entries(const aps::Manifest& manifest, const std::string& manifest_name,
                                       const aps::Lockfile& lockfile) {
        std::cout << DIM << "Manifest: " << RESET << CYAN << manifest_name << RESET << DIM << " ("
                  << manifest.entries.size() << " entries)" << RESET << "\n" << std::endl;

        size_t synced = 0;
        for (const auto& entry : manifest.entries) {
            std::cout << "  " << BOLD << entry.id << RESET << " " << DIM << aps::to_string(entry.kind) << RESET << "\n";
            if (entry.is_composite()) {
                std::cout << "  " << DIM << "Source: composite (" << entry.sources.size() << " sources)" << RESET << "\n";
                for (const auto& source : entry.sources) {
                    std::cout << "          " << DIM << "- " << aps::source_summary(source) << RESET << "\n";
                }
            } else if (entry.source) {
                std::cout << "  " << DIM << "Source: " << aps::source_summary(*entry.source) << RESET << "\n";
            }

            const auto dest = entry.destination().string();
            const bool explicit_path = dest.starts_with("./") || dest.starts_with("/");
            std::cout << "  " << DIM << "Dest:   " << RESET << CYAN << (explicit_path ? dest : "./" + dest) << RESET << "\n";

            if (!entry.include.empty()) {
                std::string joined;
                for (const auto& prefix : entry.include) {
                    joined += joined.empty() ? prefix : ", " + prefix;
                }
                std::cout << "  " << DIM << "Filter: " << RESET << YELLOW << joined << RESET << "\n";
            }

            if (lockfile.find(entry.id)) {
                std::cout << "  " << GREEN << "synced" << RESET << "\n";
                ++synced;
            }
            std::cout << std::endl;
        }

        const auto total = manifest.entries.size();
        if (synced == total) {
            std::cout << GREEN << "All " << total << " entries synced" << RESET << std::endl;
        } else {
            std::cout << GREEN << synced << RESET << " synced, " << YELLOW << (total - synced) << RESET << " pending" << std::endl;
        }
    }

} // namespace ui
