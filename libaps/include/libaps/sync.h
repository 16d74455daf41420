//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "context.h"
#include "error.h"
#include "installer.h"
#include "manifest.h"
#include "orphan.h"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace aps {

    enum class SyncStatus {
        Synced,     // installed as symlinks
        Copied,     // installed as copies
        Current,    // nothing to do
        Upgradable, // current, but the remote has moved on
        Warning     // installed or current, with warnings
    };

    SyncStatus status_of(const InstallResult& result);
    const char* to_string(SyncStatus status);

    struct SyncOptions {
        InstallOptions install;
        // Restrict the run to these ids. Empty means every entry.
        std::vector<std::string> only;
    };

    struct SyncFailure {
        std::string entry_id;
        std::filesystem::path dest;
        Error error;
    };

    struct SyncReport {
        std::vector<InstallResult> results;
        std::vector<OrphanCandidate> orphans;
        std::size_t orphans_removed = 0;
        std::vector<std::string> stale_removed;
        std::vector<std::string> overlap_warnings;
        // The entry that stopped the run. Entries before it are still recorded.
        std::optional<SyncFailure> failure;
        bool lockfile_saved = false;
    };

    /**
     * @brief Runs one sync over a manifest.
     * Detects orphans against the prior lockfile, installs the selected entries
     * in order until one fails, cleans up orphans, then writes the lockfile once
     * (unless dry-run) with every entry that succeeded.
     * Errors that happen before any install (invalid manifest, unknown --only id,
     * unreadable lockfile) and a failed lockfile write are returned as errors;
     * an entry failure is reported in SyncReport::failure.
     */
    std::expected<SyncReport, Error> run_sync(const Manifest& manifest, const std::filesystem::path& manifest_path,
                                              const SyncOptions& options, const RunContext& ctx);

}
