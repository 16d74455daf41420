//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "context.h"
#include "error.h"
#include "lockfile.h"
#include "manifest.h"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace aps {

    // A destination a previous run installed to that the manifest no longer points at.
    struct OrphanCandidate {
        std::string entry_id;
        std::filesystem::path previous_dest;
        std::filesystem::path current_dest;
    };

    // True if, after canonicalization, either path equals or contains the other.
    bool paths_overlap(const std::filesystem::path& a, const std::filesystem::path& b);

    /**
     * @brief Compares each entry's current destination with the one recorded in the lockfile.
     * Only ids present in both are considered. A previous destination that is
     * gone, or that overlaps the current one, never produces a candidate.
     */
    std::vector<OrphanCandidate> detect_orphans(const std::vector<const Entry*>& entries, const Lockfile& lockfile,
                                                const std::filesystem::path& base_dir, const log::Logger& logger);

    /**
     * @brief Deletes one orphan. Symlinks and directories holding nothing but
     * symlinks are removed directly, anything else is backed up first.
     */
    std::expected<void, Error> remove_orphan(const OrphanCandidate& orphan, const std::filesystem::path& base_dir,
                                             const log::Logger& logger);

    /**
     * @brief Reports the orphans and removes them when allowed to.
     * Dry runs only report. Without --yes an interactive user is asked, a
     * non-interactive run leaves everything in place. A failure on one orphan
     * is logged as a warning and does not stop the rest.
     * @return Number of orphans removed.
     */
    std::size_t cleanup_orphans(const std::vector<OrphanCandidate>& orphans, const InstallOptions& options,
                                const RunContext& ctx);

}
