//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "context.h"
#include "error.h"
#include "git.h"
#include "manifest.h"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace aps {

    struct GitInfo {
        std::string resolved_ref;
        std::string commit;
    };

    /**
     * @brief A source materialized on the local disk.
     * For git sources the path points into a temporary clone owned by this
     * value, so the path is only valid while the value is alive.
     */
    struct ResolvedSource {
        std::filesystem::path source_path;
        std::string source_display;
        bool use_symlink = false; // never true for git sources
        std::optional<GitInfo> git_info;
        std::optional<TempDir> clone_dir;
    };

    /**
     * @brief Turns a source descriptor into a usable path.
     * Filesystem sources expand ~ and environment variables and resolve
     * relative roots against the run's base directory. Git sources are cloned.
     * The returned path is not checked for existence.
     */
    std::expected<ResolvedSource, Error> resolve(const Source& source, const RunContext& ctx);

    // Clones a git source at an exact, previously recorded commit.
    std::expected<ResolvedSource, Error> resolve_at_commit(const GitSource& source, const std::string& commit,
                                                           const std::string& resolved_ref, const RunContext& ctx);

}
