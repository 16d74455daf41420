//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "context.h"
#include "error.h"
#include "lockfile.h"
#include "manifest.h"
#include "source.h"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace aps {

    struct UpgradeInfo {
        std::string current_commit;
        std::string available_commit;
    };

    struct InstallResult {
        std::string id;
        bool installed = false;
        bool skipped_no_change = false;
        bool backed_up = false;
        // Present only after a real (non dry-run) install.
        std::optional<LockedEntry> locked_entry;
        std::vector<std::string> warnings;
        std::filesystem::path dest_path;
        bool was_symlink = false;
        std::optional<UpgradeInfo> upgrade_available;
    };

    /**
     * @brief Installs manifest entries one at a time.
     * The installer only reads the prior lockfile. Callers persist the
     * returned locked entries once the whole batch has been processed.
     */
    class Installer {
    public:
        Installer(const RunContext& ctx, const Lockfile& prior, InstallOptions options);

        std::expected<InstallResult, Error> install(const Entry& entry) const;

        /**
         * @brief Kind-specific checks on a resolved source directory.
         * @return Warnings for every violation, or StructuralValidationFailed
         * for the first one when running strict.
         */
        std::expected<std::vector<std::string>, Error> validate_structure(const Entry& entry,
                                                                          const std::filesystem::path& source) const;

    private:
        using GitOutcome = std::variant<InstallResult, ResolvedSource>;

        std::expected<InstallResult, Error> install_composite(const Entry& entry) const;

        // Either a finished result (nothing to fetch) or a freshly resolved clone.
        std::expected<GitOutcome, Error> resolve_git(const Entry& entry, const GitSource& source,
                                                     const std::filesystem::path& dest) const;

        std::expected<InstallResult, Error> install_resolved(const Entry& entry, ResolvedSource resolved,
                                                             const std::filesystem::path& dest) const;

        bool destination_is_current(const Entry& entry, const LockedEntry& locked, const ResolvedSource& resolved,
                                    const std::filesystem::path& dest) const;

        std::vector<std::filesystem::path> conflicting_paths(const Entry& entry, const ResolvedSource& resolved,
                                                             const std::filesystem::path& dest) const;

        // Asks for (or checks permission for) an overwrite, then backs up each path.
        std::expected<bool, Error> resolve_conflicts(const Entry& entry, const std::vector<std::filesystem::path>& conflicts,
                                                     const std::filesystem::path& dest) const;

        std::string lock_dest(const std::filesystem::path& dest) const;
        InstallResult skipped(const Entry& entry, const std::filesystem::path& dest, bool was_symlink) const;

        const RunContext& m_ctx;
        const Lockfile& m_prior;
        InstallOptions m_options;
    };

}
