//
// Created by cv2 on 10/19/26.
//

#include "libaps/sync.h"
#include "libaps/lockfile.h"

#include <algorithm>

namespace aps {

    SyncStatus status_of(const InstallResult& result) {
        if (!result.warnings.empty()) return SyncStatus::Warning;
        if (result.skipped_no_change && result.upgrade_available) return SyncStatus::Upgradable;
        if (result.skipped_no_change) return SyncStatus::Current;
        if (result.was_symlink) return SyncStatus::Synced;
        return SyncStatus::Copied;
    }

    const char* to_string(SyncStatus status) {
        switch (status) {
            case SyncStatus::Synced: return "synced";
            case SyncStatus::Copied: return "copied";
            case SyncStatus::Current: return "current";
            case SyncStatus::Upgradable: return "upgradable";
            case SyncStatus::Warning: return "warning";
        }
        return "unknown";
    }

    static std::expected<std::vector<const Entry*>, Error> select_entries(const Manifest& manifest,
                                                                         const std::vector<std::string>& only) {
        for (const auto& id : only) {
            if (!manifest.find(id)) {
                return std::unexpected(Error{ErrorKind::EntryNotFound, "No entry with id '" + id + "' in the manifest"});
            }
        }

        std::vector<const Entry*> selected;
        for (const auto& entry : manifest.entries) {
            if (only.empty() || std::find(only.begin(), only.end(), entry.id) != only.end()) {
                selected.push_back(&entry);
            }
        }
        return selected;
    }

    std::expected<SyncReport, Error> run_sync(const Manifest& manifest, const std::filesystem::path& manifest_path,
                                              const SyncOptions& options, const RunContext& ctx) {
        auto valid = manifest.validate();
        if (!valid) return std::unexpected(valid.error());

        SyncReport report;
        report.overlap_warnings = manifest.detect_overlapping_destinations();
        for (const auto& warning : report.overlap_warnings) {
            ctx.logger.warn(warning);
        }

        auto selected = select_entries(manifest, options.only);
        if (!selected) return std::unexpected(selected.error());

        const auto lockfile_path = Lockfile::path_for_manifest(manifest_path);
        auto prior = Lockfile::load(lockfile_path, ctx.logger);
        if (!prior) return std::unexpected(prior.error());

        // Orphans are judged against the state before this run touches anything.
        report.orphans = detect_orphans(*selected, *prior, ctx.base_dir, ctx.logger);

        Lockfile next = *prior;
        const Installer installer(ctx, *prior, options.install);

        for (const auto* entry : *selected) {
            auto result = installer.install(*entry);
            if (!result) {
                const auto dest = destination_path(*entry, ctx.base_dir);
                ctx.logger.error("Entry '" + entry->id + "' (" + dest.string() + ") failed: " + result.error().message);
                report.failure = SyncFailure{entry->id, dest, result.error()};
                break;
            }
            if (result->locked_entry) {
                next.upsert(entry->id, *result->locked_entry);
            }
            report.results.push_back(std::move(*result));
        }

        if (!report.failure) {
            report.orphans_removed = cleanup_orphans(report.orphans, options.install, ctx);
        }

        if (options.install.dry_run) {
            return report;
        }

        // Stale ids are only pruned when every entry was looked at.
        if (!report.failure && options.only.empty()) {
            std::vector<std::string> ids;
            for (const auto& entry : manifest.entries) {
                ids.push_back(entry.id);
            }
            report.stale_removed = next.retain_entries(ids);
            if (!report.stale_removed.empty()) {
                ctx.logger.info("Removed " + std::to_string(report.stale_removed.size()) + " stale entries from lockfile");
            }
        }

        auto saved = next.save(lockfile_path, ctx.logger);
        if (!saved) return std::unexpected(saved.error());
        report.lockfile_saved = true;

        return report;
    }

}
