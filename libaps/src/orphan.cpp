//
// Created by cv2 on 10/19/26.
//

#include "libaps/orphan.h"
#include "libaps/backup.h"
#include "libaps/fs_utils.h"

namespace aps {

    bool paths_overlap(const std::filesystem::path& a, const std::filesystem::path& b) {
        const auto first = fs::normalize_for_comparison(a);
        const auto second = fs::normalize_for_comparison(b);
        return fs::is_within(first, second) || fs::is_within(second, first);
    }

    std::vector<OrphanCandidate> detect_orphans(const std::vector<const Entry*>& entries, const Lockfile& lockfile,
                                                const std::filesystem::path& base_dir, const log::Logger& logger) {
        std::vector<OrphanCandidate> orphans;

        for (const auto* entry : entries) {
            const auto* locked = lockfile.find(entry->id);
            if (!locked) {
                continue;
            }

            const auto previous = fs::strip_trailing_separators(base_dir / locked->dest);
            const auto current = destination_path(*entry, base_dir);

            const auto previous_normal = fs::normalize_for_comparison(previous);
            const auto current_normal = fs::normalize_for_comparison(current);
            logger.debug("Entry " + entry->id + ": previous=" + previous_normal.string() + ", current=" + current_normal.string());

            if (previous_normal == current_normal) {
                continue;
            }
            if (!fs::exists_or_symlink(previous)) {
                logger.debug("Previous destination " + previous.string() + " of " + entry->id + " is gone, nothing to clean");
                continue;
            }
            // Never remove something that is, or holds, the live destination.
            if (paths_overlap(previous, current)) {
                logger.debug("Skipping orphan for " + entry->id + ": " + previous.string() + " and " + current.string() + " overlap");
                continue;
            }

            logger.info("Detected orphan for entry " + entry->id + ": " + previous.string() + " (now " + current.string() + ")");
            orphans.push_back(OrphanCandidate{entry->id, previous, current});
        }

        return orphans;
    }

    std::expected<void, Error> remove_orphan(const OrphanCandidate& orphan, const std::filesystem::path& base_dir,
                                             const log::Logger& logger) {
        const auto& path = orphan.previous_dest;

        std::error_code ec;
        const auto st = std::filesystem::symlink_status(path, ec);
        if (!std::filesystem::exists(st)) {
            return {};
        }

        const bool disposable = std::filesystem::is_symlink(st) ||
                                (std::filesystem::is_directory(st) && fs::is_symlink_only_dir(path));
        if (!disposable) {
            auto backup = create_backup(base_dir, path, logger);
            if (!backup) return std::unexpected(backup.error());
        }

        try {
            fs::remove_path(path);
        } catch (const SyncException& e) {
            return std::unexpected(Error{e.get_error(), e.what()});
        }
        logger.debug("Removed " + path.string());
        return {};
    }

    std::size_t cleanup_orphans(const std::vector<OrphanCandidate>& orphans, const InstallOptions& options,
                                const RunContext& ctx) {
        if (orphans.empty()) {
            return 0;
        }

        ctx.logger.info("Detected " + std::to_string(orphans.size()) + " orphaned path(s) from destination changes:");
        for (const auto& orphan : orphans) {
            ctx.logger.info("  " + orphan.entry_id + ": was " + orphan.previous_dest.string() + ", now " + orphan.current_dest.string());
        }

        if (options.dry_run) {
            ctx.logger.info("[dry-run] Would delete " + std::to_string(orphans.size()) + " orphaned path(s)");
            return 0;
        }

        if (!options.yes) {
            if (!ctx.interactive) {
                ctx.logger.warn("Cannot delete orphaned paths without confirmation. Run with --yes to delete them, or run interactively to confirm.");
                return 0;
            }
            if (!ctx.ask("Delete " + std::to_string(orphans.size()) + " orphaned path(s)?")) {
                ctx.logger.info("Keeping orphaned paths");
                return 0;
            }
        }

        std::size_t removed = 0;
        for (const auto& orphan : orphans) {
            auto result = remove_orphan(orphan, ctx.base_dir, ctx.logger);
            if (!result) {
                ctx.logger.warn("Failed to delete " + orphan.previous_dest.string() + ": " + result.error().message);
                continue;
            }
            ctx.logger.ok("Deleted orphaned path: " + orphan.previous_dest.string());
            ++removed;
        }
        return removed;
    }

}
