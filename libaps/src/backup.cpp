//
// Created by cv2 on 10/19/26.
//

#include "libaps/backup.h"
#include "libaps/fs_utils.h"

#include <algorithm>

namespace aps {

    std::string backup_name_for(const std::filesystem::path& base_dir,
                                const std::filesystem::path& path,
                                const std::string& timestamp) {
        const auto base = fs::strip_trailing_separators(base_dir.lexically_normal());
        const auto target = fs::strip_trailing_separators(path.lexically_normal());

        std::string relative = target.string();
        if (fs::is_within(target, base) && target != base) {
            relative = target.lexically_relative(base).string();
        }
        std::replace(relative.begin(), relative.end(), '/', '-');

        return relative + "-" + timestamp;
    }

    std::expected<std::filesystem::path, Error> create_backup(const std::filesystem::path& base_dir,
                                                              const std::filesystem::path& path,
                                                              const log::Logger& logger) {
        const auto backup_root = base_dir / BACKUP_DIR;

        std::error_code ec;
        std::filesystem::create_directories(backup_root, ec);
        if (ec) {
            return std::unexpected(io_error("Failed to create backup directory " + backup_root.string(), ec));
        }

        const auto backup_path = backup_root / backup_name_for(base_dir, path, fs::local_timestamp(BACKUP_TIMESTAMP_FORMAT));

        try {
            // Same path, same minute: last write wins.
            fs::remove_path(backup_path);
            fs::copy_tree(path, backup_path, false);
        } catch (const SyncException& e) {
            return std::unexpected(Error{ErrorKind::IOFailure, "Failed to back up " + path.string() + ": " + e.what()});
        } catch (const std::filesystem::filesystem_error& e) {
            return std::unexpected(Error{ErrorKind::IOFailure, "Failed to back up " + path.string() + ": " + e.what()});
        }

        logger.info("Backed up " + path.string() + " to " + backup_path.string());
        return backup_path;
    }

    bool has_conflict(const std::filesystem::path& dest) {
        std::error_code ec;
        const auto st = std::filesystem::symlink_status(dest, ec);
        if (!std::filesystem::exists(st)) {
            return false;
        }

        // Links are what a previous sync left behind, replacing them loses nothing.
        if (std::filesystem::is_symlink(st)) {
            return false;
        }

        if (std::filesystem::is_regular_file(st)) {
            return true;
        }

        if (std::filesystem::is_directory(st)) {
            if (fs::is_symlink_only_dir(dest)) {
                return false;
            }
            return !std::filesystem::is_empty(dest, ec) && !ec;
        }

        return false;
    }

}
