//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "error.h"
#include "logging.h"

#include <expected>
#include <filesystem>
#include <string>

namespace aps {

    inline constexpr const char* BACKUP_DIR = ".aps-backups";
    inline constexpr const char* BACKUP_TIMESTAMP_FORMAT = "%Y-%m-%d-%H%M";

    /**
     * @brief Copies the file or directory at `path` into `<base_dir>/.aps-backups`.
     * The backup is named after the path relative to base_dir with separators
     * flattened to '-', plus a minute-granularity local timestamp. A backup of
     * the same path within the same minute replaces the previous one.
     * @return The path of the created backup.
     */
    std::expected<std::filesystem::path, Error> create_backup(const std::filesystem::path& base_dir,
                                                              const std::filesystem::path& path,
                                                              const log::Logger& logger);

    // "<flattened relative path>-<timestamp>"
    std::string backup_name_for(const std::filesystem::path& base_dir,
                                const std::filesystem::path& path,
                                const std::string& timestamp);

    /**
     * @brief True if the destination holds content that must not be overwritten
     * silently: a regular file, or a non-empty directory that contains anything
     * other than symlinks. Absent paths and symlinks are never conflicts.
     */
    bool has_conflict(const std::filesystem::path& dest);

}
