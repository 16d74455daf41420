//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "error.h"
#include "logging.h"
#include "manifest.h"

#include <expected>
#include <filesystem>
#include <string>

namespace aps {

    inline constexpr const char* GITIGNORE_BACKUP_ENTRY = ".aps-backups/";

    // A starter manifest holding one example agents_md entry.
    Manifest default_manifest();

    // YAML text in the layout ManifestParser reads. Defaults are left out.
    std::expected<std::string, Error> emit_manifest(const Manifest& manifest);

    /**
     * @brief Writes default_manifest() to manifest_path and adds the backup
     * directory to the .gitignore next to it.
     * Refuses (ManifestInvalid) when a manifest already exists at that path.
     */
    std::expected<void, Error> init_manifest(const std::filesystem::path& manifest_path, const log::Logger& logger);

    // Appends GITIGNORE_BACKUP_ENTRY to dir/.gitignore unless a line already
    // matches it. Returns true if the file was changed.
    std::expected<bool, Error> update_gitignore(const std::filesystem::path& dir, const log::Logger& logger);

}
