//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "error.h"
#include "logging.h"

#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#ifndef APS_VERSION_STRING
#define APS_VERSION_STRING "0.1.0"
#endif

namespace aps {

    inline constexpr const char* LOCKFILE_NAME = "aps.lock.yaml";
    inline constexpr const char* LEGACY_LOCKFILE_NAME = "aps.manifest.lock";
    inline constexpr int LOCKFILE_VERSION = 1;

    struct LockedEntry {
        // Provenance: repo URL or "filesystem:<root>". Unused for composite entries.
        std::string source;
        // Display paths of every part, only for composite entries.
        std::vector<std::string> composite_sources;
        std::string dest;
        std::optional<std::string> resolved_ref;
        std::optional<std::string> commit;
        std::string last_updated_at; // RFC 3339, UTC
        std::string checksum;
        bool is_symlink = false;
        std::optional<std::string> target_path;
        // Absolute source paths that were linked one by one into dest.
        std::vector<std::string> symlinked_items;

        bool is_composite() const { return !composite_sources.empty(); }
        std::string source_description() const;

        static LockedEntry for_filesystem(const std::string& source, const std::string& dest, const std::string& checksum,
                                          bool is_symlink, std::optional<std::string> target_path,
                                          std::vector<std::string> symlinked_items);
        static LockedEntry for_git(const std::string& source, const std::string& dest, const std::string& resolved_ref,
                                   const std::string& commit, const std::string& checksum);
        static LockedEntry for_composite(std::vector<std::string> sources, const std::string& dest, const std::string& checksum);
    };

    /**
     * @brief The persisted record of what was last installed for each entry id.
     * Loaded once at the start of a run, changed in memory and saved once at the end.
     */
    class Lockfile {
    public:
        Lockfile();

        /**
         * @brief Reads a lockfile. Falls back to the legacy filename in the same
         * directory. If neither exists an empty lockfile is returned.
         * A file that exists but cannot be parsed is a LockfileInvalid error.
         */
        static std::expected<Lockfile, Error> load(const std::filesystem::path& path, const log::Logger& logger);

        // Writes the lockfile stamped with the current tool version and removes a legacy file beside it.
        std::expected<void, Error> save(const std::filesystem::path& path, const log::Logger& logger);

        static std::filesystem::path path_for_manifest(const std::filesystem::path& manifest_path);

        void upsert(const std::string& id, LockedEntry entry);
        const LockedEntry* find(const std::string& id) const;
        bool checksum_matches(const std::string& id, const std::string& checksum) const;
        bool commit_matches(const std::string& id, const std::string& commit) const;

        // Drops every entry whose id is not listed. Returns the removed ids.
        std::vector<std::string> retain_entries(const std::vector<std::string>& ids_to_keep);

        const std::map<std::string, LockedEntry>& entries() const { return m_entries; }
        int version() const { return m_version; }
        const std::string& aps_version() const { return m_aps_version; }

    private:
        static std::expected<Lockfile, Error> parse_file(const std::filesystem::path& path);

        int m_version;
        std::string m_aps_version;
        std::map<std::string, LockedEntry> m_entries;
    };

}
