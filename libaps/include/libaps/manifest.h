//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "error.h"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace aps {

    inline constexpr const char* MANIFEST_NAME = "aps.yaml";

    enum class AssetKind {
        AgentsMd,          // single file
        CursorRules,       // directory of rule files
        CursorSkillsRoot,  // directory of skill folders
        AgentSkill,        // directory of skill folders (agentskills.io layout)
        CursorHooks,       // hooks.json + scripts patched into a shared directory
        CompositeAgentsMd  // one file generated from several sources
    };

    std::optional<AssetKind> asset_kind_from_string(const std::string& value);
    std::string to_string(AssetKind kind);
    std::filesystem::path default_destination(AssetKind kind);

    // Kinds whose source is a single file and whose destination is one file.
    bool is_single_file_kind(AssetKind kind);
    // Kinds whose children must each carry a SKILL.md.
    bool is_skills_kind(AssetKind kind);

    struct GitSource {
        std::string repo;
        std::string ref = "auto";
        bool shallow = true;
        std::optional<std::string> path;
    };

    struct FilesystemSource {
        std::string root;
        bool symlink = true;
        std::optional<std::string> path;
    };

    using Source = std::variant<GitSource, FilesystemSource>;

    // Path inside the source, "." when none was given.
    std::string source_sub_path(const Source& source);
    // Provenance recorded in the lockfile ("filesystem:<root>" or the repo URL).
    std::string source_display_name(const Source& source);
    // Human readable location used for composite provenance, keeps $VARS unexpanded.
    std::string source_display_path(const Source& source);
    // One-line form for listings: "git: owner/repo @ ref -> path" or "fs: root/path (symlink)".
    std::string source_summary(const Source& source);

    struct Entry {
        std::string id;
        AssetKind kind = AssetKind::AgentsMd;
        std::optional<Source> source;
        std::vector<Source> sources; // composite entries only
        std::optional<std::string> dest;
        std::vector<std::string> include;

        bool is_composite() const {
            return kind == AssetKind::CompositeAgentsMd && !sources.empty();
        }

        // Destination relative to the manifest directory (override expanded, or the kind default).
        std::filesystem::path destination() const;
    };

    // Absolute destination for an entry, with trailing separators removed.
    std::filesystem::path destination_path(const Entry& entry, const std::filesystem::path& base_dir);

    struct Manifest {
        std::vector<Entry> entries;

        // Rejects duplicate ids and entries without the source field their kind needs.
        std::expected<void, Error> validate() const;

        // Informational: entries whose destinations are equal or nested.
        std::vector<std::string> detect_overlapping_destinations() const;

        const Entry* find(const std::string& id) const;
    };

    // Walks up from start_dir until a manifest is found, stopping at a
    // directory containing .git or at the filesystem root.
    std::expected<std::filesystem::path, Error> discover_manifest(const std::filesystem::path& start_dir);

} // namespace aps
