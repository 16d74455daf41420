//
// Created by cv2 on 10/19/26.
//

#include "libaps/manifest.h"
#include "libaps/fs_utils.h"

#include <set>

namespace aps {

    std::optional<AssetKind> asset_kind_from_string(const std::string& value) {
        if (value == "agents_md") return AssetKind::AgentsMd;
        if (value == "cursor_rules") return AssetKind::CursorRules;
        if (value == "cursor_skills_root") return AssetKind::CursorSkillsRoot;
        if (value == "agent_skill") return AssetKind::AgentSkill;
        if (value == "cursor_hooks") return AssetKind::CursorHooks;
        if (value == "composite_agents_md") return AssetKind::CompositeAgentsMd;
        return std::nullopt;
    }

    std::string to_string(AssetKind kind) {
        switch (kind) {
            case AssetKind::AgentsMd: return "agents_md";
            case AssetKind::CursorRules: return "cursor_rules";
            case AssetKind::CursorSkillsRoot: return "cursor_skills_root";
            case AssetKind::AgentSkill: return "agent_skill";
            case AssetKind::CursorHooks: return "cursor_hooks";
            case AssetKind::CompositeAgentsMd: return "composite_agents_md";
        }
        return "unknown";
    }

    std::filesystem::path default_destination(AssetKind kind) {
        switch (kind) {
            case AssetKind::AgentsMd: return "AGENTS.md";
            case AssetKind::CursorRules: return ".cursor/rules";
            case AssetKind::CursorSkillsRoot: return ".cursor/skills";
            case AssetKind::AgentSkill: return ".claude/skills";
            case AssetKind::CursorHooks: return ".cursor";
            case AssetKind::CompositeAgentsMd: return "AGENTS.md";
        }
        return "";
    }

    bool is_single_file_kind(AssetKind kind) {
        return kind == AssetKind::AgentsMd || kind == AssetKind::CompositeAgentsMd;
    }

    bool is_skills_kind(AssetKind kind) {
        return kind == AssetKind::CursorSkillsRoot || kind == AssetKind::AgentSkill;
    }

    std::string source_sub_path(const Source& source) {
        const auto& path = std::visit([](const auto& s) -> const std::optional<std::string>& { return s.path; }, source);
        return path ? *path : ".";
    }

    std::string source_display_name(const Source& source) {
        if (const auto* git = std::get_if<GitSource>(&source)) {
            return git->repo;
        }
        return "filesystem:" + std::get<FilesystemSource>(source).root;
    }

    std::string source_display_path(const Source& source) {
        if (const auto* git = std::get_if<GitSource>(&source)) {
            return git->path ? git->repo + ":" + *git->path : git->repo;
        }
        const auto& fs_source = std::get<FilesystemSource>(source);
        return fs_source.path ? fs_source.root + "/" + *fs_source.path : fs_source.root;
    }

    std::string source_summary(const Source& source) {
        if (const auto* git = std::get_if<GitSource>(&source)) {
            std::string repo = git->repo;
            const std::string github = "https://github.com/";
            if (repo.size() > 4 && repo.ends_with(".git")) repo.resize(repo.size() - 4);
            if (repo.starts_with(github)) repo = repo.substr(github.size());

            std::string out = "git: " + repo;
            if (git->ref != "auto") out += " @ " + git->ref;
            if (git->path) out += " -> " + *git->path;
            return out;
        }
        const auto& fs_source = std::get<FilesystemSource>(source);
        return "fs: " + source_display_path(source) + (fs_source.symlink ? " (symlink)" : "");
    }

    std::filesystem::path Entry::destination() const {
        if (dest) {
            return fs::expand_path(*dest);
        }
        return default_destination(kind);
    }

    std::filesystem::path destination_path(const Entry& entry, const std::filesystem::path& base_dir) {
        return fs::strip_trailing_separators(base_dir / entry.destination());
    }

    std::expected<void, Error> Manifest::validate() const {
        std::set<std::string> seen;
        for (const auto& entry : entries) {
            if (entry.id.empty()) {
                return std::unexpected(Error{ErrorKind::ManifestInvalid, "Entry without an id"});
            }
            if (!seen.insert(entry.id).second) {
                return std::unexpected(Error{ErrorKind::ManifestInvalid, "Duplicate entry id: " + entry.id});
            }
            if (entry.kind == AssetKind::CompositeAgentsMd) {
                if (entry.sources.empty()) {
                    return std::unexpected(Error{ErrorKind::ManifestInvalid, "Entry '" + entry.id + "' of kind composite_agents_md requires 'sources'"});
                }
            } else if (!entry.source) {
                return std::unexpected(Error{ErrorKind::ManifestInvalid, "Entry '" + entry.id + "' requires a 'source'"});
            }
        }
        return {};
    }

    std::vector<std::string> Manifest::detect_overlapping_destinations() const {
        std::vector<std::string> warnings;
        for (size_t i = 0; i < entries.size(); ++i) {
            const auto a = entries[i].destination().lexically_normal();
            for (size_t j = i + 1; j < entries.size(); ++j) {
                const auto b = entries[j].destination().lexically_normal();
                if (fs::is_within(a, b) || fs::is_within(b, a)) {
                    warnings.push_back("Entries '" + entries[i].id + "' (" + a.string() + ") and '" + entries[j].id + "' (" +
                                       b.string() + ") have overlapping destinations");
                }
            }
        }
        return warnings;
    }

    const Entry* Manifest::find(const std::string& id) const {
        for (const auto& entry : entries) {
            if (entry.id == id) return &entry;
        }
        return nullptr;
    }

    std::expected<std::filesystem::path, Error> discover_manifest(const std::filesystem::path& start_dir) {
        auto current = std::filesystem::absolute(start_dir).lexically_normal();
        current = fs::strip_trailing_separators(current);

        while (true) {
            const auto candidate = current / MANIFEST_NAME;
            if (std::filesystem::exists(candidate)) {
                return candidate;
            }
            // The repository root ends the search.
            if (std::filesystem::exists(current / ".git")) {
                break;
            }
            if (!current.has_parent_path() || current.parent_path() == current) {
                break;
            }
            current = current.parent_path();
        }

        return std::unexpected(Error{ErrorKind::ManifestInvalid,
                                     std::string("No ") + MANIFEST_NAME + " found in " + start_dir.string() + " or its parents"});
    }

}
