//
// Created by cv2 on 10/19/26.
//

#include "libaps/lockfile.h"
#include "libaps/fs_utils.h"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <set>

namespace aps {

    std::string LockedEntry::source_description() const {
        if (!is_composite()) {
            return source;
        }
        std::string out = "composite: [";
        for (size_t i = 0; i < composite_sources.size(); ++i) {
            if (i > 0) out += ", ";
            out += composite_sources[i];
        }
        return out + "]";
    }

    LockedEntry LockedEntry::for_filesystem(const std::string& source, const std::string& dest, const std::string& checksum,
                                            bool is_symlink, std::optional<std::string> target_path,
                                            std::vector<std::string> symlinked_items) {
        LockedEntry entry;
        entry.source = source;
        entry.dest = dest;
        entry.last_updated_at = fs::utc_timestamp_rfc3339();
        entry.checksum = checksum;
        entry.is_symlink = is_symlink;
        entry.target_path = std::move(target_path);
        entry.symlinked_items = std::move(symlinked_items);
        return entry;
    }

    LockedEntry LockedEntry::for_git(const std::string& source, const std::string& dest, const std::string& resolved_ref,
                                     const std::string& commit, const std::string& checksum) {
        LockedEntry entry;
        entry.source = source;
        entry.dest = dest;
        entry.resolved_ref = resolved_ref;
        entry.commit = commit;
        entry.last_updated_at = fs::utc_timestamp_rfc3339();
        entry.checksum = checksum;
        return entry;
    }

    LockedEntry LockedEntry::for_composite(std::vector<std::string> sources, const std::string& dest, const std::string& checksum) {
        LockedEntry entry;
        entry.composite_sources = std::move(sources);
        entry.dest = dest;
        entry.last_updated_at = fs::utc_timestamp_rfc3339();
        entry.checksum = checksum;
        return entry;
    }

    // --- YAML conversion ---

    static YAML::Node entry_to_yaml(const LockedEntry& entry) {
        YAML::Node node;
        if (entry.is_composite()) {
            for (const auto& part : entry.composite_sources) {
                node["source"]["composite"].push_back(part);
            }
        } else {
            node["source"] = entry.source;
        }
        node["dest"] = entry.dest;

        if (entry.resolved_ref) {
            node["resolved_ref"] = *entry.resolved_ref;
        }
        if (entry.commit) {
            node["commit"] = *entry.commit;
        }
        node["last_updated_at"] = entry.last_updated_at;
        node["checksum"] = entry.checksum;

        // Defaults are left out to keep the file small and diffs quiet.
        if (entry.is_symlink) {
            node["is_symlink"] = true;
        }
        if (entry.target_path) {
            node["target_path"] = *entry.target_path;
        }
        for (const auto& item : entry.symlinked_items) {
            node["symlinked_items"].push_back(item);
        }
        return node;
    }

    static std::optional<std::string> get_optional_string(const YAML::Node& node, const std::string& key) {
        if (node[key] && node[key].IsScalar()) {
            return node[key].as<std::string>();
        }
        return std::nullopt;
    }

    static std::expected<std::string, Error> get_required_string(const YAML::Node& node, const std::string& id, const std::string& key) {
        if (!node[key] || !node[key].IsScalar()) {
            return std::unexpected(Error{ErrorKind::LockfileInvalid, "Lockfile entry '" + id + "' is missing '" + key + "'"});
        }
        return node[key].as<std::string>();
    }

    // Older lockfiles flattened composite sources into "composite: [a, b]".
    static std::vector<std::string> parse_legacy_composite(const std::string& value) {
        std::vector<std::string> parts;
        const auto open = value.find('[');
        const auto close = value.rfind(']');
        if (open == std::string::npos || close == std::string::npos || close < open) {
            return parts;
        }
        const std::string inner = value.substr(open + 1, close - open - 1);
        size_t start = 0;
        while (start <= inner.size()) {
            auto comma = inner.find(", ", start);
            if (comma == std::string::npos) comma = inner.size();
            auto part = inner.substr(start, comma - start);
            const auto first = part.find_first_not_of(' ');
            const auto last = part.find_last_not_of(' ');
            if (first != std::string::npos) {
                parts.push_back(part.substr(first, last - first + 1));
            }
            start = comma + 2;
        }
        return parts;
    }

    static std::expected<LockedEntry, Error> entry_from_yaml(const std::string& id, const YAML::Node& node) {
        if (!node.IsMap()) {
            return std::unexpected(Error{ErrorKind::LockfileInvalid, "Lockfile entry '" + id + "' is not a mapping"});
        }

        LockedEntry entry;
        const auto& source = node["source"];
        if (!source) {
            return std::unexpected(Error{ErrorKind::LockfileInvalid, "Lockfile entry '" + id + "' is missing 'source'"});
        }
        if (source.IsMap()) {
            if (!source["composite"] || !source["composite"].IsSequence()) {
                return std::unexpected(Error{ErrorKind::LockfileInvalid, "Lockfile entry '" + id + "' has a source map without 'composite'"});
            }
            for (const auto& part : source["composite"]) {
                entry.composite_sources.push_back(part.as<std::string>());
            }
        } else {
            entry.source = source.as<std::string>();
            if (entry.source.rfind("composite:", 0) == 0) {
                entry.composite_sources = parse_legacy_composite(entry.source);
                if (!entry.composite_sources.empty()) entry.source.clear();
            }
        }

        auto dest = get_required_string(node, id, "dest");
        if (!dest) return std::unexpected(dest.error());
        entry.dest = *dest;

        auto checksum = get_required_string(node, id, "checksum");
        if (!checksum) return std::unexpected(checksum.error());
        entry.checksum = *checksum;

        entry.resolved_ref = get_optional_string(node, "resolved_ref");
        entry.commit = get_optional_string(node, "commit");
        entry.last_updated_at = get_optional_string(node, "last_updated_at").value_or("");
        entry.target_path = get_optional_string(node, "target_path");

        if (node["is_symlink"]) {
            entry.is_symlink = node["is_symlink"].as<bool>();
        }
        if (node["symlinked_items"] && node["symlinked_items"].IsSequence()) {
            for (const auto& item : node["symlinked_items"]) {
                entry.symlinked_items.push_back(item.as<std::string>());
            }
        }
        return entry;
    }

    // --- Lockfile ---

    Lockfile::Lockfile() : m_version(LOCKFILE_VERSION), m_aps_version(APS_VERSION_STRING) {}

    std::filesystem::path Lockfile::path_for_manifest(const std::filesystem::path& manifest_path) {
        if (manifest_path.has_parent_path()) {
            return manifest_path.parent_path() / LOCKFILE_NAME;
        }
        return std::filesystem::path(LOCKFILE_NAME);
    }

    std::expected<Lockfile, Error> Lockfile::parse_file(const std::filesystem::path& path) {
        YAML::Node root;
        try {
            root = YAML::LoadFile(path.string());
        } catch (const YAML::Exception& e) {
            return std::unexpected(Error{ErrorKind::LockfileInvalid, "Failed to parse lockfile " + path.string() + ": " + e.what()});
        }

        Lockfile lockfile;
        lockfile.m_aps_version.clear();
        if (root.IsNull()) {
            return lockfile;
        }
        if (!root.IsMap()) {
            return std::unexpected(Error{ErrorKind::LockfileInvalid, "Lockfile " + path.string() + " is not a mapping"});
        }

        try {
            if (root["version"]) {
                lockfile.m_version = root["version"].as<int>();
            }
            if (root["aps_version"]) {
                lockfile.m_aps_version = root["aps_version"].as<std::string>();
            }
            if (root["entries"] && root["entries"].IsMap()) {
                for (const auto& item : root["entries"]) {
                    const auto id = item.first.as<std::string>();
                    auto entry = entry_from_yaml(id, item.second);
                    if (!entry) return std::unexpected(entry.error());
                    lockfile.m_entries.emplace(id, std::move(*entry));
                }
            }
        } catch (const YAML::Exception& e) {
            return std::unexpected(Error{ErrorKind::LockfileInvalid, "Malformed lockfile " + path.string() + ": " + e.what()});
        }
        return lockfile;
    }

    std::expected<Lockfile, Error> Lockfile::load(const std::filesystem::path& path, const log::Logger& logger) {
        if (std::filesystem::exists(path)) {
            auto lockfile = parse_file(path);
            if (lockfile) {
                logger.debug("Loaded lockfile with " + std::to_string(lockfile->m_entries.size()) + " entries");
            }
            return lockfile;
        }

        const auto legacy_path = path.parent_path() / LEGACY_LOCKFILE_NAME;
        if (std::filesystem::exists(legacy_path)) {
            logger.info(std::string("Loading legacy lockfile '") + LEGACY_LOCKFILE_NAME + "' (will be migrated to '" + LOCKFILE_NAME + "' on next save)");
            return parse_file(legacy_path);
        }

        logger.debug("No lockfile at " + path.string() + ", starting empty");
        return Lockfile();
    }

    std::expected<void, Error> Lockfile::save(const std::filesystem::path& path, const log::Logger& logger) {
        m_aps_version = APS_VERSION_STRING;

        YAML::Node root;
        root["version"] = m_version;
        root["aps_version"] = m_aps_version;
        root["entries"] = YAML::Node(YAML::NodeType::Map);
        for (const auto& [id, entry] : m_entries) {
            root["entries"][id] = entry_to_yaml(entry);
        }

        YAML::Emitter emitter;
        emitter << root;
        if (!emitter.good()) {
            return std::unexpected(Error{ErrorKind::LockfileInvalid, "Failed to serialize lockfile: " + emitter.GetLastError()});
        }

        std::ofstream out(path, std::ios::trunc);
        if (!out.is_open()) {
            return std::unexpected(Error{ErrorKind::IOFailure, "Failed to open lockfile for writing: " + path.string()});
        }
        out << emitter.c_str() << '\n';
        out.close();
        if (out.fail()) {
            return std::unexpected(Error{ErrorKind::IOFailure, "Failed to write lockfile: " + path.string()});
        }
        logger.debug("Saved lockfile to " + path.string());

        const auto legacy_path = path.parent_path() / LEGACY_LOCKFILE_NAME;
        std::error_code ec;
        if (legacy_path != path && std::filesystem::exists(legacy_path, ec)) {
            if (std::filesystem::remove(legacy_path, ec)) {
                logger.info(std::string("Migrated lockfile: removed legacy file '") + LEGACY_LOCKFILE_NAME + "'");
            } else {
                logger.debug(std::string("Could not remove legacy lockfile '") + LEGACY_LOCKFILE_NAME + "': " + ec.message());
            }
        }
        return {};
    }

    void Lockfile::upsert(const std::string& id, LockedEntry entry) {
        m_entries[id] = std::move(entry);
    }

    const LockedEntry* Lockfile::find(const std::string& id) const {
        auto it = m_entries.find(id);
        return it == m_entries.end() ? nullptr : &it->second;
    }

    bool Lockfile::checksum_matches(const std::string& id, const std::string& checksum) const {
        const auto* entry = find(id);
        return entry && entry->checksum == checksum;
    }

    bool Lockfile::commit_matches(const std::string& id, const std::string& commit) const {
        const auto* entry = find(id);
        return entry && entry->commit && *entry->commit == commit;
    }

    std::vector<std::string> Lockfile::retain_entries(const std::vector<std::string>& ids_to_keep) {
        const std::set<std::string> keep(ids_to_keep.begin(), ids_to_keep.end());
        std::vector<std::string> removed;
        for (auto it = m_entries.begin(); it != m_entries.end();) {
            if (keep.count(it->first) == 0) {
                removed.push_back(it->first);
                it = m_entries.erase(it);
            } else {
                ++it;
            }
        }
        return removed;
    }

}
