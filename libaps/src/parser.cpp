//
// Created by cv2 on 10/19/26.
//

#include "libaps/parser.h"

#include <yaml-cpp/yaml.h>

namespace aps {

    static Error invalid(const std::string& message) {
        return Error{ErrorKind::ManifestInvalid, message};
    }

    static std::optional<std::string> get_optional_scalar(const YAML::Node& node, const std::string& key) {
        if (node[key] && node[key].IsScalar()) {
            return node[key].as<std::string>();
        }
        return std::nullopt;
    }

    static std::expected<std::string, Error> get_required_scalar(const YAML::Node& node, const std::string& key,
                                                                 const std::string& context) {
        if (!node[key] || !node[key].IsScalar()) {
            return std::unexpected(invalid(context + ": missing required field '" + key + "'"));
        }
        return node[key].as<std::string>();
    }

    static std::vector<std::string> get_optional_sequence(const YAML::Node& node, const std::string& key) {
        std::vector<std::string> result;
        if (node[key] && node[key].IsSequence()) {
            for (const auto& item : node[key]) {
                result.push_back(item.as<std::string>());
            }
        }
        return result;
    }

    static std::expected<Source, Error> parse_source_node(const YAML::Node& node, const std::string& context) {
        if (!node.IsMap()) {
            return std::unexpected(invalid(context + ": source must be a mapping"));
        }

        auto type = get_required_scalar(node, "type", context);
        if (!type) return std::unexpected(type.error());

        if (*type == "git") {
            GitSource git;
            // "url" is accepted as an alias of "repo".
            auto repo = get_optional_scalar(node, "repo");
            if (!repo) repo = get_optional_scalar(node, "url");
            if (!repo) {
                return std::unexpected(invalid(context + ": git source requires 'repo'"));
            }
            git.repo = *repo;
            git.ref = get_optional_scalar(node, "ref").value_or("auto");
            if (node["shallow"]) {
                git.shallow = node["shallow"].as<bool>();
            }
            git.path = get_optional_scalar(node, "path");
            return Source{git};
        }

        if (*type == "filesystem") {
            FilesystemSource fs_source;
            auto root = get_required_scalar(node, "root", context);
            if (!root) return std::unexpected(root.error());
            fs_source.root = *root;
            if (node["symlink"]) {
                fs_source.symlink = node["symlink"].as<bool>();
            }
            fs_source.path = get_optional_scalar(node, "path");
            return Source{fs_source};
        }

        return std::unexpected(invalid(context + ": unknown source type '" + *type + "'"));
    }

    static std::expected<Entry, Error> parse_entry_node(const YAML::Node& node, size_t index) {
        const std::string position = "entry #" + std::to_string(index + 1);
        if (!node.IsMap()) {
            return std::unexpected(invalid(position + " is not a mapping"));
        }

        Entry entry;
        auto id = get_required_scalar(node, "id", position);
        if (!id) return std::unexpected(id.error());
        entry.id = *id;
        const std::string context = "entry '" + entry.id + "'";

        auto kind_str = get_required_scalar(node, "kind", context);
        if (!kind_str) return std::unexpected(kind_str.error());
        auto kind = asset_kind_from_string(*kind_str);
        if (!kind) {
            return std::unexpected(invalid(context + ": unknown kind '" + *kind_str + "'"));
        }
        entry.kind = *kind;

        if (node["source"]) {
            auto source = parse_source_node(node["source"], context);
            if (!source) return std::unexpected(source.error());
            entry.source = std::move(*source);
        }

        if (node["sources"]) {
            if (!node["sources"].IsSequence()) {
                return std::unexpected(invalid(context + ": 'sources' must be a list"));
            }
            for (const auto& item : node["sources"]) {
                auto source = parse_source_node(item, context);
                if (!source) return std::unexpected(source.error());
                entry.sources.push_back(std::move(*source));
            }
        }

        entry.dest = get_optional_scalar(node, "dest");
        entry.include = get_optional_sequence(node, "include");
        return entry;
    }

    static std::expected<Manifest, Error> parse_manifest_node(const YAML::Node& root) {
        Manifest manifest;
        if (root.IsNull()) {
            return manifest;
        }
        if (!root.IsMap()) {
            return std::unexpected(invalid("Manifest must be a mapping with an 'entries' list"));
        }
        if (!root["entries"]) {
            return manifest;
        }
        if (!root["entries"].IsSequence()) {
            return std::unexpected(invalid("'entries' must be a list"));
        }

        size_t index = 0;
        for (const auto& node : root["entries"]) {
            auto entry = parse_entry_node(node, index++);
            if (!entry) return std::unexpected(entry.error());
            manifest.entries.push_back(std::move(*entry));
        }
        return manifest;
    }

    std::expected<Manifest, Error> ManifestParser::parse(const std::filesystem::path& file_path) {
        if (!std::filesystem::exists(file_path)) {
            return std::unexpected(invalid("Manifest not found: " + file_path.string()));
        }
        try {
            YAML::Node root = YAML::LoadFile(file_path.string());
            return parse_manifest_node(root);
        } catch (const YAML::Exception& e) {
            return std::unexpected(invalid("Failed to parse manifest " + file_path.string() + ": " + e.what()));
        }
    }

    std::expected<Manifest, Error> ManifestParser::parse_from_string(const std::string& content) {
        try {
            YAML::Node root = YAML::Load(content);
            return parse_manifest_node(root);
        } catch (const YAML::Exception& e) {
            return std::unexpected(invalid(std::string("Failed to parse manifest: ") + e.what()));
        }
    }

} // namespace aps
