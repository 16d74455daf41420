//
// Created by cv2 on 10/19/26.
//

#include "libaps/init.h"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>
#include <variant>

namespace aps {

    Manifest default_manifest() {
        FilesystemSource source;
        source.root = "../shared-assets";
        source.path = "AGENTS.md";

        Entry entry;
        entry.id = "my-agents";
        entry.kind = AssetKind::AgentsMd;
        entry.source = Source{source};

        Manifest manifest;
        manifest.entries.push_back(std::move(entry));
        return manifest;
    }

    static YAML::Node source_to_yaml(const Source& source) {
        YAML::Node node;
        if (const auto* git = std::get_if<GitSource>(&source)) {
            node["type"] = "git";
            node["repo"] = git->repo;
            node["ref"] = git->ref;
            if (!git->shallow) {
                node["shallow"] = false;
            }
            if (git->path) {
                node["path"] = *git->path;
            }
            return node;
        }

        const auto& fs_source = std::get<FilesystemSource>(source);
        node["type"] = "filesystem";
        node["root"] = fs_source.root;
        node["symlink"] = fs_source.symlink;
        if (fs_source.path) {
            node["path"] = *fs_source.path;
        }
        return node;
    }

    static YAML::Node entry_to_yaml(const Entry& entry) {
        YAML::Node node;
        node["id"] = entry.id;
        node["kind"] = to_string(entry.kind);
        if (entry.source) {
            node["source"] = source_to_yaml(*entry.source);
        }
        for (const auto& source : entry.sources) {
            node["sources"].push_back(source_to_yaml(source));
        }
        if (entry.dest) {
            node["dest"] = *entry.dest;
        }
        for (const auto& prefix : entry.include) {
            node["include"].push_back(prefix);
        }
        return node;
    }

    std::expected<std::string, Error> emit_manifest(const Manifest& manifest) {
        YAML::Node root;
        root["entries"] = YAML::Node(YAML::NodeType::Sequence);
        for (const auto& entry : manifest.entries) {
            root["entries"].push_back(entry_to_yaml(entry));
        }

        YAML::Emitter emitter;
        emitter << root;
        if (!emitter.good()) {
            return std::unexpected(Error{ErrorKind::ManifestInvalid, "Failed to serialize manifest: " + emitter.GetLastError()});
        }
        return std::string(emitter.c_str()) + "\n";
    }

    std::expected<void, Error> init_manifest(const std::filesystem::path& manifest_path, const log::Logger& logger) {
        std::error_code ec;
        if (std::filesystem::exists(std::filesystem::symlink_status(manifest_path, ec))) {
            return std::unexpected(Error{ErrorKind::ManifestInvalid, "Manifest already exists at " + manifest_path.string()});
        }

        auto content = emit_manifest(default_manifest());
        if (!content) return std::unexpected(content.error());

        std::ofstream out(manifest_path, std::ios::trunc);
        if (!out.is_open()) {
            return std::unexpected(Error{ErrorKind::IOFailure, "Failed to open manifest for writing: " + manifest_path.string()});
        }
        out << *content;
        out.close();
        if (out.fail()) {
            return std::unexpected(Error{ErrorKind::IOFailure, "Failed to write manifest: " + manifest_path.string()});
        }
        logger.ok("Created manifest at " + manifest_path.string());

        auto dir = manifest_path.parent_path();
        if (dir.empty()) dir = ".";
        auto updated = update_gitignore(dir, logger);
        if (!updated) return std::unexpected(updated.error());
        return {};
    }

    std::expected<bool, Error> update_gitignore(const std::filesystem::path& dir, const log::Logger& logger) {
        const auto gitignore_path = dir / ".gitignore";

        std::string existing;
        if (std::filesystem::exists(gitignore_path)) {
            std::ifstream in(gitignore_path);
            if (!in.is_open()) {
                return std::unexpected(Error{ErrorKind::IOFailure, "Failed to read " + gitignore_path.string()});
            }
            std::stringstream buffer;
            buffer << in.rdbuf();
            existing = buffer.str();
        }

        std::istringstream lines(existing);
        std::string line;
        while (std::getline(lines, line)) {
            const auto first = line.find_first_not_of(" \t\r");
            const auto last = line.find_last_not_of(" \t\r");
            if (first != std::string::npos && line.substr(first, last - first + 1) == GITIGNORE_BACKUP_ENTRY) {
                logger.debug(".gitignore already contains " + std::string(GITIGNORE_BACKUP_ENTRY));
                return false;
            }
        }

        std::ofstream out(gitignore_path, std::ios::app);
        if (!out.is_open()) {
            return std::unexpected(Error{ErrorKind::IOFailure, "Failed to open " + gitignore_path.string()});
        }
        if (!existing.empty() && existing.back() != '\n') {
            out << '\n';
        }
        out << "\n# APS (Agentic Prompt Sync)\n" << GITIGNORE_BACKUP_ENTRY << '\n';
        out.close();
        if (out.fail()) {
            return std::unexpected(Error{ErrorKind::IOFailure, "Failed to write " + gitignore_path.string()});
        }
        logger.ok("Added " + std::string(GITIGNORE_BACKUP_ENTRY) + " to .gitignore");
        return true;
    }

}
