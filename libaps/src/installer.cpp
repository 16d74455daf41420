//
// Created by cv2 on 10/19/26.
//

#include "libaps/installer.h"
#include "libaps/backup.h"
#include "libaps/checksum.h"
#include "libaps/fs_utils.h"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace aps {

    static constexpr const char* SKILL_MARKER = "SKILL.md";
    static constexpr const char* HOOKS_CONFIG = "hooks.json";

    static std::expected<std::vector<std::filesystem::path>, Error> list_children(const std::filesystem::path& dir) {
        std::vector<std::filesystem::path> children;
        std::error_code ec;
        std::filesystem::directory_iterator it(dir, ec);
        for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
            children.push_back(it->path());
        }
        if (ec) {
            return std::unexpected(io_error("Failed to read directory " + dir.string(), ec));
        }
        std::sort(children.begin(), children.end());
        return children;
    }

    static bool matches_include(const std::filesystem::path& item, const std::vector<std::string>& include) {
        if (include.empty()) return true;
        const auto name = item.filename().string();
        return std::any_of(include.begin(), include.end(), [&](const std::string& prefix) {
            return name.rfind(prefix, 0) == 0;
        });
    }

    // Top-level entries of source whose names start with one of the prefixes, sorted.
    static std::expected<std::vector<std::filesystem::path>, Error> filter_by_prefix(const std::filesystem::path& source,
                                                                                    const std::vector<std::string>& include) {
        auto children = list_children(source);
        if (!children) return children;
        std::erase_if(*children, [&](const std::filesystem::path& child) { return !matches_include(child, include); });
        return children;
    }

    // True only for a symlink whose fully resolved target is the expected path.
    // A path that cannot be canonicalized does not match.
    static bool links_to(const std::filesystem::path& link, const std::filesystem::path& expected) {
        std::error_code ec;
        if (!std::filesystem::is_symlink(std::filesystem::symlink_status(link, ec))) {
            return false;
        }
        const auto actual = std::filesystem::canonical(link, ec);
        if (ec) return false;
        const auto wanted = std::filesystem::canonical(expected, ec);
        if (ec) return false;
        return actual == wanted;
    }

    static bool occupied_by_file(const std::filesystem::path& path) {
        std::error_code ec;
        return std::filesystem::is_regular_file(std::filesystem::symlink_status(path, ec));
    }

    // --- Materialization. Everything below throws SyncException. ---

    static std::vector<std::filesystem::path> children_or_throw(const std::filesystem::path& dir,
                                                                const std::vector<std::string>& include) {
        auto children = filter_by_prefix(dir, include);
        if (!children) {
            throw SyncException(children.error().kind, children.error().message);
        }
        return std::move(*children);
    }

    static void ensure_parent(const std::filesystem::path& dest) {
        const auto parent = dest.parent_path();
        if (parent.empty()) return;
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw SyncException(ErrorKind::IOFailure, "Failed to create directory " + parent.string() + ": " + ec.message());
        }
    }

    // A real directory at dir. A link or file in its place is removed, never written through.
    static void prepare_directory(const std::filesystem::path& dir) {
        std::error_code ec;
        const auto st = std::filesystem::symlink_status(dir, ec);
        if (std::filesystem::exists(st) && !std::filesystem::is_directory(st)) {
            fs::remove_path(dir);
        }
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw SyncException(ErrorKind::IOFailure, "Failed to create directory " + dir.string() + ": " + ec.message());
        }
    }

    static void create_symlink(const std::filesystem::path& source, const std::filesystem::path& dest) {
        const auto link = fs::strip_trailing_separators(dest);
        const auto target = fs::strip_trailing_separators(source);
        ensure_parent(link);
        fs::remove_path(link);

        std::error_code ec;
        std::filesystem::create_symlink(target, link, ec);
        if (ec) {
            throw SyncException(ErrorKind::IOFailure,
                                "Failed to create symlink " + link.string() + " -> " + target.string() + ": " + ec.message());
        }
    }

    // Links every file individually and creates real directories for the structure,
    // so several sources can contribute to one destination directory.
    static void symlink_directory_files(const std::filesystem::path& source, const std::filesystem::path& dest,
                                        std::vector<std::string>& linked) {
        prepare_directory(dest);
        for (const auto& child : children_or_throw(source, {})) {
            const auto target = dest / child.filename();
            std::error_code ec;
            if (std::filesystem::is_directory(child, ec)) {
                symlink_directory_files(child, target, linked);
            } else {
                aps::create_symlink(child, target);
                linked.push_back(child.string());
            }
        }
    }

    // Overwrites only what the source contains. Everything else in `to` is kept.
    static void merge_tree(const std::filesystem::path& from, const std::filesystem::path& to) {
        std::error_code ec;
        if (std::filesystem::is_directory(from, ec)) {
            prepare_directory(to);
            for (const auto& child : children_or_throw(from, {})) {
                merge_tree(child, to / child.filename());
            }
            return;
        }
        fs::remove_path(to);
        ensure_parent(to);
        fs::copy_tree(from, to, true);
    }

    static std::vector<std::string> materialize(const Entry& entry, const ResolvedSource& resolved,
                                                const std::filesystem::path& dest) {
        std::vector<std::string> linked;
        const auto& source = resolved.source_path;

        if (is_single_file_kind(entry.kind)) {
            if (resolved.use_symlink) {
                aps::create_symlink(source, dest);
                linked.push_back(source.string());
            } else {
                ensure_parent(dest);
                fs::remove_path(dest);
                fs::copy_tree(source, dest, true);
            }
            return linked;
        }

        if (resolved.use_symlink) {
            if (entry.include.empty()) {
                symlink_directory_files(source, dest, linked);
            } else {
                prepare_directory(dest);
                for (const auto& item : children_or_throw(source, entry.include)) {
                    aps::create_symlink(item, dest / item.filename());
                    linked.push_back(item.string());
                }
            }
            return linked;
        }

        if (entry.kind == AssetKind::CursorHooks) {
            prepare_directory(dest);
            for (const auto& item : children_or_throw(source, entry.include)) {
                merge_tree(item, dest / item.filename());
            }
            return linked;
        }

        // Wholesale copy, the destination is replaced.
        fs::remove_path(dest);
        if (entry.include.empty()) {
            ensure_parent(dest);
            fs::copy_tree(source, dest, true);
        } else {
            prepare_directory(dest);
            for (const auto& item : children_or_throw(source, entry.include)) {
                fs::copy_tree(item, dest / item.filename(), true);
            }
        }
        return linked;
    }

    static void write_text_file(const std::filesystem::path& dest, const std::string& content) {
        ensure_parent(dest);
        fs::remove_path(dest);

        std::ofstream out(dest, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw SyncException(ErrorKind::IOFailure, "Failed to open " + dest.string() + " for writing");
        }
        out << content;
        out.close();
        if (out.fail()) {
            throw SyncException(ErrorKind::IOFailure, "Failed to write " + dest.string());
        }
    }

    // --- Installer ---

    Installer::Installer(const RunContext& ctx, const Lockfile& prior, InstallOptions options)
        : m_ctx(ctx), m_prior(prior), m_options(options) {}

    InstallResult Installer::skipped(const Entry& entry, const std::filesystem::path& dest, bool was_symlink) const {
        InstallResult result;
        result.id = entry.id;
        result.skipped_no_change = true;
        result.dest_path = dest;
        result.was_symlink = was_symlink;
        return result;
    }

    std::string Installer::lock_dest(const std::filesystem::path& dest) const {
        const auto base = fs::strip_trailing_separators(m_ctx.base_dir.lexically_normal());
        const auto normal = fs::strip_trailing_separators(dest.lexically_normal());
        if (fs::is_within(normal, base) && normal != base) {
            return normal.lexically_relative(base).generic_string();
        }
        return normal.generic_string();
    }

    std::expected<InstallResult, Error> Installer::install(const Entry& entry) const {
        m_ctx.logger.info("Processing entry: " + entry.id);

        if (entry.kind == AssetKind::CompositeAgentsMd) {
            return install_composite(entry);
        }
        if (!entry.source) {
            return std::unexpected(Error{ErrorKind::SourceUnavailable, "Entry '" + entry.id + "' has no source"});
        }

        const auto dest = destination_path(entry, m_ctx.base_dir);
        m_ctx.logger.debug("Destination path: " + dest.string());

        if (const auto* git_source = std::get_if<GitSource>(&*entry.source)) {
            auto outcome = resolve_git(entry, *git_source, dest);
            if (!outcome) return std::unexpected(outcome.error());
            if (auto* done = std::get_if<InstallResult>(&*outcome)) {
                return std::move(*done);
            }
            return install_resolved(entry, std::move(std::get<ResolvedSource>(*outcome)), dest);
        }

        auto resolved = resolve(*entry.source, m_ctx);
        if (!resolved) return std::unexpected(resolved.error());
        return install_resolved(entry, std::move(*resolved), dest);
    }

    std::expected<Installer::GitOutcome, Error> Installer::resolve_git(const Entry& entry, const GitSource& source,
                                                                       const std::filesystem::path& dest) const {
        const auto* locked = m_prior.find(entry.id);
        // Only an install at the recorded destination can be reused.
        const bool dest_exists = locked && locked->dest == lock_dest(dest) && fs::exists_or_symlink(dest);

        // A locked commit is reproduced exactly unless an upgrade was asked for.
        if (!m_options.upgrade && locked && locked->commit) {
            if (dest_exists) {
                m_ctx.logger.info("Entry " + entry.id + " is locked at commit " + git::short_commit(*locked->commit) + ", skipping fetch");
                auto result = skipped(entry, dest, false);

                auto remote = git::remote_commit(source.repo, source.ref, m_ctx.logger);
                if (!remote) {
                    m_ctx.logger.debug("Could not check " + source.repo + " for updates: " + remote.error().message);
                } else if (*remote && **remote != *locked->commit) {
                    result.upgrade_available = UpgradeInfo{*locked->commit, **remote};
                }
                return GitOutcome{std::move(result)};
            }

            auto resolved = resolve_at_commit(source, *locked->commit, locked->resolved_ref.value_or(source.ref), m_ctx);
            if (!resolved) return std::unexpected(resolved.error());
            return GitOutcome{std::move(*resolved)};
        }

        auto remote = git::remote_commit(source.repo, source.ref, m_ctx.logger);
        if (!remote) {
            m_ctx.logger.debug("Remote query for " + source.repo + " failed: " + remote.error().message);
        } else if (*remote && locked && dest_exists && m_prior.commit_matches(entry.id, **remote)) {
            m_ctx.logger.info("Entry " + entry.id + " is up to date (commit " + git::short_commit(**remote) + ")");
            return GitOutcome{skipped(entry, dest, false)};
        }

        auto resolved = resolve(Source{source}, m_ctx);
        if (!resolved) return std::unexpected(resolved.error());
        return GitOutcome{std::move(*resolved)};
    }

    bool Installer::destination_is_current(const Entry& entry, const LockedEntry& locked, const ResolvedSource& resolved,
                                           const std::filesystem::path& dest) const {
        std::error_code ec;
        if (locked.dest != lock_dest(dest) || !std::filesystem::exists(dest, ec)) {
            return false;
        }
        if (locked.is_symlink != resolved.use_symlink) {
            return false;
        }
        if (!locked.is_symlink) {
            return true;
        }

        if (is_single_file_kind(entry.kind)) {
            return links_to(dest, resolved.source_path);
        }

        for (const auto& item : locked.symlinked_items) {
            const auto relative = std::filesystem::path(item).lexically_relative(resolved.source_path);
            if (relative.empty() || *relative.begin() == "..") {
                return false;
            }
            if (!links_to(dest / relative, item)) {
                m_ctx.logger.debug("Symlink " + (dest / relative).string() + " no longer points to " + item);
                return false;
            }
        }
        return true;
    }

    std::vector<std::filesystem::path> Installer::conflicting_paths(const Entry& entry, const ResolvedSource& resolved,
                                                                    const std::filesystem::path& dest) const {
        std::vector<std::filesystem::path> conflicts;

        if (entry.kind == AssetKind::CursorHooks) {
            // Shared directory: only the names this source brings can conflict.
            if (occupied_by_file(dest)) {
                conflicts.push_back(dest);
                return conflicts;
            }
            auto items = filter_by_prefix(resolved.source_path, entry.include);
            if (!items) {
                if (has_conflict(dest)) conflicts.push_back(dest);
                return conflicts;
            }
            for (const auto& item : *items) {
                const auto target = dest / item.filename();
                if (has_conflict(target)) conflicts.push_back(target);
            }
            return conflicts;
        }

        // Per-file links coexist with whatever else lives in the directory.
        if (!is_single_file_kind(entry.kind) && resolved.use_symlink) {
            if (occupied_by_file(dest)) conflicts.push_back(dest);
            return conflicts;
        }

        if (has_conflict(dest)) {
            conflicts.push_back(dest);
        }
        return conflicts;
    }

    std::expected<bool, Error> Installer::resolve_conflicts(const Entry& entry, const std::vector<std::filesystem::path>& conflicts,
                                                            const std::filesystem::path& dest) const {
        for (const auto& path : conflicts) {
            m_ctx.logger.info("Conflict detected at " + path.string());
        }

        if (m_options.dry_run) {
            for (const auto& path : conflicts) {
                m_ctx.logger.info("[dry-run] Would back up and overwrite: " + path.string());
            }
            return false;
        }

        if (!m_options.yes) {
            if (!m_ctx.interactive) {
                return std::unexpected(Error{ErrorKind::ConflictBlocked,
                                             dest.string() + " already contains content not managed by aps; re-run with --yes to back it up and overwrite it"});
            }
            if (!m_ctx.ask("Overwrite existing content at " + dest.string() + "?")) {
                m_ctx.logger.info("User declined to overwrite " + dest.string());
                return std::unexpected(Error{ErrorKind::UserCancelled, "Overwrite of " + dest.string() + " was declined"});
            }
        }

        for (const auto& path : conflicts) {
            auto backup = create_backup(m_ctx.base_dir, path, m_ctx.logger);
            if (!backup) return std::unexpected(backup.error());
        }
        return true;
    }

    std::expected<std::vector<std::string>, Error> Installer::validate_structure(const Entry& entry,
                                                                                 const std::filesystem::path& source) const {
        std::vector<std::string> warnings;
        std::optional<Error> failure;

        auto violation = [&](const std::string& message) {
            if (m_options.strict) {
                failure = Error{ErrorKind::StructuralValidationFailed, "Entry '" + entry.id + "': " + message};
            } else {
                warnings.push_back(message);
            }
        };

        std::error_code ec;
        if (is_skills_kind(entry.kind) && std::filesystem::is_directory(source, ec)) {
            // A source that is itself one skill needs no per-child marker.
            if (std::filesystem::exists(source / SKILL_MARKER, ec)) {
                return warnings;
            }
            auto children = filter_by_prefix(source, entry.include);
            if (!children) return std::unexpected(children.error());

            for (const auto& child : *children) {
                if (!std::filesystem::is_directory(child, ec)) continue;
                if (!std::filesystem::exists(child / SKILL_MARKER, ec)) {
                    violation("Skill '" + child.filename().string() + "' is missing " + SKILL_MARKER);
                    if (failure) return std::unexpected(*failure);
                }
            }
        } else if (entry.kind == AssetKind::CursorHooks) {
            if (!std::filesystem::exists(source / HOOKS_CONFIG, ec)) {
                violation("Hooks source " + source.string() + " is missing " + HOOKS_CONFIG);
                if (failure) return std::unexpected(*failure);
            }
        }
        return warnings;
    }

    std::expected<InstallResult, Error> Installer::install_resolved(const Entry& entry, ResolvedSource resolved,
                                                                    const std::filesystem::path& dest) const {
        std::error_code ec;
        if (!std::filesystem::exists(resolved.source_path, ec)) {
            return std::unexpected(Error{ErrorKind::SourceUnavailable, "Source path not found: " + resolved.source_path.string()});
        }
        const bool source_is_dir = std::filesystem::is_directory(resolved.source_path, ec);
        if (is_single_file_kind(entry.kind) == source_is_dir) {
            return std::unexpected(Error{ErrorKind::SourceUnavailable,
                                         "Kind " + to_string(entry.kind) + " expects a " + (source_is_dir ? "file" : "directory") +
                                         " but found " + resolved.source_path.string()});
        }

        auto checksum = compute_checksum(resolved.source_path);
        if (!checksum) return std::unexpected(checksum.error());
        m_ctx.logger.debug("Source checksum: " + *checksum);

        if (const auto* locked = m_prior.find(entry.id); locked && locked->checksum == *checksum) {
            if (destination_is_current(entry, *locked, resolved, dest)) {
                m_ctx.logger.info("Entry " + entry.id + " is up to date (checksum match)");
                return skipped(entry, dest, resolved.use_symlink);
            }
            m_ctx.logger.info("Entry " + entry.id + " does not match its installed state, reinstalling");
        }

        InstallResult result;
        result.id = entry.id;
        result.dest_path = dest;
        result.was_symlink = resolved.use_symlink;

        const auto conflicts = conflicting_paths(entry, resolved, dest);
        if (!conflicts.empty()) {
            auto backed_up = resolve_conflicts(entry, conflicts, dest);
            if (!backed_up) return std::unexpected(backed_up.error());
            result.backed_up = *backed_up;
        }

        auto warnings = validate_structure(entry, resolved.source_path);
        if (!warnings) return std::unexpected(warnings.error());
        for (const auto& warning : *warnings) {
            m_ctx.logger.warn(warning);
        }
        result.warnings = std::move(*warnings);

        if (m_options.dry_run) {
            m_ctx.logger.info("[dry-run] Would " + std::string(resolved.use_symlink ? "symlink " : "install ") + entry.id + " to " + dest.string());
            return result;
        }

        std::vector<std::string> linked;
        try {
            linked = materialize(entry, resolved, dest);
        } catch (const SyncException& e) {
            return std::unexpected(Error{e.get_error(), e.what()});
        } catch (const std::filesystem::filesystem_error& e) {
            return std::unexpected(Error{ErrorKind::IOFailure, e.what()});
        }

        if (resolved.git_info) {
            result.locked_entry = LockedEntry::for_git(resolved.source_display, lock_dest(dest), resolved.git_info->resolved_ref,
                                                       resolved.git_info->commit, *checksum);
        } else {
            std::optional<std::string> target;
            if (resolved.use_symlink) target = resolved.source_path.string();
            result.locked_entry = LockedEntry::for_filesystem(resolved.source_display, lock_dest(dest), *checksum,
                                                              resolved.use_symlink, target, std::move(linked));
        }
        result.installed = true;

        m_ctx.logger.ok(std::string(resolved.use_symlink ? "Symlinked " : "Installed ") + entry.id + " to " + dest.string());
        return result;
    }

    std::expected<InstallResult, Error> Installer::install_composite(const Entry& entry) const {
        if (entry.sources.empty()) {
            return std::unexpected(Error{ErrorKind::SourceUnavailable, "Composite entry '" + entry.id + "' has no sources"});
        }

        const auto dest = destination_path(entry, m_ctx.base_dir);
        std::vector<std::string> parts;
        std::vector<std::string> displays;

        for (const auto& source : entry.sources) {
            auto resolved = resolve(source, m_ctx);
            if (!resolved) return std::unexpected(resolved.error());

            std::error_code ec;
            if (!std::filesystem::is_regular_file(resolved->source_path, ec)) {
                return std::unexpected(Error{ErrorKind::SourceUnavailable,
                                             "Composite source not found: " + source_display_path(source)});
            }

            std::ifstream in(resolved->source_path, std::ios::binary);
            if (!in.is_open()) {
                return std::unexpected(Error{ErrorKind::IOFailure, "Failed to read " + resolved->source_path.string()});
            }
            std::stringstream buffer;
            buffer << in.rdbuf();

            std::string text = buffer.str();
            text.erase(text.find_last_not_of(" \t\r\n") + 1);
            parts.push_back(std::move(text));
            displays.push_back(source_display_path(source));
        }

        std::string content;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) content += "\n\n";
            content += parts[i];
        }
        content += "\n";

        const auto checksum = checksum_string(content);
        m_ctx.logger.debug("Composite checksum: " + checksum);

        const auto* locked = m_prior.find(entry.id);
        if (locked && locked->checksum == checksum && locked->dest == lock_dest(dest) && occupied_by_file(dest)) {
            m_ctx.logger.info("Entry " + entry.id + " is up to date (checksum match)");
            return skipped(entry, dest, false);
        }

        InstallResult result;
        result.id = entry.id;
        result.dest_path = dest;

        if (has_conflict(dest)) {
            auto backed_up = resolve_conflicts(entry, {dest}, dest);
            if (!backed_up) return std::unexpected(backed_up.error());
            result.backed_up = *backed_up;
        }

        if (m_options.dry_run) {
            m_ctx.logger.info("[dry-run] Would write " + entry.id + " from " + std::to_string(parts.size()) + " sources to " + dest.string());
            return result;
        }

        try {
            write_text_file(dest, content);
        } catch (const SyncException& e) {
            return std::unexpected(Error{e.get_error(), e.what()});
        }

        result.locked_entry = LockedEntry::for_composite(std::move(displays), lock_dest(dest), checksum);
        result.installed = true;
        m_ctx.logger.ok("Composed " + entry.id + " from " + std::to_string(parts.size()) + " sources to " + dest.string());
        return result;
    }

}
