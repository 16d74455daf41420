//
// Created by cv2 on 10/19/26.
//

#include "libaps/source.h"
#include "libaps/fs_utils.h"

namespace aps {

    static std::filesystem::path join_sub_path(const std::filesystem::path& root, const std::optional<std::string>& sub_path) {
        if (!sub_path || *sub_path == "." || sub_path->empty()) {
            return root;
        }
        return root / fs::expand_path(*sub_path);
    }

    static ResolvedSource from_clone(const GitSource& source, git::Clone clone) {
        ResolvedSource resolved;
        resolved.source_path = join_sub_path(clone.repo_path, source.path);
        resolved.source_display = source_display_name(Source{source});
        resolved.use_symlink = false; // the clone is temporary
        resolved.git_info = GitInfo{clone.resolved_ref, clone.commit};
        resolved.clone_dir = std::move(clone.dir);
        return resolved;
    }

    static std::expected<ResolvedSource, Error> resolve_filesystem(const FilesystemSource& source, const RunContext& ctx) {
        std::filesystem::path root = fs::expand_path(source.root);
        if (root.is_relative()) {
            root = ctx.base_dir / root;
        }

        ResolvedSource resolved;
        resolved.source_path = std::filesystem::absolute(join_sub_path(root, source.path)).lexically_normal();
        resolved.source_path = fs::strip_trailing_separators(resolved.source_path);
        resolved.source_display = source_display_name(Source{source});
        resolved.use_symlink = source.symlink;
        return resolved;
    }

    std::expected<ResolvedSource, Error> resolve(const Source& source, const RunContext& ctx) {
        if (const auto* fs_source = std::get_if<FilesystemSource>(&source)) {
            return resolve_filesystem(*fs_source, ctx);
        }

        const auto& git_source = std::get<GitSource>(source);
        auto clone = git::clone_and_resolve(git_source.repo, git_source.ref, git_source.shallow, ctx.logger);
        if (!clone) return std::unexpected(clone.error());
        return from_clone(git_source, std::move(*clone));
    }

    std::expected<ResolvedSource, Error> resolve_at_commit(const GitSource& source, const std::string& commit,
                                                           const std::string& resolved_ref, const RunContext& ctx) {
        auto clone = git::clone_at_commit(source.repo, commit, resolved_ref, ctx.logger);
        if (!clone) return std::unexpected(clone.error());
        return from_clone(source, std::move(*clone));
    }

}
